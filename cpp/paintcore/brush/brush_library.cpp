#include "paintcore/brush/brush_library.h"
#include "paintcore/core/logging.h"

#include <utility>

namespace {

Brush makeBrush(const char* id, const char* name, BrushCategory category, const BrushSettings& settings,
                std::vector<float> curve, bool tilt) {
    Brush b;
    b.id = id;
    b.name = name;
    b.category = category;
    b.settings = settings;
    b.pressureCurve = std::move(curve);
    b.tiltSupport = tilt;
    b.customizable = false;
    return b;
}

Brush pencil(const char* id, const char* name, float hardness, float opacity) {
    return makeBrush(id, name, BrushCategory::Pencil,
        BrushSettings{3.0f, 0.5f, 20.0f, 0.9f, opacity, 1.0f, hardness, 0.05f, 0.5f, 0.0f, 0.2f},
        {0.0f, 0.1f, 0.9f, 1.0f}, true);
}

Brush ink(const char* id, const char* name, float size, float opacity) {
    return makeBrush(id, name, BrushCategory::Ink,
        BrushSettings{size, 0.5f, 30.0f, 0.7f, opacity, 1.0f, 1.0f, 0.02f, 0.3f, 0.0f, 0.4f},
        {0.0f, 0.3f, 0.7f, 1.0f}, false);
}

Brush paint(const char* id, const char* name, BrushCategory category, float size, float opacity) {
    return makeBrush(id, name, category,
        BrushSettings{size, 2.0f, 100.0f, 0.8f, opacity, 0.8f, 0.3f, 0.1f, 0.7f, 0.1f, 0.3f},
        {0.0f, 0.2f, 0.8f, 1.0f}, true);
}

} // namespace

namespace paintcore {

Brush makeDefaultBrush() {
    return makeBrush(BrushLibrary::kDefaultBrushId, "Pencil", BrushCategory::Pencil,
        BrushSettings{4.0f, 2.0f, 10.0f, 0.8f, 1.0f, 0.9f, 0.8f, 0.1f, 0.5f, 0.0f, 0.0f},
        {}, true);
}

} // namespace paintcore

BrushLibrary::BrushLibrary() {
    addBuiltin(paintcore::makeDefaultBrush());

    addBuiltin(pencil("pencil-hb", "HB Pencil", 0.4f, 0.9f));
    addBuiltin(pencil("pencil-2b", "2B Pencil", 0.6f, 0.8f));
    addBuiltin(pencil("pencil-4b", "4B Pencil", 0.8f, 0.7f));
    addBuiltin(pencil("pencil-6b", "6B Pencil", 1.0f, 0.6f));

    addBuiltin(ink("ink-pen", "Ink Pen", 2.0f, 1.0f));
    addBuiltin(ink("technical-pen", "Technical Pen", 1.0f, 1.0f));
    addBuiltin(ink("brush-pen", "Brush Pen", 4.0f, 0.9f));

    addBuiltin(paint("watercolor", "Watercolor", BrushCategory::Watercolor, 15.0f, 0.6f));
    addBuiltin(paint("oil-paint", "Oil Paint", BrushCategory::Paint, 10.0f, 0.9f));
    addBuiltin(paint("acrylic", "Acrylic", BrushCategory::Paint, 8.0f, 0.95f));

    addBuiltin(makeBrush("airbrush", "Airbrush", BrushCategory::Airbrush,
        BrushSettings{20.0f, 5.0f, 200.0f, 0.9f, 0.3f, 0.5f, 0.1f, 0.05f, 0.9f, 0.2f, 0.1f},
        {0.0f, 0.2f, 0.8f, 1.0f}, true));
    addBuiltin(makeBrush("marker", "Marker", BrushCategory::Marker,
        BrushSettings{5.0f, 2.0f, 50.0f, 0.4f, 0.8f, 1.0f, 0.7f, 0.03f, 0.4f, 0.0f, 0.2f},
        {0.0f, 0.5f, 0.5f, 1.0f}, true));
    addBuiltin(makeBrush("chalk", "Chalk", BrushCategory::Texture,
        BrushSettings{8.0f, 3.0f, 60.0f, 0.6f, 0.7f, 1.0f, 0.2f, 0.08f, 0.3f, 0.05f, 0.1f},
        {0.0f, 0.3f, 0.7f, 1.0f}, true));
    addBuiltin(makeBrush("charcoal", "Charcoal", BrushCategory::Texture,
        BrushSettings{12.0f, 4.0f, 80.0f, 0.8f, 0.6f, 0.9f, 0.1f, 0.06f, 0.4f, 0.08f, 0.2f},
        {0.0f, 0.2f, 0.8f, 1.0f}, true));
    addBuiltin(makeBrush("eraser", "Eraser", BrushCategory::Eraser,
        BrushSettings{10.0f, 1.0f, 100.0f, 0.7f, 1.0f, 1.0f, 0.8f, 0.03f, 0.5f, 0.0f, 0.1f},
        {0.0f, 0.3f, 0.7f, 1.0f}, false));
}

void BrushLibrary::addBuiltin(Brush brush) {
    builtins_.push_back(std::move(brush));
}

const Brush* BrushLibrary::find(const std::string& id) const {
    for (const auto& b : builtins_) {
        if (b.id == id) return &b;
    }
    auto it = custom_.find(id);
    if (it == custom_.end()) return nullptr;
    return &it->second;
}

std::vector<Brush> BrushLibrary::all() const {
    std::vector<Brush> out(builtins_);
    out.reserve(builtins_.size() + custom_.size());
    for (const auto& kv : custom_) out.push_back(kv.second);
    return out;
}

std::vector<Brush> BrushLibrary::byCategory(BrushCategory category) const {
    std::vector<Brush> out;
    for (const auto& b : all()) {
        if (b.category == category) out.push_back(b);
    }
    return out;
}

std::string BrushLibrary::createCustomBrush(const std::string& baseId, const std::string& name, const BrushSettings& settings, EngineError& err) {
    const Brush* base = find(baseId);
    if (!base || !paintcore::validateBrushSettings(settings)) {
        PAINTCORE_LOG_WARN("createCustomBrush rejected (base=%s)", baseId.c_str());
        err = EngineError::InvalidBrush;
        return std::string();
    }

    Brush brush = *base;
    brush.id = "custom-" + std::to_string(nextCustomId_++);
    brush.name = name.empty() ? base->name + " (Custom)" : name;
    brush.settings = settings;
    brush.customizable = true;

    const std::string id = brush.id;
    custom_.emplace(id, std::move(brush));
    err = EngineError::Ok;
    return id;
}

EngineError BrushLibrary::updateBrushSettings(const std::string& id, const BrushSettings& settings) {
    auto it = custom_.find(id);
    if (it == custom_.end() || !it->second.customizable) return EngineError::InvalidBrush;
    if (!paintcore::validateBrushSettings(settings)) return EngineError::InvalidArgument;
    it->second.settings = settings;
    return EngineError::Ok;
}

EngineError BrushLibrary::deleteCustomBrush(const std::string& id) {
    if (custom_.erase(id) == 0) return EngineError::InvalidBrush;
    return EngineError::Ok;
}

std::string BrushLibrary::importBrush(Brush brush, EngineError& err) {
    if (!paintcore::validateBrush(brush)) {
        PAINTCORE_LOG_WARN("importBrush rejected (id=%s)", brush.id.c_str());
        err = EngineError::InvalidBrush;
        return std::string();
    }

    brush.id = "imported-" + std::to_string(nextImportedId_++);
    brush.name += " (Imported)";
    brush.customizable = true;

    const std::string id = brush.id;
    custom_.emplace(id, std::move(brush));
    err = EngineError::Ok;
    return id;
}
