// paintcore.cpp holds the PaintEngine constructor, brush/color, view and
// performance plumbing. Larger method groups live in paintcore/impl/.
#include "paintcore/engine.h"
#include "paintcore/core/color.h"
#include "paintcore/core/logging.h"
#include "paintcore/core/numeric.h"
#include "paintcore/internal/engine_state.h"
#include "paintcore/persistence/snapshot.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace {

EngineConfig sanitizeConfig(const EngineConfig& in) {
    EngineConfig cfg = in;
    if (cfg.width == 0) cfg.width = kDefaultCanvasWidth;
    if (cfg.height == 0) cfg.height = kDefaultCanvasHeight;
    if (cfg.historyCapacity == 0) cfg.historyCapacity = kHistoryCapacity;
    if (!std::isfinite(cfg.strokeSimplifyTolerance) || cfg.strokeSimplifyTolerance < 0.0f) {
        cfg.strokeSimplifyTolerance = 0.0f;
    }
    cfg.background = paintcore::sanitizeColor(cfg.background);
    return cfg;
}

} // namespace

EngineState::EngineState(const EngineConfig& cfg)
    : config(sanitizeConfig(cfg)),
      layerStore(),
      historyManager(layerStore, config.historyCapacity),
      brushLibrary(),
      capture(),
      quality(config.quality),
      events(),
      activeBrush(paintcore::makeDefaultBrush()) {}

PaintEngine::PaintEngine(const EngineConfig& config)
    : state_(std::make_unique<EngineState>(config)) {}

PaintEngine::~PaintEngine() = default;

// ---- errors ----

void PaintEngine::clearError() const {
    state().lastError = EngineError::Ok;
}

void PaintEngine::setError(EngineError err) const {
    state().lastError = err;
}

EngineError PaintEngine::fail(EngineError err) const {
    setError(err);
    return err;
}

EngineError PaintEngine::getLastError() const noexcept {
    return state().lastError;
}

const EngineConfig& PaintEngine::config() const noexcept {
    return state().config;
}

// ---- brush & color ----

EngineError PaintEngine::setBrush(const std::string& brushId) {
    clearError();
    auto& s = state();
    const Brush* brush = s.brushLibrary.find(brushId);
    if (!brush) {
        PAINTCORE_LOG_WARN("unknown brush '%s', keeping '%s'", brushId.c_str(), s.activeBrush.id.c_str());
        emitEvent(EventType::BrushFallback, 0, 0, 0, static_cast<std::uint16_t>(EventFlags::Warning));
        return fail(EngineError::InvalidBrush);
    }
    s.activeBrush = *brush;
    return EngineError::Ok;
}

const Brush& PaintEngine::getBrush() const noexcept {
    return state().activeBrush;
}

BrushLibrary& PaintEngine::brushLibrary() noexcept {
    return state().brushLibrary;
}

const BrushLibrary& PaintEngine::brushLibrary() const noexcept {
    return state().brushLibrary;
}

void PaintEngine::applyColor(const ColorRGBA& color) {
    auto& s = state();
    if (paintcore::toHexString(color, true) != paintcore::toHexString(s.color, true)) {
        s.recentColors.push(color);
    }
    s.color = color;
}

void PaintEngine::setColor(const ColorRGBA& color) {
    applyColor(paintcore::sanitizeColor(color));
}

EngineError PaintEngine::setColorHex(const std::string& hex) {
    clearError();
    ColorRGBA color{};
    if (!paintcore::parseHexColor(hex, color)) return fail(EngineError::InvalidArgument);
    applyColor(color);
    return EngineError::Ok;
}

ColorRGBA PaintEngine::getColor() const noexcept {
    return state().color;
}

const std::vector<ColorRGBA>& PaintEngine::getRecentColors() const noexcept {
    return state().recentColors.items();
}

void PaintEngine::clearRecentColors() {
    state().recentColors.clear();
}

std::vector<std::uint8_t> PaintEngine::exportBrush(const std::string& brushId) const {
    clearError();
    const Brush* brush = state().brushLibrary.find(brushId);
    if (!brush) {
        setError(EngineError::InvalidBrush);
        return {};
    }
    return paintcore::buildBrushBytes(*brush);
}

EngineError PaintEngine::importBrush(const std::uint8_t* bytes, std::size_t byteCount, std::string& outId) {
    clearError();
    Brush brush;
    const EngineError parsed = paintcore::parseBrushBytes(bytes, byteCount, brush);
    if (parsed != EngineError::Ok) {
        PAINTCORE_LOG_WARN("importBrush: %s", engineErrorName(parsed));
        return fail(parsed);
    }
    EngineError err = EngineError::Ok;
    const std::string id = state().brushLibrary.importBrush(std::move(brush), err);
    if (err != EngineError::Ok) return fail(err);
    outId = id;
    return EngineError::Ok;
}

// ---- view ----

void PaintEngine::setZoom(float zoom) {
    clearError();
    if (!std::isfinite(zoom)) {
        setError(EngineError::InvalidArgument);
        return;
    }
    state().view.zoom = std::max(kMinZoom, std::min(kMaxZoom, zoom));
    emitEvent(EventType::ViewChanged);
}

void PaintEngine::setPan(float x, float y) {
    clearError();
    if (!std::isfinite(x) || !std::isfinite(y)) {
        setError(EngineError::InvalidArgument);
        return;
    }
    state().view.panX = x;
    state().view.panY = y;
    emitEvent(EventType::ViewChanged);
}

void PaintEngine::setRotation(float degrees) {
    clearError();
    if (!std::isfinite(degrees)) {
        setError(EngineError::InvalidArgument);
        return;
    }
    float r = std::fmod(degrees, 360.0f);
    if (r < 0.0f) r += 360.0f;
    if (r >= 360.0f) r = 0.0f;
    state().view.rotation = r;
    emitEvent(EventType::ViewChanged);
}

// ---- adaptive performance ----

bool PaintEngine::recordFrame(float frameMs) {
    auto& s = state();
    const int previous = s.quality.level();
    if (!s.quality.recordFrame(frameMs)) return false;
    applyQualityKnobs();
    emitEvent(EventType::QualityChanged,
        static_cast<std::uint32_t>(s.quality.level()), static_cast<std::uint32_t>(previous));
    return true;
}

void PaintEngine::recordInputLatency(float latencyMs) {
    state().quality.recordInputLatency(latencyMs);
}

void PaintEngine::applyQualityKnobs() {
    auto& s = state();
    const QualityKnobs knobs = s.quality.knobs();
    s.capture.setPredictive(s.config.predictiveStroke && knobs.predictiveStroke);
    s.capture.setSpacingQuantum(knobs.spacingQuantum);
}

QualityKnobs PaintEngine::getQualityKnobs() const noexcept {
    return state().quality.knobs();
}

PerformanceMetrics PaintEngine::getPerformanceMetrics() const {
    return state().quality.metrics();
}

// ---- state projection ----

LayerInfo PaintEngine::makeLayerInfo(const Layer& layer) {
    return LayerInfo{
        layer.id,
        layer.name,
        layer.kind,
        layer.opacity,
        layer.blendMode,
        layer.visible,
        layer.locked,
        layer.order,
        layer.stats.strokeCount,
        layer.stats.pointCount
    };
}

CanvasStateView PaintEngine::getState() const {
    const auto& s = state();
    CanvasStateView view{};
    view.width = s.config.width;
    view.height = s.config.height;
    view.background = s.config.background;
    view.view = s.view;
    view.activeLayerId = s.layerStore.activeLayerId();
    view.layers.reserve(s.layerStore.size());
    for (const auto& layer : s.layerStore.layers()) {
        view.layers.push_back(makeLayerInfo(layer));
    }
    view.brushId = s.activeBrush.id;
    view.color = s.color;
    view.strokeActive = s.capture.active();
    view.canUndo = s.historyManager.canUndo();
    view.canRedo = s.historyManager.canRedo();
    view.qualityLevel = s.quality.level();
    return view;
}

std::vector<StrokePtr> PaintEngine::getLayerStrokes(std::uint32_t layerId) const {
    clearError();
    const Layer* layer = state().layerStore.find(layerId);
    if (!layer) {
        setError(EngineError::LayerNotFound);
        return {};
    }
    return layer->strokes;
}
