#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

// Include the engine public API header for bindings.
#include "paintcore/engine.h"
#include "paintcore/core/color.h"

#include <cmath>
#include <string>
#include <vector>

#ifdef EMSCRIPTEN
namespace {

// Pointer/length pair into WASM linear memory, used for pixel, snapshot and brush buffers.
struct ByteBufferMeta {
    std::uint32_t byteCount;
    std::uintptr_t ptr;
};

PointerSample makeSample(float x, float y, float pressure, float tiltX, float tiltY, double timestamp) {
    PointerSample s{};
    s.x = x;
    s.y = y;
    s.pressure = pressure;
    s.tiltX = tiltX;
    s.tiltY = tiltY;
    s.timestamp = timestamp > 0.0 ? static_cast<std::uint64_t>(timestamp) : 0;
    // NaN marks a device without pressure; any other value is clamped later.
    s.hasPressure = !std::isnan(pressure);
    return s;
}

ByteBufferMeta metaOf(const std::vector<std::uint8_t>& bytes) {
    if (bytes.empty()) return ByteBufferMeta{0, 0};
    return ByteBufferMeta{static_cast<std::uint32_t>(bytes.size()), reinterpret_cast<std::uintptr_t>(bytes.data())};
}

// Engine exposed to JS. Each instance owns the buffers it hands out, and a
// buffer stays valid until the next call of the same kind on that instance.
class HostPaintEngine : public PaintEngine {
public:
    RasterImage frame;
    RasterImage exported;
    std::vector<std::uint8_t> snapshot;
    std::vector<std::uint8_t> brush;
};

} // namespace

EMSCRIPTEN_BINDINGS(paintcore_module) {
    emscripten::enum_<EngineError>("EngineError")
        .value("Ok", EngineError::Ok)
        .value("InvalidMagic", EngineError::InvalidMagic)
        .value("UnsupportedVersion", EngineError::UnsupportedVersion)
        .value("BufferTruncated", EngineError::BufferTruncated)
        .value("InvalidPayloadSize", EngineError::InvalidPayloadSize)
        .value("InvalidArgument", EngineError::InvalidArgument)
        .value("LayerLocked", EngineError::LayerLocked)
        .value("LayerNotFound", EngineError::LayerNotFound)
        .value("LastLayer", EngineError::LastLayer)
        .value("InvalidPermutation", EngineError::InvalidPermutation)
        .value("InvalidBrush", EngineError::InvalidBrush)
        .value("ExportFailed", EngineError::ExportFailed)
        .value("NoActiveStroke", EngineError::NoActiveStroke)
        .value("StorageFailed", EngineError::StorageFailed);

    emscripten::enum_<BlendMode>("BlendMode")
        .value("Normal", BlendMode::Normal)
        .value("Multiply", BlendMode::Multiply)
        .value("Screen", BlendMode::Screen)
        .value("Overlay", BlendMode::Overlay)
        .value("Darken", BlendMode::Darken)
        .value("Lighten", BlendMode::Lighten)
        .value("ColorDodge", BlendMode::ColorDodge)
        .value("ColorBurn", BlendMode::ColorBurn)
        .value("HardLight", BlendMode::HardLight)
        .value("SoftLight", BlendMode::SoftLight);

    emscripten::enum_<PixelFormat>("PixelFormat")
        .value("Rgba8", PixelFormat::Rgba8)
        .value("Bgra8", PixelFormat::Bgra8)
        .value("PremultipliedRgba8", PixelFormat::PremultipliedRgba8);

    emscripten::class_<PaintEngine>("PaintEngineBase")
        .function("startStroke", emscripten::optional_override([](PaintEngine& self, float x, float y, float pressure, float tiltX, float tiltY, double t) {
            return self.startStroke(makeSample(x, y, pressure, tiltX, tiltY, t));
        }))
        .function("addPoint", emscripten::optional_override([](PaintEngine& self, float x, float y, float pressure, float tiltX, float tiltY, double t) {
            return self.addPoint(makeSample(x, y, pressure, tiltX, tiltY, t));
        }))
        .function("endStroke", &PaintEngine::endStroke)
        .function("abortStroke", &PaintEngine::abortStroke)
        .function("isStrokeActive", &PaintEngine::isStrokeActive)
        .function("setBrush", &PaintEngine::setBrush)
        .function("setColorHex", &PaintEngine::setColorHex)
        .function("setColor", emscripten::optional_override([](PaintEngine& self, float r, float g, float b, float a) {
            self.setColor(ColorRGBA{r, g, b, a});
        }))
        .function("addLayer", emscripten::optional_override([](PaintEngine& self, const std::string& name) {
            return self.addLayer(name).id;
        }))
        .function("deleteLayer", &PaintEngine::deleteLayer)
        .function("setActiveLayer", &PaintEngine::setActiveLayer)
        .function("setLayerOpacity", emscripten::optional_override([](PaintEngine& self, std::uint32_t id, float opacity) {
            LayerProps props{};
            props.mask = static_cast<std::uint32_t>(LayerPropMask::Opacity);
            props.opacity = opacity;
            return self.updateLayerProperties(id, props);
        }))
        .function("setLayerVisible", emscripten::optional_override([](PaintEngine& self, std::uint32_t id, bool visible) {
            LayerProps props{};
            props.mask = static_cast<std::uint32_t>(LayerPropMask::Visible);
            props.visible = visible;
            return self.updateLayerProperties(id, props);
        }))
        .function("setLayerLocked", emscripten::optional_override([](PaintEngine& self, std::uint32_t id, bool locked) {
            LayerProps props{};
            props.mask = static_cast<std::uint32_t>(LayerPropMask::Locked);
            props.locked = locked;
            return self.updateLayerProperties(id, props);
        }))
        .function("setLayerBlendMode", emscripten::optional_override([](PaintEngine& self, std::uint32_t id, BlendMode mode) {
            LayerProps props{};
            props.mask = static_cast<std::uint32_t>(LayerPropMask::BlendMode);
            props.blendMode = mode;
            return self.updateLayerProperties(id, props);
        }))
        .function("clearLayer", &PaintEngine::clearLayer)
        .function("clear", &PaintEngine::clear)
        .function("undo", &PaintEngine::undo)
        .function("redo", &PaintEngine::redo)
        .function("canUndo", &PaintEngine::canUndo)
        .function("canRedo", &PaintEngine::canRedo)
        .function("setZoom", &PaintEngine::setZoom)
        .function("setPan", &PaintEngine::setPan)
        .function("setRotation", &PaintEngine::setRotation)
        .function("recordFrame", &PaintEngine::recordFrame)
        .function("getQualityLevel", emscripten::optional_override([](const PaintEngine& self) {
            return self.getQualityKnobs().level;
        }))
        .function("getDocumentDigest", &PaintEngine::getDocumentDigest)
        .function("getLastError", &PaintEngine::getLastError)
        .function("loadSnapshotFromPtr", emscripten::optional_override([](PaintEngine& self, std::uintptr_t ptr, std::uint32_t byteCount) {
            return self.loadSnapshot(reinterpret_cast<const std::uint8_t*>(ptr), byteCount);
        }))
        .function("importBrushFromPtr", emscripten::optional_override([](PaintEngine& self, std::uintptr_t ptr, std::uint32_t byteCount) {
            std::string id;
            const EngineError err = self.importBrush(reinterpret_cast<const std::uint8_t*>(ptr), byteCount, id);
            return err == EngineError::Ok ? id : std::string();
        }))
        .function("pickColor", emscripten::optional_override([](const PaintEngine& self, float x, float y) {
            ColorRGBA color{0.0f, 0.0f, 0.0f, 0.0f};
            if (self.pickColor(x, y, color) != EngineError::Ok) return std::string();
            return paintcore::toHexString(color, true);
        }))
        .function("getRecentColors", emscripten::optional_override([](const PaintEngine& self) {
            emscripten::val out = emscripten::val::array();
            for (const auto& c : self.getRecentColors()) out.call<void>("push", paintcore::toHexString(c, true));
            return out;
        }))
        .function("clearRecentColors", &PaintEngine::clearRecentColors);

    emscripten::class_<HostPaintEngine, emscripten::base<PaintEngine>>("PaintEngine")
        .constructor<>()
        .function("renderFrame", emscripten::optional_override([](HostPaintEngine& self, std::uint32_t width, std::uint32_t height) {
            self.frame.width = width;
            self.frame.height = height;
            self.frame.format = PixelFormat::Rgba8;
            if (self.render(self.frame) != EngineError::Ok) return ByteBufferMeta{0, 0};
            return metaOf(self.frame.pixels);
        }))
        .function("exportImage", emscripten::optional_override([](HostPaintEngine& self, PixelFormat format, float quality) {
            if (self.exportImage(format, quality, self.exported) != EngineError::Ok) return ByteBufferMeta{0, 0};
            return metaOf(self.exported.pixels);
        }))
        .function("saveSnapshot", emscripten::optional_override([](HostPaintEngine& self) {
            self.snapshot = self.saveSnapshot();
            return metaOf(self.snapshot);
        }))
        .function("exportBrush", emscripten::optional_override([](HostPaintEngine& self, const std::string& brushId) {
            self.brush = self.exportBrush(brushId);
            return metaOf(self.brush);
        }));

    emscripten::value_object<PaintEngine::DocumentDigest>("DocumentDigest")
        .field("lo", &PaintEngine::DocumentDigest::lo)
        .field("hi", &PaintEngine::DocumentDigest::hi);

    emscripten::value_object<ByteBufferMeta>("ByteBufferMeta")
        .field("byteCount", &ByteBufferMeta::byteCount)
        .field("ptr", &ByteBufferMeta::ptr);
}
#endif
