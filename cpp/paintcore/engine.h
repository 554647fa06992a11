#pragma once

#include "paintcore/core/types.h"
#include "paintcore/brush/brush.h"
#include "paintcore/brush/brush_library.h"
#include "paintcore/history/history_types.h"
#include "paintcore/layer/layer_store.h"
#include "paintcore/perf/quality_controller.h"
#include "paintcore/persistence/blob_store.h"
#include "paintcore/protocol/events.h"
#include "paintcore/render/canvas_snapshot.h"
#include "paintcore/render/raster_image.h"
#include "paintcore/stroke/stroke_capture.h"

#include <cstdint>
#include <future>
#include <memory>
#include <string>
#include <vector>

struct EngineState;

struct EngineConfig {
    std::uint32_t width{kDefaultCanvasWidth};
    std::uint32_t height{kDefaultCanvasHeight};
    ColorRGBA background{1.0f, 1.0f, 1.0f, 1.0f};
    std::size_t historyCapacity{kHistoryCapacity};
    bool predictiveStroke{true};
    float strokeSimplifyTolerance{0.0f}; // 0 keeps every sample
    std::uint64_t maxExportPixels{kDefaultMaxExportPixels};
    std::uint64_t seedSalt{0};
    QualityControllerConfig quality{};
};

// Read projection of a layer; strokes are fetched separately.
struct LayerInfo {
    std::uint32_t id;
    std::string name;
    LayerKind kind;
    float opacity;
    BlendMode blendMode;
    bool visible;
    bool locked;
    std::uint32_t order;
    std::uint32_t strokeCount;
    std::uint64_t pointCount;
};

struct CanvasStateView {
    std::uint32_t width;
    std::uint32_t height;
    ColorRGBA background;
    ViewState view;
    std::uint32_t activeLayerId;
    std::vector<LayerInfo> layers; // paint order, bottom first
    std::string brushId;
    ColorRGBA color;
    bool strokeActive;
    bool canUndo;
    bool canRedo;
    int qualityLevel;
};

struct ExportResult {
    EngineError error;
    RasterImage image;
};

// One engine per canvas. All mutating calls must come from a single thread;
// captured snapshots may be rendered anywhere.
class PaintEngine {
    friend class PaintEngineTestAccessor;
public:
    struct DocumentDigest {
        std::uint32_t lo;
        std::uint32_t hi;
    };

    struct HistoryMeta {
        std::uint32_t depth;
        std::uint32_t cursor;
        std::uint32_t generation;
    };

    explicit PaintEngine(const EngineConfig& config = EngineConfig{});
    ~PaintEngine();

    PaintEngine(const PaintEngine&) = delete;
    PaintEngine& operator=(const PaintEngine&) = delete;

    // Stroke capture
    EngineError startStroke(const PointerSample& sample);
    EngineError addPoint(const PointerSample& sample);
    EngineError endStroke();
    void abortStroke();
    bool isStrokeActive() const noexcept;
    paintcore::StampBatch takeStampBatch();

    // Brush & color
    EngineError setBrush(const std::string& brushId);
    const Brush& getBrush() const noexcept;
    BrushLibrary& brushLibrary() noexcept;
    const BrushLibrary& brushLibrary() const noexcept;
    void setColor(const ColorRGBA& color);
    EngineError setColorHex(const std::string& hex);
    ColorRGBA getColor() const noexcept;
    const std::vector<ColorRGBA>& getRecentColors() const noexcept;
    void clearRecentColors();

    // Brush presets travel as PCBR blobs. exportBrush returns an empty
    // buffer (InvalidBrush) for unknown ids.
    std::vector<std::uint8_t> exportBrush(const std::string& brushId) const;
    EngineError importBrush(const std::uint8_t* bytes, std::size_t byteCount, std::string& outId);

    // Layers
    LayerInfo addLayer(const std::string& name = std::string());
    EngineError deleteLayer(std::uint32_t layerId);
    EngineError setActiveLayer(std::uint32_t layerId);
    EngineError updateLayerProperties(std::uint32_t layerId, const LayerProps& props);
    EngineError reorderLayers(const std::vector<std::uint32_t>& bottomToTop);
    EngineError clearLayer(std::uint32_t layerId);
    EngineError clear(); // clears the active layer

    // History
    bool undo();
    bool redo();
    bool canUndo() const noexcept;
    bool canRedo() const noexcept;
    HistoryMeta getHistoryMeta() const noexcept;

    // View
    void setZoom(float zoom);
    void setPan(float x, float y);
    void setRotation(float degrees);

    // State
    CanvasStateView getState() const;
    std::vector<StrokePtr> getLayerStrokes(std::uint32_t layerId) const;
    DocumentDigest getDocumentDigest() const noexcept;
    CanvasSnapshotPtr captureSnapshot(bool includePreview = true) const;

    // Render & export. A 0x0 target renders at canvas size.
    EngineError render(RasterImage& target);
    EngineError exportImage(PixelFormat format, float quality, RasterImage& out);
    std::future<ExportResult> exportImageAsync(PixelFormat format, float quality) const;
    // Eyedropper: flattened committed color at canvas position (x, y).
    EngineError pickColor(float x, float y, ColorRGBA& out) const;

    // Adaptive performance
    bool recordFrame(float frameMs);
    void recordInputLatency(float latencyMs);
    QualityKnobs getQualityKnobs() const noexcept;
    PerformanceMetrics getPerformanceMetrics() const;

    // Persistence
    std::vector<std::uint8_t> saveSnapshot() const;
    EngineError loadSnapshot(const std::uint8_t* bytes, std::size_t byteCount);
    EngineError persistTo(paintcore::BlobStore& store, const std::string& key) const;
    EngineError restoreFrom(const paintcore::BlobStore& store, const std::string& key);

    // Events
    ListenerId subscribe(EventListener listener);
    bool unsubscribe(ListenerId id);

    EngineError getLastError() const noexcept;
    const EngineConfig& config() const noexcept;

private:
    EngineState& state() noexcept { return *state_; }
    const EngineState& state() const noexcept { return *state_; }

    void clearError() const;
    void setError(EngineError err) const;
    EngineError fail(EngineError err) const;

    void emitEvent(EventType type, std::uint32_t a = 0, std::uint32_t b = 0, std::uint32_t c = 0, std::uint16_t flags = 0);
    void pushHistory(HistoryEntry&& entry);
    void applyQualityKnobs();
    void applyColor(const ColorRGBA& color);
    void abortInFlight();
    static LayerInfo makeLayerInfo(const Layer& layer);

    std::unique_ptr<EngineState> state_;
};
