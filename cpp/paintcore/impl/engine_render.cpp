// PaintEngine render and export methods

#include "paintcore/engine.h"
#include "paintcore/core/logging.h"
#include "paintcore/core/util.h"
#include "paintcore/internal/engine_state.h"
#include "paintcore/render/compositor.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace {

bool validExportQuality(float quality) {
    return std::isfinite(quality) && quality > 0.0f && quality <= 1.0f;
}

paintcore::RenderRequest makeExportRequest(const CanvasSnapshot& snapshot, PixelFormat format, float quality,
                                           std::uint64_t maxPixels) {
    paintcore::RenderRequest req;
    req.width = std::max<std::uint32_t>(1, static_cast<std::uint32_t>(std::lround(snapshot.width * quality)));
    req.height = std::max<std::uint32_t>(1, static_cast<std::uint32_t>(std::lround(snapshot.height * quality)));
    req.format = format;
    req.applyView = false;
    req.contentScale = quality;
    req.resolutionScale = 1.0f;
    req.spacingQuantum = 0.0f;
    req.includePreview = false;
    req.maxPixels = maxPixels;
    return req;
}

} // namespace

CanvasSnapshotPtr PaintEngine::captureSnapshot(bool includePreview) const {
    const auto& s = state();
    auto snap = std::make_shared<CanvasSnapshot>();
    snap->width = s.config.width;
    snap->height = s.config.height;
    snap->background = s.config.background;
    snap->view = s.view;
    snap->layers = s.layerStore.layers();
    snap->activeLayerId = s.layerStore.activeLayerId();
    if (includePreview && s.capture.active()) snap->preview = s.capture.previewStroke();
    return snap;
}

EngineError PaintEngine::render(RasterImage& target) {
    clearError();
    auto& s = state();
    const double t0 = paintcore::nowMs();

    const CanvasSnapshotPtr snap = captureSnapshot(true);
    const QualityKnobs knobs = s.quality.knobs();

    paintcore::RenderRequest req;
    req.width = target.width == 0 ? s.config.width : target.width;
    req.height = target.height == 0 ? s.config.height : target.height;
    req.format = target.format;
    req.applyView = true;
    req.contentScale = 1.0f;
    req.resolutionScale = knobs.resolutionScale;
    req.spacingQuantum = knobs.spacingQuantum;
    req.includePreview = true;
    req.maxPixels = s.config.maxExportPixels;

    paintcore::RenderStats stats;
    const EngineError err = paintcore::renderSnapshot(*snap, req, target, &stats);
    if (err != EngineError::Ok) return fail(err);

    s.quality.recordRenderTime(static_cast<float>(paintcore::nowMs() - t0), stats.drawCalls);
    return EngineError::Ok;
}

EngineError PaintEngine::exportImage(PixelFormat format, float quality, RasterImage& out) {
    clearError();
    if (!validExportQuality(quality)) return fail(EngineError::InvalidArgument);

    const CanvasSnapshotPtr snap = captureSnapshot(false);
    const paintcore::RenderRequest req = makeExportRequest(*snap, format, quality, state().config.maxExportPixels);

    RasterImage image;
    const EngineError err = paintcore::renderSnapshot(*snap, req, image);
    if (err != EngineError::Ok) {
        PAINTCORE_LOG_WARN("export %ux%u failed: %s", req.width, req.height, engineErrorName(err));
        return fail(err);
    }
    out = std::move(image);
    emitEvent(EventType::ExportCompleted, out.width, out.height, static_cast<std::uint32_t>(format));
    return EngineError::Ok;
}

std::future<ExportResult> PaintEngine::exportImageAsync(PixelFormat format, float quality) const {
    clearError();
    if (!validExportQuality(quality)) {
        setError(EngineError::InvalidArgument);
        std::promise<ExportResult> rejected;
        rejected.set_value(ExportResult{EngineError::InvalidArgument, RasterImage{}});
        return rejected.get_future();
    }

    CanvasSnapshotPtr snap = captureSnapshot(false);
    const paintcore::RenderRequest req = makeExportRequest(*snap, format, quality, state().config.maxExportPixels);
    return std::async(std::launch::async, [snap = std::move(snap), req]() {
        ExportResult result{EngineError::Ok, RasterImage{}};
        result.error = paintcore::renderSnapshot(*snap, req, result.image);
        return result;
    });
}

EngineError PaintEngine::pickColor(float x, float y, ColorRGBA& out) const {
    clearError();
    const auto& s = state();
    if (!std::isfinite(x) || !std::isfinite(y) || x < 0.0f || y < 0.0f
        || x >= static_cast<float>(s.config.width) || y >= static_cast<float>(s.config.height)) {
        return fail(EngineError::InvalidArgument);
    }

    const CanvasSnapshotPtr snap = captureSnapshot(false);
    paintcore::RenderRequest req = makeExportRequest(*snap, PixelFormat::Rgba8, 1.0f, s.config.maxExportPixels);
    req.width = 1;
    req.height = 1;
    req.originX = std::floor(x);
    req.originY = std::floor(y);

    RasterImage pixel;
    const EngineError err = paintcore::renderSnapshot(*snap, req, pixel);
    if (err != EngineError::Ok) return fail(err);

    const std::uint8_t* p = pixel.pixelAt(0, 0);
    out = ColorRGBA{p[0] / 255.0f, p[1] / 255.0f, p[2] / 255.0f, p[3] / 255.0f};
    return EngineError::Ok;
}
