// PaintEngine stroke capture methods

#include "paintcore/engine.h"
#include "paintcore/core/logging.h"
#include "paintcore/core/util.h"
#include "paintcore/internal/engine_state.h"

EngineError PaintEngine::startStroke(const PointerSample& sample) {
    clearError();
    auto& s = state();

    // A rejected start leaves any stroke in flight untouched.
    const std::uint32_t layerId = s.layerStore.activeLayerId();
    if (s.layerStore.isLayerLocked(layerId)) {
        PAINTCORE_LOG_WARN("startStroke rejected: layer %u is locked", layerId);
        return fail(EngineError::LayerLocked);
    }
    abortInFlight();

    const QualityKnobs knobs = s.quality.knobs();
    StrokeCapture::Options options;
    options.predictive = s.config.predictiveStroke && knobs.predictiveStroke;
    options.spacingQuantum = knobs.spacingQuantum;

    const std::uint32_t strokeId = s.nextStrokeId++;
    s.strokeStartMs = paintcore::nowMs();
    s.capture.begin(strokeId, layerId, s.activeBrush, s.color,
        paintcore::strokeSeed(strokeId, s.config.seedSalt), sample, options);
    return EngineError::Ok;
}

EngineError PaintEngine::addPoint(const PointerSample& sample) {
    clearError();
    auto& s = state();
    if (!s.capture.active()) return fail(EngineError::NoActiveStroke);

    const double t0 = paintcore::nowMs();
    const EngineError err = s.capture.addSample(sample);
    if (err != EngineError::Ok) return fail(err);
    s.quality.recordInputLatency(static_cast<float>(paintcore::nowMs() - t0));
    return EngineError::Ok;
}

EngineError PaintEngine::endStroke() {
    clearError();
    auto& s = state();
    if (!s.capture.active()) return EngineError::Ok;

    std::shared_ptr<Stroke> stroke = s.capture.finish(s.config.strokeSimplifyTolerance);
    const std::uint32_t strokeId = stroke->id;
    const std::uint32_t layerId = stroke->layerId;
    const std::uint32_t pointCount = static_cast<std::uint32_t>(stroke->points.size());

    StrokePtr committed = std::move(stroke);
    const EngineError err = s.layerStore.commitStroke(committed);
    if (err != EngineError::Ok) {
        PAINTCORE_LOG_WARN("stroke %u discarded: %s", strokeId, engineErrorName(err));
        emitEvent(EventType::StrokeAborted, strokeId, layerId);
        return fail(err);
    }

    HistoryEntry entry;
    entry.kind = HistoryKind::AddStroke;
    entry.layerId = layerId;
    entry.stroke = std::move(committed);
    pushHistory(std::move(entry));

    emitEvent(EventType::StrokeCommitted, strokeId, layerId, pointCount);
    return EngineError::Ok;
}

void PaintEngine::abortStroke() {
    clearError();
    abortInFlight();
}

void PaintEngine::abortInFlight() {
    auto& s = state();
    if (!s.capture.active()) return;
    const Stroke* stroke = s.capture.inFlight();
    const std::uint32_t strokeId = stroke->id;
    const std::uint32_t layerId = stroke->layerId;
    s.capture.abort();
    emitEvent(EventType::StrokeAborted, strokeId, layerId);
}

bool PaintEngine::isStrokeActive() const noexcept {
    return state().capture.active();
}

paintcore::StampBatch PaintEngine::takeStampBatch() {
    return state().capture.takeStampBatch();
}
