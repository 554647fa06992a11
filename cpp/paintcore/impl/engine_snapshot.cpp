// PaintEngine snapshot save/load methods

#include "paintcore/engine.h"
#include "paintcore/core/logging.h"
#include "paintcore/internal/engine_state.h"
#include "paintcore/persistence/snapshot.h"

#include <algorithm>
#include <utility>

std::vector<std::uint8_t> PaintEngine::saveSnapshot() const {
    const auto& s = state();
    paintcore::SnapshotData data;
    data.width = s.config.width;
    data.height = s.config.height;
    data.background = s.config.background;
    data.view = s.view;
    data.layers = s.layerStore.layers();
    data.activeLayerId = s.layerStore.activeLayerId();
    data.nextLayerId = s.layerStore.nextLayerId();
    data.nextStrokeId = s.nextStrokeId;
    return paintcore::buildCanvasSnapshotBytes(data);
}

EngineError PaintEngine::loadSnapshot(const std::uint8_t* bytes, std::size_t byteCount) {
    clearError();
    if (!bytes && byteCount > 0) return fail(EngineError::InvalidArgument);

    paintcore::SnapshotData data;
    const EngineError err = paintcore::parseCanvasSnapshot(bytes, byteCount, data);
    if (err != EngineError::Ok) {
        PAINTCORE_LOG_WARN("snapshot rejected: %s", engineErrorName(err));
        return fail(err);
    }

    auto& s = state();
    abortInFlight();

    std::uint32_t maxStrokeId = 0;
    for (const auto& layer : data.layers) {
        for (const auto& stroke : layer.strokes) maxStrokeId = std::max(maxStrokeId, stroke->id);
    }

    s.layerStore.loadLayers(std::move(data.layers), data.activeLayerId, data.nextLayerId);
    s.config.width = data.width;
    s.config.height = data.height;
    s.config.background = data.background;
    s.view = data.view;
    s.historyManager.clear();
    s.nextStrokeId = std::max(data.nextStrokeId, maxStrokeId + 1);

    emitEvent(EventType::SnapshotLoaded, static_cast<std::uint32_t>(s.layerStore.size()), s.layerStore.activeLayerId());
    return EngineError::Ok;
}

EngineError PaintEngine::persistTo(paintcore::BlobStore& store, const std::string& key) const {
    clearError();
    if (key.empty()) return fail(EngineError::InvalidArgument);
    if (!store.put(key, saveSnapshot())) {
        PAINTCORE_LOG_WARN("blob store rejected key '%s'", key.c_str());
        return fail(EngineError::StorageFailed);
    }
    return EngineError::Ok;
}

EngineError PaintEngine::restoreFrom(const paintcore::BlobStore& store, const std::string& key) {
    clearError();
    if (key.empty()) return fail(EngineError::InvalidArgument);
    std::vector<std::uint8_t> bytes;
    if (!store.get(key, bytes)) return fail(EngineError::StorageFailed);
    return loadSnapshot(bytes.data(), bytes.size());
}
