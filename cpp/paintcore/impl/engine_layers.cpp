// PaintEngine layer operations

#include "paintcore/engine.h"
#include "paintcore/core/logging.h"
#include "paintcore/internal/engine_state.h"
#include "paintcore/render/blend.h"

namespace {

bool samePropState(const LayerProps& a, const LayerProps& b) {
    return a.name == b.name
        && a.visible == b.visible
        && a.locked == b.locked
        && a.opacity == b.opacity
        && a.blendMode == b.blendMode;
}

} // namespace

LayerInfo PaintEngine::addLayer(const std::string& name) {
    clearError();
    auto& s = state();
    const std::uint32_t activeBefore = s.layerStore.activeLayerId();
    const Layer& layer = s.layerStore.addLayer(name);

    HistoryEntry entry;
    entry.kind = HistoryKind::AddLayer;
    entry.layerId = layer.id;
    entry.layer = layer;
    entry.layerIndex = s.layerStore.size() - 1;
    entry.activeBefore = activeBefore;
    entry.activeAfter = layer.id;
    const LayerInfo info = makeLayerInfo(layer);
    pushHistory(std::move(entry));

    emitEvent(EventType::LayerAdded, info.id);
    emitEvent(EventType::ActiveLayerChanged, info.id);
    return info;
}

EngineError PaintEngine::deleteLayer(std::uint32_t layerId) {
    clearError();
    auto& s = state();
    const Layer* layer = s.layerStore.find(layerId);
    if (!layer) return fail(EngineError::LayerNotFound);
    if (s.layerStore.size() == 1) return fail(EngineError::LastLayer);

    if (s.capture.active() && s.capture.inFlight()->layerId == layerId) abortInFlight();

    HistoryEntry entry;
    entry.kind = HistoryKind::DeleteLayer;
    entry.layerId = layerId;
    entry.layer = *layer;
    entry.layerIndex = s.layerStore.indexOf(layerId);
    entry.activeBefore = s.layerStore.activeLayerId();

    const EngineError err = s.layerStore.deleteLayer(layerId);
    if (err != EngineError::Ok) return fail(err);

    entry.activeAfter = s.layerStore.activeLayerId();
    const bool activeChanged = entry.activeAfter != entry.activeBefore;
    const std::uint32_t activeAfter = entry.activeAfter;
    pushHistory(std::move(entry));

    emitEvent(EventType::LayerDeleted, layerId);
    if (activeChanged) emitEvent(EventType::ActiveLayerChanged, activeAfter);
    return EngineError::Ok;
}

EngineError PaintEngine::setActiveLayer(std::uint32_t layerId) {
    clearError();
    auto& s = state();
    const std::uint32_t before = s.layerStore.activeLayerId();
    const EngineError err = s.layerStore.setActiveLayer(layerId);
    if (err != EngineError::Ok) return fail(err);
    if (before != layerId) emitEvent(EventType::ActiveLayerChanged, layerId);
    return EngineError::Ok;
}

EngineError PaintEngine::updateLayerProperties(std::uint32_t layerId, const LayerProps& props) {
    clearError();
    auto& s = state();
    const Layer* layer = s.layerStore.find(layerId);
    if (!layer) return fail(EngineError::LayerNotFound);

    const LayerProps before = LayerStore::captureProps(*layer);
    const EngineError err = s.layerStore.updateProperties(layerId, props);
    if (err != EngineError::Ok) return fail(err);
    const LayerProps after = LayerStore::captureProps(*s.layerStore.find(layerId));
    if (samePropState(before, after)) return EngineError::Ok;

    HistoryEntry entry;
    entry.kind = HistoryKind::LayerProperties;
    entry.layerId = layerId;
    entry.propsBefore = before;
    entry.propsAfter = after;
    pushHistory(std::move(entry));

    PAINTCORE_LOG_DEBUG("layer %u: opacity %.3f, blend %s, %s%s", layerId, after.opacity,
        paintcore::blendModeName(after.blendMode), after.visible ? "visible" : "hidden", after.locked ? ", locked" : "");
    emitEvent(EventType::LayerChanged, layerId, props.mask);
    return EngineError::Ok;
}

EngineError PaintEngine::reorderLayers(const std::vector<std::uint32_t>& bottomToTop) {
    clearError();
    auto& s = state();
    std::vector<std::uint32_t> before = s.layerStore.orderIds();
    const EngineError err = s.layerStore.reorder(bottomToTop);
    if (err != EngineError::Ok) return fail(err);
    if (before == bottomToTop) return EngineError::Ok;

    HistoryEntry entry;
    entry.kind = HistoryKind::ReorderLayers;
    entry.orderBefore = std::move(before);
    entry.orderAfter = bottomToTop;
    pushHistory(std::move(entry));

    emitEvent(EventType::LayersReordered, static_cast<std::uint32_t>(bottomToTop.size()));
    return EngineError::Ok;
}

EngineError PaintEngine::clearLayer(std::uint32_t layerId) {
    clearError();
    auto& s = state();
    const Layer* layer = s.layerStore.find(layerId);
    if (!layer) return fail(EngineError::LayerNotFound);
    if (layer->locked) return fail(EngineError::LayerLocked);

    if (s.capture.active() && s.capture.inFlight()->layerId == layerId) abortInFlight();
    if (layer->strokes.empty()) return EngineError::Ok;

    std::vector<StrokePtr> removed;
    const EngineError err = s.layerStore.clearLayer(layerId, removed);
    if (err != EngineError::Ok) return fail(err);

    HistoryEntry entry;
    entry.kind = HistoryKind::ClearLayer;
    entry.layerId = layerId;
    entry.clearedStrokes = std::move(removed);
    pushHistory(std::move(entry));

    emitEvent(EventType::LayerCleared, layerId);
    return EngineError::Ok;
}

EngineError PaintEngine::clear() {
    return clearLayer(state().layerStore.activeLayerId());
}
