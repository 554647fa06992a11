#include "paintcore/history/history_manager.h"
#include "paintcore/core/logging.h"
#include "paintcore/layer/layer_store.h"

#include <utility>

const char* historyKindName(HistoryKind kind) noexcept {
    switch (kind) {
        case HistoryKind::AddStroke: return "add-stroke";
        case HistoryKind::ClearLayer: return "clear-layer";
        case HistoryKind::AddLayer: return "add-layer";
        case HistoryKind::DeleteLayer: return "delete-layer";
        case HistoryKind::LayerProperties: return "layer-property-change";
        case HistoryKind::ReorderLayers: return "reorder-layers";
    }
    return "unknown";
}

HistoryManager::HistoryManager(LayerStore& layers, std::size_t capacity)
    : layers_(layers), capacity_(capacity == 0 ? 1 : capacity) {}

bool HistoryManager::canUndo() const noexcept {
    return cursor_ > 0;
}

bool HistoryManager::canRedo() const noexcept {
    return cursor_ < history_.size();
}

void HistoryManager::clear() {
    history_.clear();
    cursor_ = 0;
    historyGeneration_++;
}

void HistoryManager::pushHistoryEntry(HistoryEntry&& entry) {
    if (cursor_ < history_.size()) {
        history_.erase(history_.begin() + static_cast<std::ptrdiff_t>(cursor_), history_.end());
    }
    entry.id = nextEntryId_++;
    history_.push_back(std::move(entry));
    if (history_.size() > capacity_) {
        history_.pop_front();
    }
    cursor_ = history_.size();
    historyGeneration_++;
}

const HistoryEntry* HistoryManager::undo() {
    if (!canUndo()) return nullptr;
    --cursor_;
    const HistoryEntry& entry = history_[cursor_];
    applyHistoryEntry(entry, false);
    historyGeneration_++;
    PAINTCORE_LOG_DEBUG("undo %s (entry %u)", historyKindName(entry.kind), entry.id);
    return &entry;
}

const HistoryEntry* HistoryManager::redo() {
    if (!canRedo()) return nullptr;
    const HistoryEntry& entry = history_[cursor_];
    ++cursor_;
    applyHistoryEntry(entry, true);
    historyGeneration_++;
    PAINTCORE_LOG_DEBUG("redo %s (entry %u)", historyKindName(entry.kind), entry.id);
    return &entry;
}

const HistoryEntry* HistoryManager::entryAt(std::size_t index) const {
    if (index >= history_.size()) return nullptr;
    return &history_[index];
}

void HistoryManager::applyHistoryEntry(const HistoryEntry& entry, bool useAfter) {
    bool ok = true;
    switch (entry.kind) {
        case HistoryKind::AddStroke:
            ok = useAfter
                ? layers_.pushStroke(entry.layerId, entry.stroke)
                : layers_.popStroke(entry.layerId, entry.stroke->id);
            break;
        case HistoryKind::ClearLayer:
            ok = layers_.restoreStrokes(entry.layerId, useAfter ? std::vector<StrokePtr>{} : entry.clearedStrokes);
            break;
        case HistoryKind::AddLayer:
            if (useAfter) {
                layers_.insertLayer(entry.layer, entry.layerIndex);
                layers_.restoreActive(entry.activeAfter);
            } else {
                ok = layers_.removeLayerAt(layers_.indexOf(entry.layer.id));
                layers_.restoreActive(entry.activeBefore);
            }
            break;
        case HistoryKind::DeleteLayer:
            if (useAfter) {
                ok = layers_.removeLayerAt(layers_.indexOf(entry.layer.id));
                layers_.restoreActive(entry.activeAfter);
            } else {
                layers_.insertLayer(entry.layer, entry.layerIndex);
                layers_.restoreActive(entry.activeBefore);
            }
            break;
        case HistoryKind::LayerProperties:
            ok = layers_.updateProperties(entry.layerId, useAfter ? entry.propsAfter : entry.propsBefore) == EngineError::Ok;
            break;
        case HistoryKind::ReorderLayers:
            ok = layers_.reorder(useAfter ? entry.orderAfter : entry.orderBefore) == EngineError::Ok;
            break;
    }
    if (!ok) {
        PAINTCORE_LOG_WARN("history entry %u (%s) did not apply cleanly", entry.id, historyKindName(entry.kind));
    }
}
