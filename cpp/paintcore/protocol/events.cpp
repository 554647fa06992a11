#include "paintcore/protocol/events.h"

#include <algorithm>
#include <utility>

const char* eventTypeName(EventType type) noexcept {
    switch (type) {
        case EventType::StrokeCommitted: return "stroke-committed";
        case EventType::StrokeAborted: return "stroke-aborted";
        case EventType::LayerAdded: return "layer-added";
        case EventType::LayerDeleted: return "layer-deleted";
        case EventType::LayerChanged: return "layer-changed";
        case EventType::ActiveLayerChanged: return "active-layer-changed";
        case EventType::LayersReordered: return "layers-reordered";
        case EventType::LayerCleared: return "layer-cleared";
        case EventType::HistoryUndo: return "history-undo";
        case EventType::HistoryRedo: return "history-redo";
        case EventType::ExportCompleted: return "export-completed";
        case EventType::BrushFallback: return "brush-fallback";
        case EventType::QualityChanged: return "quality-changed";
        case EventType::ViewChanged: return "view-changed";
        case EventType::SnapshotLoaded: return "snapshot-loaded";
    }
    return "unknown";
}

ListenerId EventRegistry::subscribe(EventListener listener) {
    const ListenerId id = nextId_++;
    listeners_.push_back(Entry{id, std::move(listener), true});
    return id;
}

bool EventRegistry::unsubscribe(ListenerId id) {
    for (auto& entry : listeners_) {
        if (entry.id != id || !entry.active) continue;
        entry.active = false;
        if (depth_ > 0) {
            needsCompact_ = true;
        } else {
            compact();
        }
        return true;
    }
    return false;
}

void EventRegistry::emit(const EngineEvent& event) {
    ++depth_;
    // Listeners added during delivery only see later events.
    const std::size_t count = listeners_.size();
    for (std::size_t i = 0; i < count; ++i) {
        if (!listeners_[i].active) continue;
        EventListener fn = listeners_[i].fn;
        fn(event);
    }
    --depth_;
    if (depth_ == 0 && needsCompact_) compact();
}

std::size_t EventRegistry::listenerCount() const noexcept {
    return static_cast<std::size_t>(std::count_if(listeners_.begin(), listeners_.end(),
        [](const Entry& e) { return e.active; }));
}

void EventRegistry::compact() {
    listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
        [](const Entry& e) { return !e.active; }), listeners_.end());
    needsCompact_ = false;
}
