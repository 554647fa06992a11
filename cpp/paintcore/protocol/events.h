#pragma once

#include <cstdint>
#include <functional>
#include <vector>

enum class EventType : std::uint16_t {
    StrokeCommitted = 1,
    StrokeAborted = 2,
    LayerAdded = 3,
    LayerDeleted = 4,
    LayerChanged = 5,
    ActiveLayerChanged = 6,
    LayersReordered = 7,
    LayerCleared = 8,
    HistoryUndo = 9,
    HistoryRedo = 10,
    ExportCompleted = 11,
    BrushFallback = 12,
    QualityChanged = 13,
    ViewChanged = 14,
    SnapshotLoaded = 15,
};

enum class EventFlags : std::uint16_t {
    None = 0,
    Warning = 1 << 0,
};

// POD event record. Payload slots by type:
//   StrokeCommitted: a = stroke id, b = layer id, c = point count
//   LayerAdded/Deleted/Cleared, ActiveLayerChanged: a = layer id
//   LayerChanged: a = layer id, b = LayerPropMask bits
//   HistoryUndo/Redo: a = history entry id, b = HistoryKind
//   ExportCompleted: a = width, b = height, c = PixelFormat
//   QualityChanged: a = new level, b = previous level
struct EngineEvent {
    EventType type;
    std::uint16_t flags;
    std::uint32_t a;
    std::uint32_t b;
    std::uint32_t c;
    std::uint32_t d;
};

using ListenerId = std::uint32_t;
using EventListener = std::function<void(const EngineEvent&)>;

const char* eventTypeName(EventType type) noexcept;

// Observer registry. Delivery is synchronous and in registration order; a
// listener may unsubscribe itself or others while an event is being delivered.
class EventRegistry {
public:
    ListenerId subscribe(EventListener listener);
    bool unsubscribe(ListenerId id);
    void emit(const EngineEvent& event);

    std::size_t listenerCount() const noexcept;

private:
    struct Entry {
        ListenerId id;
        EventListener fn;
        bool active;
    };

    void compact();

    std::vector<Entry> listeners_;
    ListenerId nextId_{1};
    std::uint32_t depth_{0};
    bool needsCompact_{false};
};
