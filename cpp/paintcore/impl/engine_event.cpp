// PaintEngine event registry methods

#include "paintcore/engine.h"
#include "paintcore/core/logging.h"
#include "paintcore/internal/engine_state.h"

#include <utility>

ListenerId PaintEngine::subscribe(EventListener listener) {
    return state().events.subscribe(std::move(listener));
}

bool PaintEngine::unsubscribe(ListenerId id) {
    return state().events.unsubscribe(id);
}

void PaintEngine::emitEvent(EventType type, std::uint32_t a, std::uint32_t b, std::uint32_t c, std::uint16_t flags) {
    PAINTCORE_LOG_DEBUG("event %s (%u, %u, %u)", eventTypeName(type), a, b, c);
    state().events.emit(EngineEvent{type, flags, a, b, c, 0});
}
