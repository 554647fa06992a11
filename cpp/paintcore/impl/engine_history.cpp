// PaintEngine undo/redo methods

#include "paintcore/engine.h"
#include "paintcore/core/util.h"
#include "paintcore/internal/engine_state.h"

void PaintEngine::pushHistory(HistoryEntry&& entry) {
    entry.timestamp = static_cast<std::uint64_t>(paintcore::nowMs());
    state().historyManager.pushHistoryEntry(std::move(entry));
}

bool PaintEngine::undo() {
    clearError();
    abortInFlight();
    const HistoryEntry* entry = state().historyManager.undo();
    if (!entry) return false;
    emitEvent(EventType::HistoryUndo, entry->id, static_cast<std::uint32_t>(entry->kind));
    return true;
}

bool PaintEngine::redo() {
    clearError();
    abortInFlight();
    const HistoryEntry* entry = state().historyManager.redo();
    if (!entry) return false;
    emitEvent(EventType::HistoryRedo, entry->id, static_cast<std::uint32_t>(entry->kind));
    return true;
}

bool PaintEngine::canUndo() const noexcept {
    return state().historyManager.canUndo();
}

bool PaintEngine::canRedo() const noexcept {
    return state().historyManager.canRedo();
}

PaintEngine::HistoryMeta PaintEngine::getHistoryMeta() const noexcept {
    const auto& h = state().historyManager;
    return HistoryMeta{
        static_cast<std::uint32_t>(h.getHistorySize()),
        static_cast<std::uint32_t>(h.getCursor()),
        h.getGeneration()
    };
}
