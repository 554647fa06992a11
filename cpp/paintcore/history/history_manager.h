#pragma once

#include "paintcore/core/types.h"
#include "paintcore/history/history_types.h"

#include <cstddef>
#include <cstdint>
#include <deque>

class LayerStore;

// Bounded linear history. Entries before cursor_ are undoable, entries at or
// after it are redoable. Pushing discards the redo side; overflowing the
// capacity evicts the oldest entry.
class HistoryManager {
public:
    explicit HistoryManager(LayerStore& layers, std::size_t capacity = kHistoryCapacity);

    bool canUndo() const noexcept;
    bool canRedo() const noexcept;

    // Both return the entry that was applied, or nullptr when there was nothing to do.
    const HistoryEntry* undo();
    const HistoryEntry* redo();

    void pushHistoryEntry(HistoryEntry&& entry);
    void clear();

    std::size_t getHistorySize() const noexcept { return history_.size(); }
    std::size_t getCursor() const noexcept { return cursor_; }
    std::size_t capacity() const noexcept { return capacity_; }
    std::uint32_t getGeneration() const noexcept { return historyGeneration_; }

    const HistoryEntry* entryAt(std::size_t index) const;

private:
    void applyHistoryEntry(const HistoryEntry& entry, bool useAfter);

    LayerStore& layers_;
    std::deque<HistoryEntry> history_;
    std::size_t cursor_ = 0;
    std::size_t capacity_;
    std::uint32_t historyGeneration_ = 0;
    std::uint32_t nextEntryId_ = 1;
};
