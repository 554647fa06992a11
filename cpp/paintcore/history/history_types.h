#pragma once

#include "paintcore/layer/layer_store.h"
#include "paintcore/stroke/stroke.h"

#include <cstdint>
#include <vector>

enum class HistoryKind : std::uint8_t {
    AddStroke = 0,
    ClearLayer = 1,
    AddLayer = 2,
    DeleteLayer = 3,
    LayerProperties = 4,
    ReorderLayers = 5,
};

// A single entry in the undo/redo list. Each kind fills only the fields it
// needs to apply itself in both directions.
struct HistoryEntry {
    std::uint32_t id{0};
    HistoryKind kind{HistoryKind::AddStroke};
    std::uint64_t timestamp{0};
    std::uint32_t layerId{0};

    // AddStroke
    StrokePtr stroke;

    // ClearLayer
    std::vector<StrokePtr> clearedStrokes;

    // AddLayer / DeleteLayer
    Layer layer;
    std::size_t layerIndex{0};
    std::uint32_t activeBefore{0};
    std::uint32_t activeAfter{0};

    // LayerProperties
    LayerProps propsBefore;
    LayerProps propsAfter;

    // ReorderLayers
    std::vector<std::uint32_t> orderBefore;
    std::vector<std::uint32_t> orderAfter;
};

const char* historyKindName(HistoryKind kind) noexcept;
