#ifndef PAINTCORE_PERSISTENCE_SNAPSHOT_H
#define PAINTCORE_PERSISTENCE_SNAPSHOT_H

#include "paintcore/brush/brush.h"
#include "paintcore/core/types.h"
#include "paintcore/layer/layer_store.h"
#include "paintcore/render/canvas_snapshot.h"

#include <cstdint>
#include <vector>

namespace paintcore {

// Decoded document: everything needed to rebuild CanvasState. History is not persisted.
struct SnapshotData {
    std::uint32_t version{snapshotVersionPcsn};
    std::uint32_t width{0};
    std::uint32_t height{0};
    ColorRGBA background{1.0f, 1.0f, 1.0f, 1.0f};
    ViewState view{};
    std::vector<Layer> layers; // paint order, strokes attached
    std::uint32_t activeLayerId{0};
    std::uint32_t nextLayerId{1};
    std::uint32_t nextStrokeId{1};
};

std::vector<std::uint8_t> buildCanvasSnapshotBytes(const SnapshotData& data);

// Validates header, section table, CRCs and every record. out is only
// written when the whole buffer decodes.
EngineError parseCanvasSnapshot(const std::uint8_t* src, std::size_t byteCount, SnapshotData& out);

// Standalone brush preset: PCBR header followed by one brush record.
std::vector<std::uint8_t> buildBrushBytes(const Brush& brush);
EngineError parseBrushBytes(const std::uint8_t* src, std::size_t byteCount, Brush& out);

} // namespace paintcore

#endif // PAINTCORE_PERSISTENCE_SNAPSHOT_H
