#pragma once

#include "paintcore/core/types.h"
#include "paintcore/layer/layer_store.h"
#include "paintcore/stroke/stroke.h"

#include <cstdint>
#include <memory>
#include <vector>

struct ViewState {
    float zoom{1.0f};
    float panX{0.0f};
    float panY{0.0f};
    float rotation{0.0f}; // degrees, [0, 360)
};

// Immutable copy of everything a render pass reads. Strokes are shared, so a
// capture costs pointer copies only and later commits cannot tear a render.
struct CanvasSnapshot {
    std::uint32_t width{0};
    std::uint32_t height{0};
    ColorRGBA background{1.0f, 1.0f, 1.0f, 1.0f};
    ViewState view{};
    std::vector<Layer> layers; // paint order, bottom first
    std::uint32_t activeLayerId{0};
    std::shared_ptr<const Stroke> preview; // in-flight stroke, may be null
};

using CanvasSnapshotPtr = std::shared_ptr<const CanvasSnapshot>;
