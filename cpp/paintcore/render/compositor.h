#ifndef PAINTCORE_RENDER_COMPOSITOR_H
#define PAINTCORE_RENDER_COMPOSITOR_H

#include "paintcore/core/types.h"
#include "paintcore/render/canvas_snapshot.h"
#include "paintcore/render/raster_image.h"

#include <cstdint>

namespace paintcore {

struct RenderRequest {
    std::uint32_t width{0};          // output size in pixels
    std::uint32_t height{0};
    PixelFormat format{PixelFormat::Rgba8};
    bool applyView{true};            // false maps canvas space 1:1 (scaled by contentScale)
    float contentScale{1.0f};        // canvas units to output pixels
    float originX{0.0f};             // canvas-space top-left, without view only
    float originY{0.0f};
    float resolutionScale{1.0f};     // internal render scale, upscaled to the output size
    float spacingQuantum{0.0f};
    bool includePreview{true};
    std::uint64_t maxPixels{kDefaultMaxExportPixels};
};

struct RenderStats {
    std::uint32_t drawCalls{0};
    std::uint32_t layersComposited{0};
};

// Flattens visible layers bottom to top into out. Reads only the snapshot.
// Returns ExportFailed when the target is too large or cannot be allocated.
EngineError renderSnapshot(const CanvasSnapshot& snapshot, const RenderRequest& request, RasterImage& out,
                           RenderStats* stats = nullptr);

} // namespace paintcore

#endif // PAINTCORE_RENDER_COMPOSITOR_H
