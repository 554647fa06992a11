#ifndef PAINTCORE_STROKE_STROKE_H
#define PAINTCORE_STROKE_STROKE_H

#include "paintcore/brush/brush.h"
#include "paintcore/core/numeric.h"
#include "paintcore/core/types.h"

#include <cstdint>
#include <memory>
#include <vector>

// A committed stroke is immutable and shared between its layer, history
// entries and render snapshots.
struct Stroke {
    std::uint32_t id{0};
    std::uint32_t layerId{0};
    Brush brush;
    ColorRGBA color{0.0f, 0.0f, 0.0f, 1.0f};
    std::uint64_t seed{0};
    std::vector<SamplePoint> points;
    Bounds bounds{0.0f, 0.0f, 0.0f, 0.0f, false};
};

using StrokePtr = std::shared_ptr<const Stroke>;

namespace paintcore {

// Seed for scatter, derived from the stroke id.
inline std::uint64_t strokeSeed(std::uint32_t strokeId, std::uint64_t salt) {
    return splitMixSeed(static_cast<std::uint64_t>(strokeId), salt);
}

// Point bounds grown by the largest stamp the brush can produce, including scatter.
Bounds computeStrokeBounds(const Brush& brush, const std::vector<SamplePoint>& points);

void expandBounds(Bounds& b, float x, float y, float pad);

// Douglas-Peucker; endpoints are always kept.
std::vector<SamplePoint> simplifyPoints(const std::vector<SamplePoint>& points, float tolerance);

} // namespace paintcore

#endif // PAINTCORE_STROKE_STROKE_H
