#include "paintcore/stroke/stroke.h"

#include <algorithm>
#include <utility>

namespace paintcore {

void expandBounds(Bounds& b, float x, float y, float pad) {
    if (!b.valid) {
        b = Bounds{x - pad, y - pad, x + pad, y + pad, true};
        return;
    }
    b.minX = std::min(b.minX, x - pad);
    b.minY = std::min(b.minY, y - pad);
    b.maxX = std::max(b.maxX, x + pad);
    b.maxY = std::max(b.maxY, y + pad);
}

Bounds computeStrokeBounds(const Brush& brush, const std::vector<SamplePoint>& points) {
    // One extra pixel covers the anti-aliased rim.
    const float reach = std::max(brush.settings.maxSize, brush.settings.size);
    const float pad = reach * (1.0f + brush.settings.scatter) + 1.0f;
    Bounds b{0.0f, 0.0f, 0.0f, 0.0f, false};
    for (const auto& p : points) expandBounds(b, p.x, p.y, pad);
    return b;
}

std::vector<SamplePoint> simplifyPoints(const std::vector<SamplePoint>& points, float tolerance) {
    if (points.size() <= 2 || !(tolerance > 0.0f)) return points;

    std::vector<bool> keep(points.size(), false);
    keep.front() = true;
    keep.back() = true;
    const float tolSq = tolerance * tolerance;

    // Douglas-Peucker over an explicit range stack; long strokes stay off the call stack.
    std::vector<std::pair<std::size_t, std::size_t>> ranges;
    ranges.emplace_back(0, points.size() - 1);
    while (!ranges.empty()) {
        const auto [first, last] = ranges.back();
        ranges.pop_back();
        if (last <= first + 1) continue;

        float maxDist = -1.0f;
        std::size_t index = first;
        const SamplePoint& a = points[first];
        const SamplePoint& b = points[last];
        for (std::size_t i = first + 1; i < last; ++i) {
            const float d = pointToSegmentDistanceSq(points[i].x, points[i].y, a.x, a.y, b.x, b.y);
            if (d > maxDist) {
                maxDist = d;
                index = i;
            }
        }
        if (maxDist > tolSq) {
            keep[index] = true;
            ranges.emplace_back(first, index);
            ranges.emplace_back(index, last);
        }
    }

    std::vector<SamplePoint> out;
    out.reserve(points.size());
    for (std::size_t i = 0; i < points.size(); ++i) {
        if (keep[i]) out.push_back(points[i]);
    }
    return out;
}

} // namespace paintcore
