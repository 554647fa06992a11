#include "paintcore/stroke/stamp_walker.h"
#include "paintcore/stroke/stroke.h"

#include <algorithm>
#include <cmath>

namespace paintcore {

namespace {

constexpr float kTwoPi = 6.28318530717958647692f;

SamplePoint interpolate(const SamplePoint& a, const SamplePoint& b, float t) {
    SamplePoint p{};
    p.x = lerp(a.x, b.x, t);
    p.y = lerp(a.y, b.y, t);
    p.pressure = lerp(a.pressure, b.pressure, t);
    p.tiltX = lerp(a.tiltX, b.tiltX, t);
    p.tiltY = lerp(a.tiltY, b.tiltY, t);
    p.timestamp = a.timestamp + static_cast<std::uint64_t>(static_cast<float>(b.timestamp - a.timestamp) * t);
    return p;
}

} // namespace

StampWalker::StampWalker(const Brush* brush, std::uint64_t seed, float spacingQuantum)
    : brush_(brush), rng_(seed), quantum_(spacingQuantum) {}

Stamp StampWalker::makeStamp(const SamplePoint& p, float speed) {
    const StampParams params = deriveStampParams(*brush_, p, speed);
    Stamp s{p.x, p.y, params.radius, params.opacity, params.aspect, params.angle};
    if (brush_->settings.scatter > 0.0f) {
        const float angle = rng_.nextFloat() * kTwoPi;
        const float dist = rng_.nextFloat() * brush_->settings.scatter * params.radius;
        s.x += std::cos(angle) * dist;
        s.y += std::sin(angle) * dist;
    }
    lastRadius_ = params.radius;
    return s;
}

void StampWalker::feed(const SamplePoint& p, std::vector<Stamp>& out) {
    if (!brush_) return;
    if (!started_) {
        started_ = true;
        last_ = p;
        travelled_ = 0.0f;
        out.push_back(makeStamp(p, 0.0f));
        return;
    }

    const float dx = p.x - last_.x;
    const float dy = p.y - last_.y;
    const float length = std::sqrt(dx * dx + dy * dy);
    if (length <= 0.0f) {
        last_ = p;
        return;
    }

    // Segment speed in px/s; samples without a time step count as at rest.
    const std::uint64_t dt = p.timestamp > last_.timestamp ? p.timestamp - last_.timestamp : 0;
    const float speed = dt > 0 ? length * 1000.0f / static_cast<float>(dt) : 0.0f;

    float along = 0.0f;
    std::size_t emitted = 0;
    while (emitted < kMaxStampsPerSegment) {
        const float step = stampSpacing(*brush_, lastRadius_, quantum_);
        const float need = std::max(0.0f, step - travelled_);
        if (along + need > length) break;
        along += need;
        travelled_ = 0.0f;
        out.push_back(makeStamp(interpolate(last_, p, along / length), speed));
        ++emitted;
    }
    travelled_ += length - along;
    last_ = p;
}

void walkStroke(const Stroke& stroke, float spacingQuantum, std::vector<Stamp>& out) {
    StampWalker walker(&stroke.brush, stroke.seed, spacingQuantum);
    for (const auto& p : stroke.points) walker.feed(p, out);
}

} // namespace paintcore
