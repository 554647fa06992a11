#pragma once

#include "paintcore/brush/brush.h"
#include "paintcore/core/numeric.h"
#include "paintcore/core/types.h"

#include <cstdint>
#include <vector>

struct Stroke;

namespace paintcore {

struct Stamp {
    float x;
    float y;
    float radius;
    float opacity;
    float aspect;
    float angle;
};

// Places stamps along a polyline at brush spacing. The walker is a small value
// type: copying it forks the scatter sequence, which is how provisional stamps
// are previewed without disturbing the committed sequence.
class StampWalker {
public:
    StampWalker() : rng_(0) {}
    StampWalker(const Brush* brush, std::uint64_t seed, float spacingQuantum);

    // Appends the stamps produced by extending the path to p.
    void feed(const SamplePoint& p, std::vector<Stamp>& out);

private:
    Stamp makeStamp(const SamplePoint& p, float speed);

    const Brush* brush_{nullptr};
    SeededRandom rng_;
    float quantum_{0.0f};
    bool started_{false};
    SamplePoint last_{};
    float lastRadius_{0.0f};
    float travelled_{0.0f};
};

// Full deterministic walk of a committed stroke.
void walkStroke(const Stroke& stroke, float spacingQuantum, std::vector<Stamp>& out);

} // namespace paintcore
