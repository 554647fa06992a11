#include "paintcore/render/blend.h"

#include <algorithm>
#include <cmath>

namespace paintcore {

namespace {

float multiply(float cb, float cs) { return cb * cs; }
float screen(float cb, float cs) { return cb + cs - cb * cs; }

float hardLight(float cb, float cs) {
    if (cs <= 0.5f) return multiply(cb, 2.0f * cs);
    return screen(cb, 2.0f * cs - 1.0f);
}

float softLight(float cb, float cs) {
    if (cs <= 0.5f) return cb - (1.0f - 2.0f * cs) * cb * (1.0f - cb);
    const float d = cb <= 0.25f ? ((16.0f * cb - 12.0f) * cb + 4.0f) * cb : std::sqrt(cb);
    return cb + (2.0f * cs - 1.0f) * (d - cb);
}

} // namespace

float blendChannel(BlendMode mode, float cb, float cs) {
    switch (mode) {
        case BlendMode::Normal: return cs;
        case BlendMode::Multiply: return multiply(cb, cs);
        case BlendMode::Screen: return screen(cb, cs);
        case BlendMode::Overlay: return hardLight(cs, cb);
        case BlendMode::Darken: return std::min(cb, cs);
        case BlendMode::Lighten: return std::max(cb, cs);
        case BlendMode::ColorDodge:
            if (cb <= 0.0f) return 0.0f;
            if (cs >= 1.0f) return 1.0f;
            return std::min(1.0f, cb / (1.0f - cs));
        case BlendMode::ColorBurn:
            if (cb >= 1.0f) return 1.0f;
            if (cs <= 0.0f) return 0.0f;
            return 1.0f - std::min(1.0f, (1.0f - cb) / cs);
        case BlendMode::HardLight: return hardLight(cb, cs);
        case BlendMode::SoftLight: return softLight(cb, cs);
    }
    return cs;
}

void compositePixel(float* dst, const float* src, BlendMode mode) {
    const float as = src[3];
    if (as <= 0.0f) return;
    const float ab = dst[3];

    if (mode == BlendMode::Normal || ab <= 0.0f) {
        const float k = 1.0f - as;
        dst[0] = src[0] + dst[0] * k;
        dst[1] = src[1] + dst[1] * k;
        dst[2] = src[2] + dst[2] * k;
        dst[3] = as + ab * k;
        return;
    }

    for (int i = 0; i < 3; ++i) {
        const float cs = src[i] / as;
        const float cb = dst[i] / ab;
        const float mixed = blendChannel(mode, std::min(1.0f, cb), std::min(1.0f, cs));
        dst[i] = src[i] * (1.0f - ab) + dst[i] * (1.0f - as) + as * ab * mixed;
    }
    dst[3] = as + ab * (1.0f - as);
}

const char* blendModeName(BlendMode mode) noexcept {
    switch (mode) {
        case BlendMode::Normal: return "normal";
        case BlendMode::Multiply: return "multiply";
        case BlendMode::Screen: return "screen";
        case BlendMode::Overlay: return "overlay";
        case BlendMode::Darken: return "darken";
        case BlendMode::Lighten: return "lighten";
        case BlendMode::ColorDodge: return "color-dodge";
        case BlendMode::ColorBurn: return "color-burn";
        case BlendMode::HardLight: return "hard-light";
        case BlendMode::SoftLight: return "soft-light";
    }
    return "normal";
}

} // namespace paintcore
