#include "paintcore/brush/brush.h"
#include "paintcore/core/numeric.h"

#include <algorithm>
#include <cmath>

namespace paintcore {

namespace {

bool isUnit(float v) {
    return std::isfinite(v) && v >= 0.0f && v <= 1.0f;
}

} // namespace

float evaluatePressureCurve(const std::vector<float>& curve, float pressure) {
    const float p = clamp01(pressure);
    if (curve.empty()) return p;
    if (curve.size() == 1) return clamp01(curve.front());

    const float scaled = p * static_cast<float>(curve.size() - 1);
    const std::size_t i = std::min(static_cast<std::size_t>(scaled), curve.size() - 2);
    const float t = scaled - static_cast<float>(i);
    return clamp01(lerp(curve[i], curve[i + 1], t));
}

StampParams deriveStampParams(const Brush& brush, const SamplePoint& point, float speed) {
    const BrushSettings& s = brush.settings;
    const float mapped = evaluatePressureCurve(brush.pressureCurve, point.pressure);
    const float sensitivity = clamp01(s.pressureSensitivity);

    const float base = std::max(s.minSize, std::min(s.maxSize, s.size));
    const float pressured = lerp(s.minSize, s.maxSize, mapped);

    StampParams out{};
    out.radius = lerp(base, pressured, sensitivity);
    if (s.velocitySensitivity > 0.0f && speed > 0.0f) {
        const float fast = std::min(speed / kVelocitySaturationPxPerSec, 1.0f);
        out.radius = std::max(s.minSize, out.radius * (1.0f - clamp01(s.velocitySensitivity) * fast));
    }
    out.opacity = clamp01(s.opacity * s.flow * ((1.0f - sensitivity) + sensitivity * mapped));
    out.aspect = 1.0f;
    out.angle = 0.0f;

    if (brush.tiltSupport) {
        const float mag = std::sqrt(point.tiltX * point.tiltX + point.tiltY * point.tiltY);
        const float m = std::min(1.0f, mag / kMaxTiltDegrees);
        out.aspect = 1.0f - 0.5f * m;
        if (mag > 0.0f) out.angle = std::atan2(point.tiltY, point.tiltX);
    }
    return out;
}

float stampSpacing(const Brush& brush, float radius, float spacingQuantum) {
    const float factor = std::max(brush.settings.spacing, spacingQuantum);
    return std::max(kMinStampSpacingPx, factor * radius);
}

bool validateBrushSettings(const BrushSettings& s) {
    const float sizes[] = {s.size, s.minSize, s.maxSize};
    for (const float v : sizes) {
        if (!std::isfinite(v) || v <= 0.0f) return false;
    }
    if (s.minSize > s.maxSize) return false;
    if (!isUnit(s.pressureSensitivity) || !isUnit(s.opacity) || !isUnit(s.flow)) return false;
    if (!isUnit(s.hardness) || !isUnit(s.smoothing) || !isUnit(s.velocitySensitivity)) return false;
    if (!std::isfinite(s.spacing) || s.spacing < 0.0f) return false;
    if (!std::isfinite(s.scatter) || s.scatter < 0.0f) return false;
    return true;
}

bool validateBrush(const Brush& brush) {
    if (brush.id.empty()) return false;
    if (!validateBrushSettings(brush.settings)) return false;
    for (const float v : brush.pressureCurve) {
        if (!isUnit(v)) return false;
    }
    return true;
}

} // namespace paintcore
