#ifndef PAINTCORE_BRUSH_BRUSH_H
#define PAINTCORE_BRUSH_BRUSH_H

#include "paintcore/core/types.h"
#include <string>
#include <vector>

struct BrushSettings {
    float size;                // base radius in canvas px
    float minSize;
    float maxSize;
    float pressureSensitivity; // [0, 1]
    float opacity;             // [0, 1]
    float flow;                // [0, 1]
    float hardness;            // [0, 1]
    float spacing;             // fraction of radius between stamps
    float smoothing;           // [0, 1]
    float scatter;             // fraction of radius, 0 = none
    float velocitySensitivity; // [0, 1], radius loss at full speed
};

// Brushes are value objects: strokes keep their own copy.
struct Brush {
    std::string id;
    std::string name;
    BrushCategory category{BrushCategory::Pencil};
    BrushSettings settings{};
    std::vector<float> pressureCurve; // evenly spaced control values over [0, 1]
    bool tiltSupport{false};
    bool customizable{false};
};

namespace paintcore {

struct StampParams {
    float radius;
    float opacity;
    float aspect; // minor / major axis ratio, 1 = round
    float angle;  // radians, major axis direction
};

// Piecewise-linear interpolation between control values. Empty curve is the identity.
float evaluatePressureCurve(const std::vector<float>& curve, float pressure);

// speed is the pointer speed in canvas px per second; 0 when unknown.
StampParams deriveStampParams(const Brush& brush, const SamplePoint& point, float speed = 0.0f);

// Distance between consecutive stamps for a stamp of the given radius.
float stampSpacing(const Brush& brush, float radius, float spacingQuantum);

bool validateBrushSettings(const BrushSettings& settings);
bool validateBrush(const Brush& brush);

inline bool isEraser(const Brush& brush) {
    return brush.category == BrushCategory::Eraser;
}

} // namespace paintcore

#endif // PAINTCORE_BRUSH_BRUSH_H
