#pragma once

#include "paintcore/core/types.h"
#include "paintcore/render/canvas_snapshot.h"

#include <algorithm>
#include <cmath>

namespace paintcore {

// device = scale * (pan + rotate(zoom * p))
struct ViewTransform {
    float a{1.0f}, b{0.0f}, c{0.0f}, d{1.0f};
    float tx{0.0f}, ty{0.0f};
    float uniformScale{1.0f};
    float rotationRad{0.0f};

    static ViewTransform identity(float scale) {
        ViewTransform t;
        t.a = scale;
        t.d = scale;
        t.uniformScale = scale;
        return t;
    }

    static ViewTransform fromView(const ViewState& view, float scale) {
        constexpr float kDegToRad = 0.017453292519943295f;
        ViewTransform t;
        t.rotationRad = view.rotation * kDegToRad;
        const float cs = std::cos(t.rotationRad);
        const float sn = std::sin(t.rotationRad);
        const float k = view.zoom * scale;
        t.a = cs * k;
        t.b = sn * k;
        t.c = -sn * k;
        t.d = cs * k;
        t.tx = view.panX * scale;
        t.ty = view.panY * scale;
        t.uniformScale = k;
        return t;
    }

    Point2 apply(float x, float y) const {
        return Point2{a * x + c * y + tx, b * x + d * y + ty};
    }

    Bounds apply(const Bounds& in) const {
        if (!in.valid) return in;
        const Point2 p0 = apply(in.minX, in.minY);
        const Point2 p1 = apply(in.maxX, in.minY);
        const Point2 p2 = apply(in.minX, in.maxY);
        const Point2 p3 = apply(in.maxX, in.maxY);
        Bounds out{p0.x, p0.y, p0.x, p0.y, true};
        const Point2 rest[3] = {p1, p2, p3};
        for (const auto& p : rest) {
            out.minX = std::min(out.minX, p.x);
            out.minY = std::min(out.minY, p.y);
            out.maxX = std::max(out.maxX, p.x);
            out.maxY = std::max(out.maxY, p.y);
        }
        return out;
    }
};

} // namespace paintcore
