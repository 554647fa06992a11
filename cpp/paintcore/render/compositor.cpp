#include "paintcore/render/compositor.h"
#include "paintcore/brush/brush.h"
#include "paintcore/core/logging.h"
#include "paintcore/core/numeric.h"
#include "paintcore/render/blend.h"
#include "paintcore/render/view_transform.h"
#include "paintcore/stroke/stamp_walker.h"

#include <algorithm>
#include <cmath>
#include <new>
#include <utility>
#include <vector>

namespace paintcore {

namespace {

struct PixelRect {
    int x0{0}, y0{0}, x1{0}, y1{0}; // half-open

    bool empty() const { return x1 <= x0 || y1 <= y0; }

    void unite(const PixelRect& o) {
        if (o.empty()) return;
        if (empty()) {
            *this = o;
            return;
        }
        x0 = std::min(x0, o.x0);
        y0 = std::min(y0, o.y0);
        x1 = std::max(x1, o.x1);
        y1 = std::max(y1, o.y1);
    }
};

// Premultiplied float RGBA.
struct FloatBuffer {
    int width{0};
    int height{0};
    std::vector<float> px;

    void resize(int w, int h) {
        width = w;
        height = h;
        px.assign(static_cast<std::size_t>(w) * static_cast<std::size_t>(h) * 4, 0.0f);
    }

    float* at(int x, int y) {
        return px.data() + (static_cast<std::size_t>(y) * static_cast<std::size_t>(width) + static_cast<std::size_t>(x)) * 4;
    }

    void clearRect(const PixelRect& r) {
        for (int y = r.y0; y < r.y1; ++y) {
            std::fill(at(r.x0, y), at(r.x0, y) + static_cast<std::size_t>(r.x1 - r.x0) * 4, 0.0f);
        }
    }
};

struct StrokeScratch {
    std::vector<Stamp> stamps;
    std::vector<float> coverage;
};

// Saturates a pixel coordinate into [lo, hi] before the cast; NaN maps to lo.
int toPixel(float v, int lo, int hi) {
    if (!(v > static_cast<float>(lo))) return lo;
    if (v >= static_cast<float>(hi)) return hi;
    return static_cast<int>(v);
}

PixelRect clipBounds(const Bounds& b, int width, int height) {
    PixelRect r;
    if (!b.valid) return r;
    r.x0 = toPixel(std::floor(b.minX), 0, width);
    r.y0 = toPixel(std::floor(b.minY), 0, height);
    r.x1 = toPixel(std::ceil(b.maxX) + 1.0f, 0, width);
    r.y1 = toPixel(std::ceil(b.maxY) + 1.0f, 0, height);
    return r;
}

float stampFalloff(float dn, float hardness) {
    if (dn <= hardness) return 1.0f;
    if (hardness >= 1.0f) return 1.0f;
    const float t = clamp01((dn - hardness) / (1.0f - hardness));
    return 1.0f - t * t;
}

// Accumulates one stamp into the stroke coverage mask with MAX, so that
// overlapping dabs of one stroke never build up darker than a single dab.
void rasterizeStamp(const Stamp& s, const ViewTransform& xf, float hardness, const PixelRect& box, std::vector<float>& cov) {
    const float radius = s.radius * xf.uniformScale;
    if (!(radius > 0.0f)) return;
    const float minor = std::max(radius * s.aspect, 1e-3f);
    const Point2 c = xf.apply(s.x, s.y);
    const float angle = s.angle + xf.rotationRad;
    const float cs = std::cos(angle);
    const float sn = std::sin(angle);

    const float reach = radius + 1.0f;
    const int x0 = toPixel(std::floor(c.x - reach), box.x0, box.x1);
    const int y0 = toPixel(std::floor(c.y - reach), box.y0, box.y1);
    const int x1 = toPixel(std::ceil(c.x + reach) + 1.0f, box.x0, box.x1);
    const int y1 = toPixel(std::ceil(c.y + reach) + 1.0f, box.y0, box.y1);
    const int stride = box.x1 - box.x0;

    for (int y = y0; y < y1; ++y) {
        const float dy = static_cast<float>(y) + 0.5f - c.y;
        for (int x = x0; x < x1; ++x) {
            const float dx = static_cast<float>(x) + 0.5f - c.x;
            const float u = (dx * cs + dy * sn) / radius;
            const float v = (-dx * sn + dy * cs) / minor;
            const float dn = std::sqrt(u * u + v * v);
            const float aa = clamp01((1.0f - dn) * minor + 0.5f);
            if (aa <= 0.0f) continue;
            const float a = stampFalloff(dn, hardness) * aa * s.opacity;
            float& dst = cov[static_cast<std::size_t>(y - box.y0) * static_cast<std::size_t>(stride) + static_cast<std::size_t>(x - box.x0)];
            if (a > dst) dst = a;
        }
    }
}

PixelRect rasterizeStroke(const Stroke& stroke, const ViewTransform& xf, float quantum, FloatBuffer& layer, StrokeScratch& scratch) {
    const PixelRect box = clipBounds(xf.apply(stroke.bounds), layer.width, layer.height);
    if (box.empty() || stroke.points.empty()) return PixelRect{};

    scratch.stamps.clear();
    walkStroke(stroke, quantum, scratch.stamps);

    const std::size_t bw = static_cast<std::size_t>(box.x1 - box.x0);
    const std::size_t bh = static_cast<std::size_t>(box.y1 - box.y0);
    scratch.coverage.assign(bw * bh, 0.0f);

    const float hardness = clamp01(stroke.brush.settings.hardness);
    for (const auto& s : scratch.stamps) {
        rasterizeStamp(s, xf, hardness, box, scratch.coverage);
    }

    const bool eraser = isEraser(stroke.brush);
    const float r = clamp01(stroke.color.r);
    const float g = clamp01(stroke.color.g);
    const float b = clamp01(stroke.color.b);
    const float alpha = clamp01(stroke.color.a);
    for (int y = box.y0; y < box.y1; ++y) {
        const float* row = scratch.coverage.data() + static_cast<std::size_t>(y - box.y0) * bw;
        for (int x = box.x0; x < box.x1; ++x) {
            const float c = row[x - box.x0];
            if (c <= 0.0f) continue;
            float* dst = layer.at(x, y);
            if (eraser) {
                const float keep = 1.0f - c;
                dst[0] *= keep;
                dst[1] *= keep;
                dst[2] *= keep;
                dst[3] *= keep;
                continue;
            }
            const float a = c * alpha;
            const float src[4] = {r * a, g * a, b * a, a};
            compositePixel(dst, src, BlendMode::Normal);
        }
    }
    return box;
}

std::uint8_t toByte(float v) {
    return static_cast<std::uint8_t>(std::lround(clamp01(v) * 255.0f));
}

void writePixel(std::uint8_t* dst, const float* p, PixelFormat format) {
    const float a = clamp01(p[3]);
    if (format == PixelFormat::PremultipliedRgba8) {
        dst[0] = toByte(p[0]);
        dst[1] = toByte(p[1]);
        dst[2] = toByte(p[2]);
        dst[3] = toByte(a);
        return;
    }
    float r = 0.0f, g = 0.0f, b = 0.0f;
    if (a > 0.0f) {
        r = p[0] / a;
        g = p[1] / a;
        b = p[2] / a;
    }
    if (format == PixelFormat::Bgra8) std::swap(r, b);
    dst[0] = toByte(r);
    dst[1] = toByte(g);
    dst[2] = toByte(b);
    dst[3] = toByte(a);
}

EngineError renderInto(const CanvasSnapshot& snapshot, const RenderRequest& request, RasterImage& out, RenderStats& stats) {
    const float resScale = (request.resolutionScale > 0.0f && request.resolutionScale <= 1.0f) ? request.resolutionScale : 1.0f;
    const int outW = static_cast<int>(request.width);
    const int outH = static_cast<int>(request.height);
    const int iw = std::max(1, static_cast<int>(std::ceil(static_cast<float>(outW) * resScale)));
    const int ih = std::max(1, static_cast<int>(std::ceil(static_cast<float>(outH) * resScale)));

    ViewTransform xf = request.applyView
        ? ViewTransform::fromView(snapshot.view, request.contentScale * resScale)
        : ViewTransform::identity(request.contentScale * resScale);
    if (!request.applyView) {
        xf.tx = -request.originX * xf.uniformScale;
        xf.ty = -request.originY * xf.uniformScale;
    }

    FloatBuffer canvas;
    canvas.resize(iw, ih);
    const ColorRGBA bg = snapshot.background;
    const float bgA = clamp01(bg.a);
    const float bgPx[4] = {clamp01(bg.r) * bgA, clamp01(bg.g) * bgA, clamp01(bg.b) * bgA, bgA};
    for (std::size_t i = 0; i < canvas.px.size(); i += 4) {
        std::copy(bgPx, bgPx + 4, canvas.px.data() + i);
    }

    FloatBuffer layerBuf;
    layerBuf.resize(iw, ih);
    StrokeScratch scratch;

    for (const Layer& layer : snapshot.layers) {
        if (!layer.visible) continue;
        const bool withPreview = request.includePreview && snapshot.preview && snapshot.preview->layerId == layer.id;
        if (layer.strokes.empty() && !withPreview) continue;

        PixelRect dirty;
        for (const auto& stroke : layer.strokes) {
            dirty.unite(rasterizeStroke(*stroke, xf, request.spacingQuantum, layerBuf, scratch));
            ++stats.drawCalls;
        }
        if (withPreview) {
            dirty.unite(rasterizeStroke(*snapshot.preview, xf, request.spacingQuantum, layerBuf, scratch));
            ++stats.drawCalls;
        }
        if (dirty.empty()) continue;

        const float opacity = clamp01(layer.opacity);
        for (int y = dirty.y0; y < dirty.y1; ++y) {
            for (int x = dirty.x0; x < dirty.x1; ++x) {
                const float* lp = layerBuf.at(x, y);
                if (lp[3] <= 0.0f) continue;
                const float src[4] = {lp[0] * opacity, lp[1] * opacity, lp[2] * opacity, lp[3] * opacity};
                compositePixel(canvas.at(x, y), src, layer.blendMode);
            }
        }
        layerBuf.clearRect(dirty);
        ++stats.layersComposited;
    }

    out.width = request.width;
    out.height = request.height;
    out.format = request.format;
    out.pixels.assign(static_cast<std::size_t>(outW) * static_cast<std::size_t>(outH) * 4, 0);
    for (int y = 0; y < outH; ++y) {
        const int sy = iw == outW && ih == outH ? y : std::min(ih - 1, static_cast<int>(static_cast<std::int64_t>(y) * ih / outH));
        for (int x = 0; x < outW; ++x) {
            const int sx = iw == outW ? x : std::min(iw - 1, static_cast<int>(static_cast<std::int64_t>(x) * iw / outW));
            std::uint8_t* dst = out.pixels.data() + (static_cast<std::size_t>(y) * static_cast<std::size_t>(outW) + static_cast<std::size_t>(x)) * 4;
            writePixel(dst, canvas.at(sx, sy), request.format);
        }
    }
    return EngineError::Ok;
}

} // namespace

EngineError renderSnapshot(const CanvasSnapshot& snapshot, const RenderRequest& request, RasterImage& out, RenderStats* stats) {
    if (request.width == 0 || request.height == 0) return EngineError::InvalidArgument;
    if (!std::isfinite(request.contentScale) || request.contentScale <= 0.0f) return EngineError::InvalidArgument;

    const std::uint64_t pixels = static_cast<std::uint64_t>(request.width) * static_cast<std::uint64_t>(request.height);
    if (pixels > request.maxPixels) {
        PAINTCORE_LOG_WARN("render target %ux%u exceeds pixel limit", request.width, request.height);
        return EngineError::ExportFailed;
    }

    RenderStats local;
    try {
        const EngineError err = renderInto(snapshot, request, out, local);
        if (err != EngineError::Ok) return err;
    } catch (const std::bad_alloc&) {
        PAINTCORE_LOG_WARN("render target %ux%u could not be allocated", request.width, request.height);
        out = RasterImage{};
        return EngineError::ExportFailed;
    }
    if (stats) *stats = local;
    return EngineError::Ok;
}

} // namespace paintcore
