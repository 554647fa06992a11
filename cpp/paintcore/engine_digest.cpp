// engine_digest.cpp - Document digest computation for PaintEngine
// Covers what a render reads; history and id counters stay out.

#include "paintcore/engine.h"
#include "paintcore/core/numeric.h"
#include "paintcore/internal/engine_state.h"

using paintcore::kDigestOffset;
using paintcore::hashU32;
using paintcore::hashU64;
using paintcore::hashF32;
using paintcore::hashBytes;

namespace {

std::uint64_t hashString(std::uint64_t h, const std::string& s) {
    h = hashU32(h, static_cast<std::uint32_t>(s.size()));
    if (!s.empty()) h = hashBytes(h, reinterpret_cast<const std::uint8_t*>(s.data()), s.size());
    return h;
}

std::uint64_t hashColor(std::uint64_t h, const ColorRGBA& c) {
    h = hashF32(h, c.r);
    h = hashF32(h, c.g);
    h = hashF32(h, c.b);
    return hashF32(h, c.a);
}

std::uint64_t hashBrush(std::uint64_t h, const Brush& brush) {
    h = hashString(h, brush.id);
    h = hashU32(h, static_cast<std::uint32_t>(brush.category));
    const BrushSettings& st = brush.settings;
    h = hashF32(h, st.size);
    h = hashF32(h, st.minSize);
    h = hashF32(h, st.maxSize);
    h = hashF32(h, st.pressureSensitivity);
    h = hashF32(h, st.opacity);
    h = hashF32(h, st.flow);
    h = hashF32(h, st.hardness);
    h = hashF32(h, st.spacing);
    h = hashF32(h, st.smoothing);
    h = hashF32(h, st.scatter);
    h = hashF32(h, st.velocitySensitivity);
    h = hashU32(h, static_cast<std::uint32_t>(brush.pressureCurve.size()));
    for (const float v : brush.pressureCurve) h = hashF32(h, v);
    return hashU32(h, brush.tiltSupport ? 1u : 0u);
}

} // namespace

PaintEngine::DocumentDigest PaintEngine::getDocumentDigest() const noexcept {
    const auto& s = state();
    std::uint64_t h = kDigestOffset;

    h = hashU32(h, 0x4E494150u); // "PAIN" marker
    h = hashU32(h, snapshotVersionPcsn);
    h = hashU32(h, s.config.width);
    h = hashU32(h, s.config.height);
    h = hashColor(h, s.config.background);
    h = hashF32(h, s.view.zoom);
    h = hashF32(h, s.view.panX);
    h = hashF32(h, s.view.panY);
    h = hashF32(h, s.view.rotation);
    h = hashU32(h, s.layerStore.activeLayerId());

    const auto& layers = s.layerStore.layers();
    h = hashU32(h, static_cast<std::uint32_t>(layers.size()));
    for (const auto& layer : layers) {
        h = hashU32(h, layer.id);
        h = hashString(h, layer.name);
        h = hashU32(h, static_cast<std::uint32_t>(layer.kind));
        h = hashF32(h, layer.opacity);
        h = hashU32(h, static_cast<std::uint32_t>(layer.blendMode));
        h = hashU32(h, (layer.visible ? 1u : 0u) | (layer.locked ? 2u : 0u));

        h = hashU32(h, static_cast<std::uint32_t>(layer.strokes.size()));
        for (const auto& stroke : layer.strokes) {
            h = hashU32(h, stroke->id);
            h = hashU64(h, stroke->seed);
            h = hashColor(h, stroke->color);
            h = hashBrush(h, stroke->brush);
            h = hashU32(h, static_cast<std::uint32_t>(stroke->points.size()));
            for (const auto& p : stroke->points) {
                h = hashF32(h, p.x);
                h = hashF32(h, p.y);
                h = hashF32(h, p.pressure);
                h = hashF32(h, p.tiltX);
                h = hashF32(h, p.tiltY);
            }
        }
    }

    return DocumentDigest{
        static_cast<std::uint32_t>(h & 0xFFFFFFFFu),
        static_cast<std::uint32_t>((h >> 32) & 0xFFFFFFFFu)
    };
}
