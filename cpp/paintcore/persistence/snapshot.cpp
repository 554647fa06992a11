#include "paintcore/persistence/snapshot.h"
#include "paintcore/brush/brush.h"
#include "paintcore/core/logging.h"
#include "paintcore/core/util.h"
#include "paintcore/persistence/snapshot_internal.h"

#include <cmath>
#include <memory>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace {
struct SectionView {
    const std::uint8_t* data{nullptr};
    std::uint32_t size{0};
};
} // namespace

namespace paintcore {
using namespace snapshot::detail;

namespace {

void writeBrush(std::vector<std::uint8_t>& out, const Brush& brush) {
    pushString(out, brush.id);
    pushString(out, brush.name);
    pushU32(out, static_cast<std::uint32_t>(brush.category));
    std::uint32_t flags = 0;
    if (brush.tiltSupport) flags |= kBrushFlagTilt;
    if (brush.customizable) flags |= kBrushFlagCustom;
    pushU32(out, flags);
    const BrushSettings& s = brush.settings;
    const float settings[] = {s.size, s.minSize, s.maxSize, s.pressureSensitivity, s.opacity,
                              s.flow, s.hardness, s.spacing, s.smoothing, s.scatter, s.velocitySensitivity};
    for (const float v : settings) pushF32(out, v);
    pushU32(out, static_cast<std::uint32_t>(brush.pressureCurve.size()));
    for (const float v : brush.pressureCurve) pushF32(out, v);
}

bool readBrush(SectionReader& r, Brush& brush) {
    std::uint32_t category = 0;
    std::uint32_t flags = 0;
    if (!r.str(brush.id) || !r.str(brush.name) || !r.u32(category) || !r.u32(flags)) return false;
    if (category > static_cast<std::uint32_t>(BrushCategory::Eraser)) return false;
    brush.category = static_cast<BrushCategory>(category);
    brush.tiltSupport = (flags & kBrushFlagTilt) != 0;
    brush.customizable = (flags & kBrushFlagCustom) != 0;

    BrushSettings& s = brush.settings;
    float* fields[] = {&s.size, &s.minSize, &s.maxSize, &s.pressureSensitivity, &s.opacity,
                       &s.flow, &s.hardness, &s.spacing, &s.smoothing, &s.scatter, &s.velocitySensitivity};
    for (float* f : fields) {
        if (!r.f32(*f)) return false;
    }

    std::uint32_t curveCount = 0;
    if (!r.u32(curveCount)) return false;
    std::size_t curveBytes = 0;
    if (!tryMul(curveCount, 4, curveBytes) || !requireBytes(r.o, curveBytes, r.size)) return false;
    brush.pressureCurve.resize(curveCount);
    for (std::uint32_t i = 0; i < curveCount; ++i) {
        if (!r.f32(brush.pressureCurve[i])) return false;
    }
    return validateBrush(brush);
}

} // namespace

std::vector<std::uint8_t> buildCanvasSnapshotBytes(const SnapshotData& data) {
    std::vector<std::uint8_t> canv;
    canv.reserve(canvasSectionBytes);
    pushU32(canv, data.width);
    pushU32(canv, data.height);
    pushF32(canv, data.background.r);
    pushF32(canv, data.background.g);
    pushF32(canv, data.background.b);
    pushF32(canv, data.background.a);
    pushF32(canv, data.view.zoom);
    pushF32(canv, data.view.panX);
    pushF32(canv, data.view.panY);
    pushF32(canv, data.view.rotation);

    std::vector<std::uint8_t> layr;
    std::vector<std::uint8_t> strk;
    std::uint32_t strokeTotal = 0;
    pushU32(layr, static_cast<std::uint32_t>(data.layers.size()));
    for (const auto& layer : data.layers) {
        pushU32(layr, layer.id);
        pushU32(layr, static_cast<std::uint32_t>(layer.kind));
        std::uint32_t flags = 0;
        if (layer.visible) flags |= kLayerFlagVisible;
        if (layer.locked) flags |= kLayerFlagLocked;
        pushU32(layr, flags);
        pushF32(layr, layer.opacity);
        pushU32(layr, static_cast<std::uint32_t>(layer.blendMode));
        pushString(layr, layer.name);
        strokeTotal += static_cast<std::uint32_t>(layer.strokes.size());
    }

    pushU32(strk, strokeTotal);
    for (const auto& layer : data.layers) {
        for (const auto& stroke : layer.strokes) {
            pushU32(strk, stroke->id);
            pushU32(strk, layer.id);
            pushU64(strk, stroke->seed);
            pushF32(strk, stroke->color.r);
            pushF32(strk, stroke->color.g);
            pushF32(strk, stroke->color.b);
            pushF32(strk, stroke->color.a);
            writeBrush(strk, stroke->brush);
            pushU32(strk, static_cast<std::uint32_t>(stroke->points.size()));
            for (const auto& p : stroke->points) {
                pushF32(strk, p.x);
                pushF32(strk, p.y);
                pushF32(strk, p.pressure);
                pushF32(strk, p.tiltX);
                pushF32(strk, p.tiltY);
                pushU64(strk, p.timestamp);
            }
        }
    }

    std::vector<std::uint8_t> nidx;
    pushU32(nidx, data.nextLayerId);
    pushU32(nidx, data.nextStrokeId);
    pushU32(nidx, data.activeLayerId);

    struct Section {
        std::uint32_t tag;
        const std::vector<std::uint8_t>* bytes;
    };
    const Section sections[] = {
        {TAG_CANV, &canv},
        {TAG_LAYR, &layr},
        {TAG_STRK, &strk},
        {TAG_NIDX, &nidx},
    };
    constexpr std::uint32_t sectionCount = 4;

    std::vector<std::uint8_t> out;
    const std::size_t headerPlusTable = snapshotHeaderBytesPcsn + sectionCount * snapshotSectionEntryBytes;
    std::size_t total = headerPlusTable;
    for (const auto& s : sections) total += s.bytes->size();
    out.reserve(total);

    pushU32(out, snapshotMagicPcsn);
    pushU32(out, snapshotVersionPcsn);
    pushU32(out, sectionCount);
    pushU32(out, 0);

    std::uint32_t offset = static_cast<std::uint32_t>(headerPlusTable);
    for (const auto& s : sections) {
        pushU32(out, s.tag);
        pushU32(out, offset);
        pushU32(out, static_cast<std::uint32_t>(s.bytes->size()));
        pushU32(out, crc32(s.bytes->data(), s.bytes->size()));
        offset += static_cast<std::uint32_t>(s.bytes->size());
    }
    for (const auto& s : sections) {
        out.insert(out.end(), s.bytes->begin(), s.bytes->end());
    }
    return out;
}

EngineError parseCanvasSnapshot(const std::uint8_t* src, std::size_t byteCount, SnapshotData& out) {
    if (!src || byteCount < snapshotHeaderBytesPcsn) {
        return EngineError::BufferTruncated;
    }

    const std::uint32_t magic = readU32(src, 0);
    if (magic != snapshotMagicPcsn) return EngineError::InvalidMagic;

    const std::uint32_t version = readU32(src, 4);
    if (version != snapshotVersionPcsn) return EngineError::UnsupportedVersion;

    const std::uint32_t sectionCount = readU32(src, 8);
    std::size_t tableBytes = 0;
    if (!tryMul(static_cast<std::size_t>(sectionCount), snapshotSectionEntryBytes, tableBytes)) {
        return EngineError::InvalidPayloadSize;
    }
    std::size_t headerPlusTable = 0;
    if (!tryAdd(snapshotHeaderBytesPcsn, tableBytes, headerPlusTable)) {
        return EngineError::InvalidPayloadSize;
    }
    if (byteCount < headerPlusTable) {
        return EngineError::BufferTruncated;
    }

    std::unordered_map<std::uint32_t, SectionView> sections;
    sections.reserve(sectionCount);

    for (std::uint32_t i = 0; i < sectionCount; ++i) {
        const std::size_t base = snapshotHeaderBytesPcsn + i * snapshotSectionEntryBytes;
        const std::uint32_t tag = readU32(src, base + 0);
        const std::uint32_t offset = readU32(src, base + 4);
        const std::uint32_t size = readU32(src, base + 8);
        const std::uint32_t expectedCrc = readU32(src, base + 12);

        std::size_t end = 0;
        if (!tryAdd(static_cast<std::size_t>(offset), static_cast<std::size_t>(size), end)) {
            return EngineError::InvalidPayloadSize;
        }
        if (offset < headerPlusTable) return EngineError::InvalidPayloadSize;
        if (end > byteCount) return EngineError::BufferTruncated;

        const std::uint8_t* payload = src + offset;
        if (crc32(payload, size) != expectedCrc) return EngineError::InvalidPayloadSize;

        if (sections.find(tag) == sections.end()) {
            sections.emplace(tag, SectionView{payload, size});
        }
    }

    const auto findSection = [&](std::uint32_t tag) -> const SectionView* {
        auto it = sections.find(tag);
        if (it == sections.end()) return nullptr;
        return &it->second;
    };

    const SectionView* canv = findSection(TAG_CANV);
    const SectionView* layr = findSection(TAG_LAYR);
    const SectionView* strk = findSection(TAG_STRK);
    const SectionView* nidx = findSection(TAG_NIDX);
    if (!canv || !layr || !strk || !nidx) {
        return EngineError::InvalidPayloadSize;
    }

    SnapshotData data;
    data.version = version;

    // CANV
    {
        SectionReader r{canv->data, canv->size};
        const bool ok = r.u32(data.width) && r.u32(data.height)
            && r.f32(data.background.r) && r.f32(data.background.g)
            && r.f32(data.background.b) && r.f32(data.background.a)
            && r.f32(data.view.zoom) && r.f32(data.view.panX)
            && r.f32(data.view.panY) && r.f32(data.view.rotation);
        if (!ok) return EngineError::BufferTruncated;
        if (data.width == 0 || data.height == 0) return EngineError::InvalidPayloadSize;
        if (!std::isfinite(data.view.zoom) || !std::isfinite(data.view.panX)
            || !std::isfinite(data.view.panY) || !std::isfinite(data.view.rotation)) {
            return EngineError::InvalidPayloadSize;
        }
    }

    // LAYR
    std::unordered_map<std::uint32_t, std::size_t> layerIndex;
    {
        SectionReader r{layr->data, layr->size};
        std::uint32_t count = 0;
        if (!r.u32(count)) return EngineError::BufferTruncated;
        if (count == 0) return EngineError::InvalidPayloadSize;
        data.layers.reserve(count < 4096 ? count : 4096);
        for (std::uint32_t i = 0; i < count; ++i) {
            Layer layer;
            std::uint32_t kind = 0;
            std::uint32_t flags = 0;
            std::uint32_t blend = 0;
            if (!r.u32(layer.id) || !r.u32(kind) || !r.u32(flags) || !r.f32(layer.opacity)
                || !r.u32(blend) || !r.str(layer.name)) {
                return EngineError::BufferTruncated;
            }
            if (kind > static_cast<std::uint32_t>(LayerKind::Vector) || blend >= kBlendModeCount
                || !std::isfinite(layer.opacity)) {
                return EngineError::InvalidPayloadSize;
            }
            layer.kind = static_cast<LayerKind>(kind);
            layer.blendMode = static_cast<BlendMode>(blend);
            layer.visible = (flags & kLayerFlagVisible) != 0;
            layer.locked = (flags & kLayerFlagLocked) != 0;
            layer.order = i;
            if (!layerIndex.emplace(layer.id, data.layers.size()).second) return EngineError::InvalidPayloadSize;
            data.layers.push_back(std::move(layer));
        }
    }

    // STRK
    {
        SectionReader r{strk->data, strk->size};
        std::uint32_t count = 0;
        if (!r.u32(count)) return EngineError::BufferTruncated;
        std::unordered_set<std::uint32_t> strokeIds;
        for (std::uint32_t i = 0; i < count; ++i) {
            auto stroke = std::make_shared<Stroke>();
            if (!r.u32(stroke->id) || !r.u32(stroke->layerId) || !r.u64(stroke->seed)
                || !r.f32(stroke->color.r) || !r.f32(stroke->color.g)
                || !r.f32(stroke->color.b) || !r.f32(stroke->color.a)) {
                return EngineError::BufferTruncated;
            }
            if (!readBrush(r, stroke->brush)) return EngineError::InvalidPayloadSize;

            std::uint32_t pointCount = 0;
            if (!r.u32(pointCount)) return EngineError::BufferTruncated;
            std::size_t pointBytes = 0;
            if (!tryMul(pointCount, pointRecordBytes, pointBytes)) return EngineError::InvalidPayloadSize;
            if (!requireBytes(r.o, pointBytes, r.size)) return EngineError::BufferTruncated;
            if (pointCount == 0) return EngineError::InvalidPayloadSize;

            stroke->points.resize(pointCount);
            for (auto& p : stroke->points) {
                const bool ok = r.f32(p.x) && r.f32(p.y) && r.f32(p.pressure)
                    && r.f32(p.tiltX) && r.f32(p.tiltY) && r.u64(p.timestamp);
                if (!ok) return EngineError::BufferTruncated;
                if (!std::isfinite(p.x) || !std::isfinite(p.y)) return EngineError::InvalidPayloadSize;
            }

            auto it = layerIndex.find(stroke->layerId);
            if (it == layerIndex.end() || !strokeIds.insert(stroke->id).second) {
                return EngineError::InvalidPayloadSize;
            }
            stroke->bounds = computeStrokeBounds(stroke->brush, stroke->points);
            Layer& layer = data.layers[it->second];
            layer.stats.strokeCount += 1;
            layer.stats.pointCount += pointCount;
            layer.strokes.push_back(std::move(stroke));
        }
    }

    // NIDX
    {
        SectionReader r{nidx->data, nidx->size};
        if (!r.u32(data.nextLayerId) || !r.u32(data.nextStrokeId) || !r.u32(data.activeLayerId)) {
            return EngineError::BufferTruncated;
        }
        if (layerIndex.find(data.activeLayerId) == layerIndex.end()) return EngineError::InvalidPayloadSize;
    }

    out = std::move(data);
    return EngineError::Ok;
}

std::vector<std::uint8_t> buildBrushBytes(const Brush& brush) {
    std::vector<std::uint8_t> payload;
    writeBrush(payload, brush);

    std::vector<std::uint8_t> out;
    out.reserve(brushHeaderBytesPcbr + payload.size());
    pushU32(out, brushMagicPcbr);
    pushU32(out, brushVersionPcbr);
    pushU32(out, static_cast<std::uint32_t>(payload.size()));
    pushU32(out, crc32(payload.data(), payload.size()));
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

EngineError parseBrushBytes(const std::uint8_t* src, std::size_t byteCount, Brush& out) {
    if (!src || byteCount < brushHeaderBytesPcbr) return EngineError::BufferTruncated;
    if (readU32(src, 0) != brushMagicPcbr) return EngineError::InvalidMagic;
    if (readU32(src, 4) != brushVersionPcbr) return EngineError::UnsupportedVersion;

    const std::size_t size = readU32(src, 8);
    const std::size_t available = byteCount - brushHeaderBytesPcbr;
    if (available < size) return EngineError::BufferTruncated;
    if (available > size) return EngineError::InvalidPayloadSize;

    const std::uint8_t* payload = src + brushHeaderBytesPcbr;
    if (crc32(payload, size) != readU32(src, 12)) return EngineError::InvalidPayloadSize;

    SectionReader r{payload, size};
    Brush brush;
    if (!readBrush(r, brush) || r.o != size) return EngineError::InvalidPayloadSize;
    out = std::move(brush);
    return EngineError::Ok;
}

} // namespace paintcore
