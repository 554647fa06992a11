#include <gtest/gtest.h>
#include "paintcore/brush/brush_library.h"
#include "paintcore/core/util.h"
#include "paintcore/persistence/blob_store.h"
#include "paintcore/persistence/snapshot.h"
#include "tests/engine_test_common.h"

#include <memory>

using engine_test::drawLine;
using engine_test::sameDigest;

namespace {

paintcore::SnapshotData sampleDocument() {
    paintcore::SnapshotData data;
    data.width = 320;
    data.height = 200;
    data.background = ColorRGBA{0.9f, 0.9f, 0.8f, 1.0f};
    data.view.zoom = 1.5f;
    data.view.panX = -4.0f;
    data.view.rotation = 90.0f;

    Layer base;
    base.id = 1;
    base.name = "Base";
    Layer ink;
    ink.id = 4;
    ink.name = "Ink";
    ink.opacity = 0.75f;
    ink.blendMode = BlendMode::Multiply;
    ink.locked = true;

    auto stroke = std::make_shared<Stroke>();
    stroke->id = 9;
    stroke->layerId = 4;
    stroke->seed = 0x1234567890ull;
    stroke->brush = paintcore::makeDefaultBrush();
    stroke->color = ColorRGBA{0.1f, 0.2f, 0.3f, 1.0f};
    for (int i = 0; i < 3; ++i) {
        SamplePoint p{};
        p.x = 10.0f * static_cast<float>(i);
        p.y = 5.0f;
        p.pressure = 0.2f + 0.3f * static_cast<float>(i);
        p.tiltX = 15.0f;
        p.timestamp = 100u + static_cast<std::uint64_t>(i);
        stroke->points.push_back(p);
    }
    ink.strokes.push_back(stroke);

    data.layers = {base, ink};
    data.activeLayerId = 4;
    data.nextLayerId = 5;
    data.nextStrokeId = 10;
    return data;
}

} // namespace

TEST(SnapshotTest, RoundTrip) {
    const paintcore::SnapshotData data = sampleDocument();
    const auto bytes = paintcore::buildCanvasSnapshotBytes(data);

    paintcore::SnapshotData parsed;
    ASSERT_EQ(paintcore::parseCanvasSnapshot(bytes.data(), bytes.size(), parsed), EngineError::Ok);
    EXPECT_EQ(parsed.width, 320u);
    EXPECT_EQ(parsed.height, 200u);
    EXPECT_FLOAT_EQ(parsed.view.zoom, 1.5f);
    EXPECT_FLOAT_EQ(parsed.view.rotation, 90.0f);
    EXPECT_EQ(parsed.activeLayerId, 4u);
    EXPECT_EQ(parsed.nextLayerId, 5u);
    EXPECT_EQ(parsed.nextStrokeId, 10u);

    ASSERT_EQ(parsed.layers.size(), 2u);
    const Layer& ink = parsed.layers[1];
    EXPECT_EQ(ink.name, "Ink");
    EXPECT_FLOAT_EQ(ink.opacity, 0.75f);
    EXPECT_EQ(ink.blendMode, BlendMode::Multiply);
    EXPECT_TRUE(ink.locked);
    EXPECT_EQ(ink.order, 1u);
    ASSERT_EQ(ink.strokes.size(), 1u);

    const Stroke& s = *ink.strokes[0];
    EXPECT_EQ(s.id, 9u);
    EXPECT_EQ(s.seed, 0x1234567890ull);
    EXPECT_EQ(s.brush.id, "pencil");
    EXPECT_TRUE(s.brush.tiltSupport);
    ASSERT_EQ(s.points.size(), 3u);
    EXPECT_FLOAT_EQ(s.points[2].pressure, 0.8f);
    EXPECT_FLOAT_EQ(s.points[1].tiltX, 15.0f);
    EXPECT_EQ(s.points[2].timestamp, 102u);
    EXPECT_TRUE(s.bounds.valid);
    EXPECT_EQ(ink.stats.pointCount, 3u);
}

TEST(SnapshotTest, RejectsBadHeader) {
    auto bytes = paintcore::buildCanvasSnapshotBytes(sampleDocument());
    paintcore::SnapshotData out;

    EXPECT_EQ(paintcore::parseCanvasSnapshot(bytes.data(), 8, out), EngineError::BufferTruncated);
    EXPECT_EQ(paintcore::parseCanvasSnapshot(nullptr, 0, out), EngineError::BufferTruncated);

    auto badMagic = bytes;
    badMagic[0] ^= 0xFF;
    EXPECT_EQ(paintcore::parseCanvasSnapshot(badMagic.data(), badMagic.size(), out), EngineError::InvalidMagic);

    auto badVersion = bytes;
    paintcore::writeU32LE(badVersion.data(), 4, snapshotVersionPcsn + 1);
    EXPECT_EQ(paintcore::parseCanvasSnapshot(badVersion.data(), badVersion.size(), out), EngineError::UnsupportedVersion);
}

TEST(SnapshotTest, RejectsTruncatedAndCorruptPayload) {
    const auto bytes = paintcore::buildCanvasSnapshotBytes(sampleDocument());
    paintcore::SnapshotData out;
    out.width = 7;

    EXPECT_EQ(paintcore::parseCanvasSnapshot(bytes.data(), bytes.size() - 1, out), EngineError::BufferTruncated);

    auto corrupt = bytes;
    corrupt[corrupt.size() - 2] ^= 0x01;
    EXPECT_EQ(paintcore::parseCanvasSnapshot(corrupt.data(), corrupt.size(), out), EngineError::InvalidPayloadSize);
    EXPECT_EQ(out.width, 7u);
}

TEST(SnapshotTest, StrokesBindToContainingLayerAndIdsAreUnique) {
    paintcore::SnapshotData data = sampleDocument();
    auto orphan = std::make_shared<Stroke>(*data.layers[1].strokes[0]);
    orphan->id = 11;
    orphan->layerId = 99;
    data.layers[0].strokes.push_back(orphan);

    const auto bytes = paintcore::buildCanvasSnapshotBytes(data);
    paintcore::SnapshotData out;
    // The containing layer wins over the stroke's own layerId.
    ASSERT_EQ(paintcore::parseCanvasSnapshot(bytes.data(), bytes.size(), out), EngineError::Ok);
    EXPECT_EQ(out.layers[0].strokes[0]->layerId, 1u);

    orphan->id = 9;
    const auto dup = paintcore::buildCanvasSnapshotBytes(data);
    EXPECT_EQ(paintcore::parseCanvasSnapshot(dup.data(), dup.size(), out), EngineError::InvalidPayloadSize);
}

TEST(SnapshotTest, EngineRoundTripPreservesDigest) {
    PaintEngine source;
    ASSERT_EQ(drawLine(source, 10.0f, 10.0f, 100.0f), EngineError::Ok);
    const LayerInfo top = source.addLayer("Top");
    ASSERT_EQ(source.setBrush("marker"), EngineError::Ok);
    ASSERT_EQ(drawLine(source, 10.0f, 50.0f, 100.0f, 12, 0.9f), EngineError::Ok);
    source.setZoom(2.0f);

    const auto bytes = source.saveSnapshot();
    PaintEngine restored;
    ASSERT_EQ(restored.loadSnapshot(bytes.data(), bytes.size()), EngineError::Ok);

    EXPECT_TRUE(sameDigest(restored.getDocumentDigest(), source.getDocumentDigest()));
    EXPECT_EQ(restored.getState().activeLayerId, top.id);
    EXPECT_FALSE(restored.canUndo());

    RasterImage a;
    RasterImage b;
    ASSERT_EQ(source.exportImage(PixelFormat::Rgba8, 0.25f, a), EngineError::Ok);
    ASSERT_EQ(restored.exportImage(PixelFormat::Rgba8, 0.25f, b), EngineError::Ok);
    EXPECT_EQ(a.pixels, b.pixels);

    // New strokes never reuse a loaded id.
    ASSERT_EQ(drawLine(restored, 0.0f, 0.0f, 20.0f), EngineError::Ok);
    const auto strokes = restored.getLayerStrokes(top.id);
    ASSERT_EQ(strokes.size(), 2u);
    EXPECT_GT(strokes[1]->id, strokes[0]->id);
}

TEST(SnapshotTest, FailedLoadLeavesEngineUntouched) {
    PaintEngine engine;
    ASSERT_EQ(drawLine(engine, 10.0f, 10.0f, 60.0f), EngineError::Ok);
    const auto before = engine.getDocumentDigest();

    const std::uint8_t junk[32] = {1, 2, 3, 4};
    EXPECT_EQ(engine.loadSnapshot(junk, sizeof(junk)), EngineError::InvalidMagic);
    EXPECT_EQ(engine.getLastError(), EngineError::InvalidMagic);
    EXPECT_TRUE(sameDigest(engine.getDocumentDigest(), before));
    EXPECT_TRUE(engine.canUndo());
}

TEST(SnapshotTest, BlobStorePersistence) {
    PaintEngine engine;
    ASSERT_EQ(drawLine(engine, 10.0f, 10.0f, 60.0f), EngineError::Ok);

    paintcore::MemoryBlobStore store;
    ASSERT_EQ(engine.persistTo(store, "doc"), EngineError::Ok);
    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(engine.persistTo(store, ""), EngineError::InvalidArgument);

    PaintEngine other;
    EXPECT_EQ(other.restoreFrom(store, "missing"), EngineError::StorageFailed);
    ASSERT_EQ(other.restoreFrom(store, "doc"), EngineError::Ok);
    EXPECT_TRUE(sameDigest(other.getDocumentDigest(), engine.getDocumentDigest()));

    EXPECT_TRUE(store.remove("doc"));
    EXPECT_FALSE(store.remove("doc"));
}

TEST(BrushPresetTest, RoundTripKeepsSettings) {
    BrushLibrary library;
    const Brush& source = *library.find("watercolor");
    const auto bytes = paintcore::buildBrushBytes(source);
    ASSERT_GT(bytes.size(), static_cast<std::size_t>(brushHeaderBytesPcbr));

    Brush out;
    ASSERT_EQ(paintcore::parseBrushBytes(bytes.data(), bytes.size(), out), EngineError::Ok);
    EXPECT_EQ(out.id, source.id);
    EXPECT_EQ(out.name, source.name);
    EXPECT_EQ(out.category, source.category);
    EXPECT_FLOAT_EQ(out.settings.size, source.settings.size);
    EXPECT_FLOAT_EQ(out.settings.velocitySensitivity, source.settings.velocitySensitivity);
    EXPECT_EQ(out.pressureCurve.size(), source.pressureCurve.size());
}

TEST(BrushPresetTest, RejectsDamagedBytes) {
    const auto bytes = paintcore::buildBrushBytes(paintcore::makeDefaultBrush());
    Brush out;
    out.name = "untouched";

    EXPECT_EQ(paintcore::parseBrushBytes(bytes.data(), 8, out), EngineError::BufferTruncated);
    EXPECT_EQ(paintcore::parseBrushBytes(bytes.data(), bytes.size() - 1, out), EngineError::BufferTruncated);

    auto padded = bytes;
    padded.push_back(0);
    EXPECT_EQ(paintcore::parseBrushBytes(padded.data(), padded.size(), out), EngineError::InvalidPayloadSize);

    auto badMagic = bytes;
    badMagic[0] ^= 0xFF;
    EXPECT_EQ(paintcore::parseBrushBytes(badMagic.data(), badMagic.size(), out), EngineError::InvalidMagic);

    auto badVersion = bytes;
    badVersion[4] = 9;
    EXPECT_EQ(paintcore::parseBrushBytes(badVersion.data(), badVersion.size(), out), EngineError::UnsupportedVersion);

    auto corrupt = bytes;
    corrupt[corrupt.size() - 1] ^= 0x01;
    EXPECT_EQ(paintcore::parseBrushBytes(corrupt.data(), corrupt.size(), out), EngineError::InvalidPayloadSize);
    EXPECT_EQ(out.name, "untouched");
}
