#include <gtest/gtest.h>
#include "paintcore/brush/brush.h"
#include "paintcore/brush/brush_library.h"

namespace {
SamplePoint pointWithPressure(float pressure) {
    SamplePoint p{};
    p.pressure = pressure;
    return p;
}
} // namespace

TEST(BrushTest, DefaultPencilRadiusFollowsPressure) {
    const Brush pencil = paintcore::makeDefaultBrush();
    const float pressures[] = {0.2f, 0.8f, 0.5f};
    const float expected[] = {3.68f, 7.52f, 5.6f};

    float prev = 0.0f;
    for (int i = 0; i < 3; ++i) {
        const auto params = paintcore::deriveStampParams(pencil, pointWithPressure(pressures[i]));
        EXPECT_NEAR(params.radius, expected[i], 1e-4f);
        if (i == 1) EXPECT_GT(params.radius, prev);
        if (i == 2) EXPECT_LT(params.radius, prev);
        prev = params.radius;
    }
}

TEST(BrushTest, ZeroSensitivityIgnoresPressure) {
    Brush brush = paintcore::makeDefaultBrush();
    brush.settings.pressureSensitivity = 0.0f;

    const auto low = paintcore::deriveStampParams(brush, pointWithPressure(0.0f));
    const auto high = paintcore::deriveStampParams(brush, pointWithPressure(1.0f));
    EXPECT_FLOAT_EQ(low.radius, brush.settings.size);
    EXPECT_FLOAT_EQ(high.radius, brush.settings.size);
    EXPECT_FLOAT_EQ(low.opacity, high.opacity);
}

TEST(BrushTest, OpacityCombinesFlowAndPressure) {
    Brush brush = paintcore::makeDefaultBrush();
    brush.settings.opacity = 0.5f;
    brush.settings.flow = 0.5f;
    brush.settings.pressureSensitivity = 1.0f;

    EXPECT_NEAR(paintcore::deriveStampParams(brush, pointWithPressure(1.0f)).opacity, 0.25f, 1e-6f);
    EXPECT_NEAR(paintcore::deriveStampParams(brush, pointWithPressure(0.5f)).opacity, 0.125f, 1e-6f);
    EXPECT_FLOAT_EQ(paintcore::deriveStampParams(brush, pointWithPressure(0.0f)).opacity, 0.0f);
}

TEST(BrushTest, PressureCurveIsPiecewiseLinear) {
    const std::vector<float> curve{0.0f, 0.1f, 0.9f, 1.0f};
    EXPECT_FLOAT_EQ(paintcore::evaluatePressureCurve(curve, 0.0f), 0.0f);
    EXPECT_FLOAT_EQ(paintcore::evaluatePressureCurve(curve, 1.0f), 1.0f);
    EXPECT_NEAR(paintcore::evaluatePressureCurve(curve, 0.5f), 0.5f, 1e-6f);
    EXPECT_NEAR(paintcore::evaluatePressureCurve(curve, 1.0f / 6.0f), 0.05f, 1e-5f);

    EXPECT_FLOAT_EQ(paintcore::evaluatePressureCurve({}, 0.3f), 0.3f);
    EXPECT_FLOAT_EQ(paintcore::evaluatePressureCurve({}, 2.0f), 1.0f);
}

TEST(BrushTest, TiltFlattensStamp) {
    Brush brush = paintcore::makeDefaultBrush();
    SamplePoint p = pointWithPressure(0.5f);
    p.tiltX = 90.0f;

    const auto tilted = paintcore::deriveStampParams(brush, p);
    EXPECT_FLOAT_EQ(tilted.aspect, 0.5f);
    EXPECT_FLOAT_EQ(tilted.angle, 0.0f);

    brush.tiltSupport = false;
    EXPECT_FLOAT_EQ(paintcore::deriveStampParams(brush, p).aspect, 1.0f);
}

TEST(BrushTest, SpacingHasFloorAndQuantum) {
    const Brush brush = paintcore::makeDefaultBrush();
    EXPECT_FLOAT_EQ(paintcore::stampSpacing(brush, 1.0f, 0.0f), kMinStampSpacingPx);
    EXPECT_FLOAT_EQ(paintcore::stampSpacing(brush, 10.0f, 0.0f), 1.0f);
    EXPECT_FLOAT_EQ(paintcore::stampSpacing(brush, 10.0f, 0.35f), 3.5f);
}

TEST(BrushTest, ValidationRejectsBadSettings) {
    Brush brush = paintcore::makeDefaultBrush();
    EXPECT_TRUE(paintcore::validateBrush(brush));

    Brush inverted = brush;
    inverted.settings.minSize = 20.0f;
    EXPECT_FALSE(paintcore::validateBrush(inverted));

    Brush badOpacity = brush;
    badOpacity.settings.opacity = 1.5f;
    EXPECT_FALSE(paintcore::validateBrush(badOpacity));

    Brush badCurve = brush;
    badCurve.pressureCurve = {0.0f, -0.1f};
    EXPECT_FALSE(paintcore::validateBrush(badCurve));

    Brush noId = brush;
    noId.id.clear();
    EXPECT_FALSE(paintcore::validateBrush(noId));
}

TEST(BrushLibraryTest, BuiltinsAreValid) {
    BrushLibrary library;
    const auto all = library.all();
    EXPECT_EQ(all.size(), 16u);
    for (const auto& b : all) {
        EXPECT_TRUE(paintcore::validateBrush(b)) << b.id;
        EXPECT_FALSE(b.customizable) << b.id;
    }
    ASSERT_NE(library.find(BrushLibrary::kDefaultBrushId), nullptr);
    EXPECT_EQ(library.find("nope"), nullptr);
    EXPECT_EQ(library.byCategory(BrushCategory::Eraser).size(), 1u);
    EXPECT_EQ(library.byCategory(BrushCategory::Pencil).size(), 5u);
}

TEST(BrushLibraryTest, CustomBrushLifecycle) {
    BrushLibrary library;
    BrushSettings settings = library.find("ink-pen")->settings;
    settings.size = 6.0f;

    EngineError err = EngineError::Ok;
    const std::string id = library.createCustomBrush("ink-pen", "", settings, err);
    EXPECT_EQ(err, EngineError::Ok);
    EXPECT_EQ(id, "custom-1");

    const Brush* custom = library.find(id);
    ASSERT_NE(custom, nullptr);
    EXPECT_TRUE(custom->customizable);
    EXPECT_EQ(custom->category, BrushCategory::Ink);
    EXPECT_EQ(custom->name, "Ink Pen (Custom)");
    EXPECT_FLOAT_EQ(custom->settings.size, 6.0f);

    settings.size = 8.0f;
    EXPECT_EQ(library.updateBrushSettings(id, settings), EngineError::Ok);
    EXPECT_FLOAT_EQ(library.find(id)->settings.size, 8.0f);
    EXPECT_EQ(library.updateBrushSettings("ink-pen", settings), EngineError::InvalidBrush);

    settings.opacity = -1.0f;
    EXPECT_EQ(library.updateBrushSettings(id, settings), EngineError::InvalidArgument);

    EXPECT_EQ(library.deleteCustomBrush(id), EngineError::Ok);
    EXPECT_EQ(library.find(id), nullptr);
    EXPECT_EQ(library.deleteCustomBrush("pencil"), EngineError::InvalidBrush);
}

TEST(BrushLibraryTest, CreateFromUnknownBaseFails) {
    BrushLibrary library;
    EngineError err = EngineError::Ok;
    const std::string id = library.createCustomBrush("missing", "x", paintcore::makeDefaultBrush().settings, err);
    EXPECT_TRUE(id.empty());
    EXPECT_EQ(err, EngineError::InvalidBrush);
    EXPECT_EQ(library.customCount(), 0u);
}

TEST(BrushTest, VelocityShrinksRadius) {
    Brush brush = paintcore::makeDefaultBrush();
    brush.settings.velocitySensitivity = 0.5f;
    const SamplePoint p = pointWithPressure(0.5f);

    EXPECT_NEAR(paintcore::deriveStampParams(brush, p, 0.0f).radius, 5.6f, 1e-4f);
    EXPECT_NEAR(paintcore::deriveStampParams(brush, p, 1000.0f).radius, 4.2f, 1e-4f);
    // Speeds past saturation behave like saturation.
    EXPECT_NEAR(paintcore::deriveStampParams(brush, p, 1.0e6f).radius, 2.8f, 1e-4f);

    brush.settings.velocitySensitivity = 1.0f;
    EXPECT_FLOAT_EQ(paintcore::deriveStampParams(brush, p, 1.0e6f).radius, brush.settings.minSize);

    brush.settings.velocitySensitivity = 0.0f;
    EXPECT_NEAR(paintcore::deriveStampParams(brush, p, 1.0e6f).radius, 5.6f, 1e-4f);
}

TEST(BrushTest, ValidationRejectsVelocityOutOfRange) {
    Brush brush = paintcore::makeDefaultBrush();
    brush.settings.velocitySensitivity = 1.5f;
    EXPECT_FALSE(paintcore::validateBrush(brush));
    brush.settings.velocitySensitivity = -0.1f;
    EXPECT_FALSE(paintcore::validateBrush(brush));
}

TEST(BrushLibraryTest, ImportAssignsFreshCustomId) {
    BrushLibrary library;
    Brush incoming = *library.find("ink-pen");
    EXPECT_FLOAT_EQ(incoming.settings.velocitySensitivity, 0.4f);

    EngineError err = EngineError::Ok;
    const std::string id = library.importBrush(incoming, err);
    EXPECT_EQ(err, EngineError::Ok);
    EXPECT_EQ(id, "imported-1");
    const Brush* imported = library.find(id);
    ASSERT_NE(imported, nullptr);
    EXPECT_EQ(imported->name, "Ink Pen (Imported)");
    EXPECT_TRUE(imported->customizable);
    EXPECT_EQ(imported->category, BrushCategory::Ink);
    EXPECT_EQ(library.importBrush(incoming, err), "imported-2");

    incoming.settings.size = -3.0f;
    EXPECT_TRUE(library.importBrush(incoming, err).empty());
    EXPECT_EQ(err, EngineError::InvalidBrush);
    EXPECT_EQ(library.customCount(), 2u);
}
