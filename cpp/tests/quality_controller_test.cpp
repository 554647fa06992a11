#include <gtest/gtest.h>
#include "paintcore/perf/quality_controller.h"

#include <limits>

namespace {
constexpr float kSlowFrameMs = 33.3f; // ~30 fps
constexpr float kFastFrameMs = 16.0f; // ~62 fps
constexpr float kMidFrameMs = 20.0f;  // 50 fps, inside the hysteresis band
} // namespace

TEST(QualityControllerTest, ThirtySlowFramesDegradeOneLevel) {
    QualityController qc;
    for (int i = 0; i < 29; ++i) EXPECT_FALSE(qc.recordFrame(kSlowFrameMs));
    EXPECT_EQ(qc.level(), 0);
    EXPECT_TRUE(qc.recordFrame(kSlowFrameMs));
    EXPECT_EQ(qc.level(), 1);

    const QualityKnobs knobs = qc.knobs();
    EXPECT_FALSE(knobs.predictiveStroke);
    EXPECT_FLOAT_EQ(knobs.spacingQuantum, 0.10f);
}

TEST(QualityControllerTest, LevelIsCappedAtMax) {
    QualityController qc;
    for (int i = 0; i < 1000; ++i) qc.recordFrame(kSlowFrameMs);
    EXPECT_EQ(qc.level(), 3);
    EXPECT_FLOAT_EQ(qc.knobs().resolutionScale, 0.5f);
}

TEST(QualityControllerTest, RecoveryNeedsSixtyFastFrames) {
    QualityController qc;
    for (int i = 0; i < 30; ++i) qc.recordFrame(kSlowFrameMs);
    ASSERT_EQ(qc.level(), 1);

    for (int i = 0; i < 59; ++i) EXPECT_FALSE(qc.recordFrame(kFastFrameMs));
    EXPECT_TRUE(qc.recordFrame(kFastFrameMs));
    EXPECT_EQ(qc.level(), 0);
    EXPECT_TRUE(qc.knobs().predictiveStroke);
}

TEST(QualityControllerTest, HysteresisBandResetsStreaks) {
    QualityController qc;
    for (int i = 0; i < 29; ++i) qc.recordFrame(kSlowFrameMs);
    qc.recordFrame(kMidFrameMs);
    for (int i = 0; i < 29; ++i) qc.recordFrame(kSlowFrameMs);
    EXPECT_EQ(qc.level(), 0);
}

TEST(QualityControllerTest, DwellTimeBlocksFlapping) {
    QualityControllerConfig cfg;
    cfg.degradeWindowFrames = 2;
    cfg.minDwellMs = 500.0;
    QualityController qc(cfg);

    // Two slow frames satisfy the streak, but only ~67ms have passed.
    qc.recordFrame(kSlowFrameMs);
    EXPECT_FALSE(qc.recordFrame(kSlowFrameMs));
    EXPECT_EQ(qc.level(), 0);
    for (int i = 0; i < 14; ++i) qc.recordFrame(kSlowFrameMs);
    EXPECT_EQ(qc.level(), 1);
}

TEST(QualityControllerTest, IgnoresInvalidFrames) {
    QualityController qc;
    EXPECT_FALSE(qc.recordFrame(std::numeric_limits<float>::quiet_NaN()));
    EXPECT_FALSE(qc.recordFrame(-5.0f));
    EXPECT_FALSE(qc.recordFrame(0.0f));
    EXPECT_EQ(qc.metrics().frameCount, 0u);
}

TEST(QualityControllerTest, MetricsAverageWindow) {
    QualityController qc;
    qc.recordFrame(10.0f);
    qc.recordFrame(30.0f);
    qc.recordRenderTime(4.0f, 7);
    qc.recordInputLatency(2.5f);

    const PerformanceMetrics m = qc.metrics();
    EXPECT_FLOAT_EQ(m.frameTimeMs, 20.0f);
    EXPECT_FLOAT_EQ(m.fps, 50.0f);
    EXPECT_FLOAT_EQ(m.renderTimeMs, 4.0f);
    EXPECT_FLOAT_EQ(m.inputLatencyMs, 2.5f);
    EXPECT_EQ(m.drawCalls, 7u);
    EXPECT_EQ(m.frameCount, 2u);

    qc.reset();
    EXPECT_EQ(qc.metrics().frameCount, 0u);
    EXPECT_EQ(qc.level(), 0);
}

TEST(QualityControllerTest, KnobTable) {
    const QualityKnobs l0 = QualityController::knobsForLevel(0);
    EXPECT_TRUE(l0.predictiveStroke);
    EXPECT_FLOAT_EQ(l0.resolutionScale, 1.0f);
    EXPECT_FLOAT_EQ(l0.spacingQuantum, 0.0f);

    const QualityKnobs l2 = QualityController::knobsForLevel(2);
    EXPECT_FLOAT_EQ(l2.resolutionScale, 0.75f);
    EXPECT_FLOAT_EQ(l2.spacingQuantum, 0.20f);
}
