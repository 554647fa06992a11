#include "tests/engine_test_common.h"
#include "paintcore/core/util.h"

#include <cmath>

using engine_test::sample;

// Coarse ceilings to catch pathological regressions, not to benchmark.
namespace {
constexpr int kSamples = 2000;
constexpr double kAddPointBudgetMs = 2.0;
} // namespace

TEST(StrokePerfTest, AddPointStaysCheap) {
    PaintEngine engine;
    ASSERT_EQ(engine.startStroke(sample(0.0f, 0.0f, 0.5f)), EngineError::Ok);

    double worst = 0.0;
    for (int i = 1; i < kSamples; ++i) {
        const float fi = static_cast<float>(i);
        const double t0 = paintcore::nowMs();
        ASSERT_EQ(engine.addPoint(sample(fi * 0.5f, 100.0f + 50.0f * std::sin(fi * 0.01f), 0.5f, static_cast<std::uint64_t>(i))), EngineError::Ok);
        const double dt = paintcore::nowMs() - t0;
        if (dt > worst) worst = dt;
        if (i % 64 == 0) engine.takeStampBatch();
    }
    ASSERT_EQ(engine.endStroke(), EngineError::Ok);

    EXPECT_LT(worst, kAddPointBudgetMs * 10.0);
    EXPECT_EQ(engine.getLayerStrokes(1)[0]->points.size(), static_cast<std::size_t>(kSamples));
}

TEST(StrokePerfTest, LongJumpIsBoundedPerSegment) {
    PaintEngine engine;
    ASSERT_EQ(engine.startStroke(sample(0.0f, 0.0f, 0.0f)), EngineError::Ok);
    ASSERT_EQ(engine.addPoint(sample(1.0e7f, 0.0f, 0.0f, 1)), EngineError::Ok);
    const auto batch = engine.takeStampBatch();
    EXPECT_LE(batch.committed.size(), kMaxStampsPerSegment + 1);
    engine.abortStroke();
}

TEST(StrokePerfTest, HistoryMemoryIsCapped) {
    PaintEngine engine;
    for (int i = 0; i < 120; ++i) {
        ASSERT_EQ(engine_test::drawLine(engine, 0.0f, static_cast<float>(i), 20.0f, 2), EngineError::Ok);
    }
    EXPECT_EQ(PaintEngineTestAccessor::historyManager(engine).getHistorySize(), kHistoryCapacity);
    EXPECT_EQ(engine.getLayerStrokes(1).size(), 120u);
}
