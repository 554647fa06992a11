#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

struct QualityControllerConfig {
    float degradeFps{45.0f};            // frames slower than this count towards degrading
    float recoverFps{55.0f};            // frames faster than this count towards recovering
    std::uint32_t degradeWindowFrames{30};
    std::uint32_t recoverWindowFrames{60};
    double minDwellMs{500.0};
    int maxLevel{3};
    std::size_t metricsWindow{60};
};

struct QualityKnobs {
    int level;
    bool predictiveStroke;
    float resolutionScale;
    float spacingQuantum;
};

struct PerformanceMetrics {
    float fps;
    float frameTimeMs;
    float renderTimeMs;
    float inputLatencyMs;
    std::uint32_t drawCalls;
    int qualityLevel;
    std::uint64_t frameCount;
};

// Frame-time observer that steps quality down under sustained load and back up
// once frames are consistently fast again. Owns no canvas data.
class QualityController {
public:
    explicit QualityController(const QualityControllerConfig& config = QualityControllerConfig{});

    // Returns true when the quality level changed.
    bool recordFrame(float frameMs);
    void recordRenderTime(float renderMs, std::uint32_t drawCalls);
    void recordInputLatency(float latencyMs);
    void reset();

    int level() const noexcept { return level_; }
    QualityKnobs knobs() const noexcept { return knobsForLevel(level_); }
    PerformanceMetrics metrics() const;
    const QualityControllerConfig& config() const noexcept { return config_; }

    static QualityKnobs knobsForLevel(int level) noexcept;

private:
    QualityControllerConfig config_;
    int level_{0};
    std::uint32_t slowStreak_{0};
    std::uint32_t fastStreak_{0};
    double timeOnLevelMs_{0.0};

    std::vector<float> frameRing_;
    std::size_t ringHead_{0};
    std::size_t ringCount_{0};
    std::uint64_t frameCount_{0};
    float lastRenderMs_{0.0f};
    float lastInputLatencyMs_{0.0f};
    std::uint32_t lastDrawCalls_{0};
};
