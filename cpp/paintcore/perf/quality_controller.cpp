#include "paintcore/perf/quality_controller.h"
#include "paintcore/core/logging.h"

#include <algorithm>
#include <cmath>

QualityController::QualityController(const QualityControllerConfig& config)
    : config_(config) {
    config_.maxLevel = std::max(0, std::min(3, config_.maxLevel));
    config_.metricsWindow = std::max<std::size_t>(1, config_.metricsWindow);
    frameRing_.assign(config_.metricsWindow, 0.0f);
}

QualityKnobs QualityController::knobsForLevel(int level) noexcept {
    switch (level) {
        case 0: return QualityKnobs{0, true, 1.0f, 0.0f};
        case 1: return QualityKnobs{1, false, 1.0f, 0.10f};
        case 2: return QualityKnobs{2, false, 0.75f, 0.20f};
        default: return QualityKnobs{3, false, 0.5f, 0.35f};
    }
}

void QualityController::reset() {
    level_ = 0;
    slowStreak_ = 0;
    fastStreak_ = 0;
    timeOnLevelMs_ = 0.0;
    std::fill(frameRing_.begin(), frameRing_.end(), 0.0f);
    ringHead_ = 0;
    ringCount_ = 0;
    frameCount_ = 0;
    lastRenderMs_ = 0.0f;
    lastInputLatencyMs_ = 0.0f;
    lastDrawCalls_ = 0;
}

bool QualityController::recordFrame(float frameMs) {
    if (!std::isfinite(frameMs) || frameMs <= 0.0f) return false;

    frameRing_[ringHead_] = frameMs;
    ringHead_ = (ringHead_ + 1) % frameRing_.size();
    ringCount_ = std::min(ringCount_ + 1, frameRing_.size());
    ++frameCount_;
    timeOnLevelMs_ += frameMs;

    const float fps = 1000.0f / frameMs;
    if (fps < config_.degradeFps) {
        ++slowStreak_;
        fastStreak_ = 0;
    } else if (fps > config_.recoverFps) {
        ++fastStreak_;
        slowStreak_ = 0;
    } else {
        slowStreak_ = 0;
        fastStreak_ = 0;
    }

    if (timeOnLevelMs_ < config_.minDwellMs) return false;

    int next = level_;
    if (slowStreak_ >= config_.degradeWindowFrames && level_ < config_.maxLevel) {
        next = level_ + 1;
    } else if (fastStreak_ >= config_.recoverWindowFrames && level_ > 0) {
        next = level_ - 1;
    }
    if (next == level_) return false;

    PAINTCORE_LOG_DEBUG("quality level %d -> %d (fps %.1f)", level_, next, fps);
    level_ = next;
    slowStreak_ = 0;
    fastStreak_ = 0;
    timeOnLevelMs_ = 0.0;
    return true;
}

void QualityController::recordRenderTime(float renderMs, std::uint32_t drawCalls) {
    if (std::isfinite(renderMs) && renderMs >= 0.0f) lastRenderMs_ = renderMs;
    lastDrawCalls_ = drawCalls;
}

void QualityController::recordInputLatency(float latencyMs) {
    if (std::isfinite(latencyMs) && latencyMs >= 0.0f) lastInputLatencyMs_ = latencyMs;
}

PerformanceMetrics QualityController::metrics() const {
    PerformanceMetrics m{};
    float total = 0.0f;
    for (std::size_t i = 0; i < ringCount_; ++i) total += frameRing_[i];
    m.frameTimeMs = ringCount_ > 0 ? total / static_cast<float>(ringCount_) : 0.0f;
    m.fps = m.frameTimeMs > 0.0f ? 1000.0f / m.frameTimeMs : 0.0f;
    m.renderTimeMs = lastRenderMs_;
    m.inputLatencyMs = lastInputLatencyMs_;
    m.drawCalls = lastDrawCalls_;
    m.qualityLevel = level_;
    m.frameCount = frameCount_;
    return m;
}
