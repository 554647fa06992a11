#pragma once

#include "paintcore/brush/brush.h"
#include "paintcore/core/types.h"
#include "paintcore/stroke/stamp_walker.h"
#include "paintcore/stroke/stroke.h"

#include <array>
#include <cstdint>
#include <memory>
#include <vector>

namespace paintcore {

// Incremental render commands for the stroke being drawn.
struct StampBatch {
    std::uint32_t strokeId{0};
    std::uint32_t layerId{0};
    ColorRGBA color{0.0f, 0.0f, 0.0f, 1.0f};
    bool eraser{false};
    std::vector<Stamp> committed;   // new since the previous batch
    std::vector<Stamp> provisional; // replaced by every batch
};

// Converts a raw sample into a stroke point. prev supplies fallbacks for
// non-finite coordinates and the lower bound for the timestamp.
SamplePoint sanitizeSample(const PointerSample& sample, const SamplePoint* prev);

} // namespace paintcore

// Buffers, smooths and stamps one in-flight stroke. The capture never touches
// layers; the engine commits what finish() hands back.
class StrokeCapture {
public:
    struct Options {
        bool predictive{true};
        float spacingQuantum{0.0f};
    };

    StrokeCapture() = default;

    StrokeCapture(const StrokeCapture&) = delete;
    StrokeCapture& operator=(const StrokeCapture&) = delete;

    void begin(std::uint32_t strokeId, std::uint32_t layerId, const Brush& brush, const ColorRGBA& color,
               std::uint64_t seed, const PointerSample& first, const Options& options);
    EngineError addSample(const PointerSample& sample);

    // Returns the finished stroke (bounds computed, optionally simplified) and goes idle.
    std::shared_ptr<Stroke> finish(float simplifyTolerance);
    void abort();

    bool active() const noexcept { return stroke_ != nullptr; }
    const Stroke* inFlight() const noexcept { return stroke_.get(); }
    bool hasProvisional() const noexcept { return hasProvisional_; }
    const SamplePoint& provisionalPoint() const noexcept { return provisional_; }

    void setPredictive(bool enabled);
    void setSpacingQuantum(float quantum) { options_.spacingQuantum = quantum; }

    paintcore::StampBatch takeStampBatch();

    // In-flight points plus the provisional look-ahead, for preview rendering.
    std::shared_ptr<const Stroke> previewStroke() const;

    std::size_t smoothingWindow() const noexcept { return windowSize_; }

private:
    SamplePoint smooth(const SamplePoint& raw);
    void updateProvisional();

    std::shared_ptr<Stroke> stroke_;
    Options options_{};

    std::array<Point2, kMaxSmoothingWindow> window_{};
    std::size_t windowSize_{1};
    std::size_t windowCount_{0};
    std::size_t windowHead_{0};

    SamplePoint lastRaw_{};
    bool hasRaw_{false};

    paintcore::StampWalker walker_;
    std::vector<paintcore::Stamp> pendingStamps_;
    std::vector<paintcore::Stamp> provisionalStamps_;
    SamplePoint provisional_{};
    bool hasProvisional_{false};
};
