#include "paintcore/stroke/stroke_capture.h"
#include "paintcore/core/logging.h"
#include "paintcore/core/numeric.h"

#include <algorithm>
#include <cmath>

namespace paintcore {

SamplePoint sanitizeSample(const PointerSample& sample, const SamplePoint* prev) {
    SamplePoint p{};
    p.x = std::isfinite(sample.x) ? sample.x : (prev ? prev->x : 0.0f);
    p.y = std::isfinite(sample.y) ? sample.y : (prev ? prev->y : 0.0f);

    if (!sample.hasPressure || std::isnan(sample.pressure)) {
        p.pressure = kDefaultPressure;
    } else {
        p.pressure = clamp01(sample.pressure);
    }

    p.tiltX = std::isfinite(sample.tiltX) ? std::max(-kMaxTiltDegrees, std::min(kMaxTiltDegrees, sample.tiltX)) : 0.0f;
    p.tiltY = std::isfinite(sample.tiltY) ? std::max(-kMaxTiltDegrees, std::min(kMaxTiltDegrees, sample.tiltY)) : 0.0f;

    p.timestamp = sample.timestamp;
    if (prev && p.timestamp < prev->timestamp) p.timestamp = prev->timestamp;
    return p;
}

} // namespace paintcore

void StrokeCapture::begin(std::uint32_t strokeId, std::uint32_t layerId, const Brush& brush, const ColorRGBA& color,
                          std::uint64_t seed, const PointerSample& first, const Options& options) {
    abort();

    auto stroke = std::make_shared<Stroke>();
    stroke->id = strokeId;
    stroke->layerId = layerId;
    stroke->brush = brush;
    stroke->color = color;
    stroke->seed = seed;
    stroke->points.reserve(kStrokeReservePoints);
    stroke_ = std::move(stroke);

    options_ = options;
    const float smoothing = paintcore::clamp01(brush.settings.smoothing);
    windowSize_ = std::min<std::size_t>(kMaxSmoothingWindow, 1 + static_cast<std::size_t>(std::lround(smoothing * 7.0f)));
    windowCount_ = 0;
    windowHead_ = 0;
    hasRaw_ = false;

    walker_ = paintcore::StampWalker(&stroke_->brush, seed, options_.spacingQuantum);
    pendingStamps_.clear();
    pendingStamps_.reserve(kStrokeReservePoints);
    provisionalStamps_.clear();
    hasProvisional_ = false;

    addSample(first);
}

SamplePoint StrokeCapture::smooth(const SamplePoint& raw) {
    window_[windowHead_] = Point2{raw.x, raw.y};
    windowHead_ = (windowHead_ + 1) % windowSize_;
    if (windowCount_ < windowSize_) ++windowCount_;

    // Linear weights, newest sample heaviest.
    float sumX = 0.0f;
    float sumY = 0.0f;
    float sumW = 0.0f;
    for (std::size_t age = 0; age < windowCount_; ++age) {
        const std::size_t idx = (windowHead_ + windowSize_ - 1 - age) % windowSize_;
        const float w = static_cast<float>(windowCount_ - age);
        sumX += window_[idx].x * w;
        sumY += window_[idx].y * w;
        sumW += w;
    }

    SamplePoint out = raw;
    out.x = sumX / sumW;
    out.y = sumY / sumW;
    return out;
}

EngineError StrokeCapture::addSample(const PointerSample& sample) {
    if (!stroke_) return EngineError::NoActiveStroke;

    const SamplePoint raw = paintcore::sanitizeSample(sample, hasRaw_ ? &lastRaw_ : nullptr);
    lastRaw_ = raw;
    hasRaw_ = true;

    const SamplePoint point = smooth(raw);
    stroke_->points.push_back(point);
    walker_.feed(point, pendingStamps_);
    updateProvisional();
    return EngineError::Ok;
}

void StrokeCapture::updateProvisional() {
    hasProvisional_ = false;
    provisionalStamps_.clear();
    const auto& pts = stroke_->points;
    if (!options_.predictive || pts.size() < 2) return;

    const SamplePoint& last = pts[pts.size() - 1];
    const SamplePoint& prev = pts[pts.size() - 2];
    provisional_ = last;
    provisional_.x = last.x + (last.x - prev.x) * kPredictionVelocityScale;
    provisional_.y = last.y + (last.y - prev.y) * kPredictionVelocityScale;
    provisional_.pressure = last.pressure * kPredictionPressureScale;
    provisional_.timestamp = last.timestamp + kPredictionLeadMs;
    hasProvisional_ = true;

    paintcore::StampWalker fork = walker_;
    fork.feed(provisional_, provisionalStamps_);
}

void StrokeCapture::setPredictive(bool enabled) {
    options_.predictive = enabled;
    if (!enabled) {
        hasProvisional_ = false;
        provisionalStamps_.clear();
    }
}

std::shared_ptr<Stroke> StrokeCapture::finish(float simplifyTolerance) {
    if (!stroke_) return nullptr;
    std::shared_ptr<Stroke> out = std::move(stroke_);
    stroke_.reset();
    if (simplifyTolerance > 0.0f) {
        out->points = paintcore::simplifyPoints(out->points, simplifyTolerance);
    }
    out->points.shrink_to_fit();
    out->bounds = paintcore::computeStrokeBounds(out->brush, out->points);
    hasProvisional_ = false;
    provisionalStamps_.clear();
    pendingStamps_.clear();
    walker_ = paintcore::StampWalker();
    return out;
}

void StrokeCapture::abort() {
    if (stroke_) {
        PAINTCORE_LOG_DEBUG("stroke %u aborted (%zu points)", stroke_->id, stroke_->points.size());
    }
    stroke_.reset();
    hasProvisional_ = false;
    provisionalStamps_.clear();
    pendingStamps_.clear();
    walker_ = paintcore::StampWalker();
}

paintcore::StampBatch StrokeCapture::takeStampBatch() {
    paintcore::StampBatch batch;
    if (!stroke_) return batch;
    batch.strokeId = stroke_->id;
    batch.layerId = stroke_->layerId;
    batch.color = stroke_->color;
    batch.eraser = paintcore::isEraser(stroke_->brush);
    batch.committed.swap(pendingStamps_);
    pendingStamps_.reserve(batch.committed.capacity());
    batch.provisional = provisionalStamps_;
    return batch;
}

std::shared_ptr<const Stroke> StrokeCapture::previewStroke() const {
    if (!stroke_) return nullptr;
    auto copy = std::make_shared<Stroke>(*stroke_);
    if (hasProvisional_) copy->points.push_back(provisional_);
    copy->bounds = paintcore::computeStrokeBounds(copy->brush, copy->points);
    return copy;
}
