#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>

namespace paintcore {

// =============================================================================
// Scalar Helpers
// =============================================================================

inline float clamp01(float v) {
    if (!(v > 0.0f)) return 0.0f;
    return v > 1.0f ? 1.0f : v;
}

inline float lerp(float a, float b, float t) {
    return a + (b - a) * t;
}

// =============================================================================
// Digest Hashing (FNV-1a 64)
// =============================================================================

constexpr std::uint64_t kDigestOffset = 14695981039346656037ull;
constexpr std::uint64_t kDigestPrime = 1099511628211ull;

inline std::uint64_t hashU32(std::uint64_t h, std::uint32_t v) {
    h ^= v;
    return h * kDigestPrime;
}

inline std::uint64_t hashU64(std::uint64_t h, std::uint64_t v) {
    h = hashU32(h, static_cast<std::uint32_t>(v & 0xFFFFFFFFu));
    return hashU32(h, static_cast<std::uint32_t>(v >> 32));
}

inline std::uint64_t hashBytes(std::uint64_t h, const std::uint8_t* data, std::size_t len) {
    for (std::size_t i = 0; i < len; ++i) {
        h ^= data[i];
        h *= kDigestPrime;
    }
    return h;
}

inline std::uint32_t canonicalizeF32(float v) {
    if (std::isnan(v)) return 0x7fc00000u;
    if (v == 0.0f) return 0u;
    std::uint32_t bits = 0;
    std::memcpy(&bits, &v, sizeof(bits));
    return bits;
}

inline std::uint64_t hashF32(std::uint64_t h, float v) {
    return hashU32(h, canonicalizeF32(v));
}

// =============================================================================
// Deterministic Random (SplitMix64)
// =============================================================================

inline std::uint64_t splitMix64(std::uint64_t x) {
    x += 0x9E3779B97F4A7C15ull;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ull;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBull;
    return x ^ (x >> 31);
}

inline std::uint64_t splitMixSeed(std::uint64_t value, std::uint64_t salt) {
    return splitMix64(value ^ splitMix64(salt));
}

class SeededRandom {
public:
    explicit SeededRandom(std::uint64_t seed) : state_(seed) {}

    std::uint64_t nextU64() {
        state_ += 0x9E3779B97F4A7C15ull;
        std::uint64_t z = state_;
        z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ull;
        z = (z ^ (z >> 27)) * 0x94D049BB133111EBull;
        return z ^ (z >> 31);
    }

    // Uniform in [0, 1).
    float nextFloat() {
        return static_cast<float>(nextU64() >> 40) * (1.0f / 16777216.0f);
    }

private:
    std::uint64_t state_;
};

// =============================================================================
// Geometry Helpers
// =============================================================================

inline float pointToSegmentDistanceSq(float px, float py, float ax, float ay, float bx, float by) {
    const float dx = bx - ax;
    const float dy = by - ay;
    const float lenSq = dx * dx + dy * dy;
    float t = 0.0f;
    if (lenSq > 1e-12f) {
        t = ((px - ax) * dx + (py - ay) * dy) / lenSq;
        t = std::max(0.0f, std::min(1.0f, t));
    }
    const float cx = ax + t * dx - px;
    const float cy = ay + t * dy - py;
    return cx * cx + cy * cy;
}

} // namespace paintcore
