#ifndef PAINTCORE_CORE_UTIL_H
#define PAINTCORE_CORE_UTIL_H

#include <cstdint>
#include <cstddef>
#include <cstring>
#include <vector>

#ifdef EMSCRIPTEN
#include <emscripten/emscripten.h>
#else
#include <chrono>
#endif

namespace paintcore {

// Monotonic milliseconds.
inline double nowMs() {
#ifdef EMSCRIPTEN
    return emscripten_get_now();
#else
    using namespace std::chrono;
    return duration_cast<duration<double, std::milli>>(steady_clock::now().time_since_epoch()).count();
#endif
}

inline std::uint32_t readU32(const std::uint8_t* src, std::size_t offset) noexcept {
    std::uint32_t v;
    std::memcpy(&v, src + offset, sizeof(v));
    return v;
}

inline std::uint64_t readU64(const std::uint8_t* src, std::size_t offset) noexcept {
    std::uint64_t v;
    std::memcpy(&v, src + offset, sizeof(v));
    return v;
}

inline float readF32(const std::uint8_t* src, std::size_t offset) noexcept {
    float v;
    std::memcpy(&v, src + offset, sizeof(v));
    return v;
}

inline void pushU32(std::vector<std::uint8_t>& dst, std::uint32_t v) {
    std::uint8_t b[4];
    std::memcpy(b, &v, sizeof(v));
    dst.insert(dst.end(), b, b + 4);
}

inline void pushU64(std::vector<std::uint8_t>& dst, std::uint64_t v) {
    std::uint8_t b[8];
    std::memcpy(b, &v, sizeof(v));
    dst.insert(dst.end(), b, b + 8);
}

inline void pushF32(std::vector<std::uint8_t>& dst, float v) {
    std::uint8_t b[4];
    std::memcpy(b, &v, sizeof(v));
    dst.insert(dst.end(), b, b + 4);
}

inline void writeU32LE(std::uint8_t* dst, std::size_t offset, std::uint32_t v) noexcept {
    std::memcpy(dst + offset, &v, sizeof(v));
}

} // namespace paintcore

#endif // PAINTCORE_CORE_UTIL_H
