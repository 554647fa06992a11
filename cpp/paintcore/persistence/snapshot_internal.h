#pragma once

#include "paintcore/core/util.h"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace paintcore::snapshot::detail {

constexpr std::uint32_t fourCC(char a, char b, char c, char d) {
    return static_cast<std::uint32_t>(a)
        | (static_cast<std::uint32_t>(b) << 8)
        | (static_cast<std::uint32_t>(c) << 16)
        | (static_cast<std::uint32_t>(d) << 24);
}

constexpr std::uint32_t TAG_CANV = fourCC('C', 'A', 'N', 'V');
constexpr std::uint32_t TAG_LAYR = fourCC('L', 'A', 'Y', 'R');
constexpr std::uint32_t TAG_STRK = fourCC('S', 'T', 'R', 'K');
constexpr std::uint32_t TAG_NIDX = fourCC('N', 'I', 'D', 'X');

constexpr std::size_t canvasSectionBytes = 2 * 4 + 8 * 4;
constexpr std::size_t pointRecordBytes = 5 * 4 + 8;

constexpr std::uint32_t kLayerFlagVisible = 1u << 0;
constexpr std::uint32_t kLayerFlagLocked = 1u << 1;
constexpr std::uint32_t kBrushFlagTilt = 1u << 0;
constexpr std::uint32_t kBrushFlagCustom = 1u << 1;

inline std::uint32_t crc32(const std::uint8_t* bytes, std::size_t len) {
    static const auto table = [] {
        struct Table { std::uint32_t v[256]; } t{};
        for (std::uint32_t i = 0; i < 256; ++i) {
            std::uint32_t c = i;
            for (int k = 0; k < 8; ++k) {
                c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
            }
            t.v[i] = c;
        }
        return t;
    }();

    std::uint32_t crc = 0xFFFFFFFFu;
    for (std::size_t i = 0; i < len; ++i) {
        crc = table.v[(crc ^ bytes[i]) & 0xFF] ^ (crc >> 8);
    }
    return (crc ^ 0xFFFFFFFFu);
}

inline bool tryAdd(std::size_t a, std::size_t b, std::size_t& out) {
    if (a > (std::numeric_limits<std::size_t>::max() - b)) return false;
    out = a + b;
    return true;
}

inline bool tryMul(std::size_t a, std::size_t b, std::size_t& out) {
    if (a == 0 || b == 0) {
        out = 0;
        return true;
    }
    if (a > (std::numeric_limits<std::size_t>::max() / b)) return false;
    out = a * b;
    return true;
}

inline bool requireBytes(std::size_t offset, std::size_t size, std::size_t total) {
    if (offset > total) return false;
    return size <= (total - offset);
}

// Bounds-checked cursor over one section payload.
struct SectionReader {
    const std::uint8_t* data;
    std::size_t size;
    std::size_t o{0};

    bool u32(std::uint32_t& v) {
        if (!requireBytes(o, 4, size)) return false;
        v = readU32(data, o);
        o += 4;
        return true;
    }

    bool u64(std::uint64_t& v) {
        if (!requireBytes(o, 8, size)) return false;
        v = readU64(data, o);
        o += 8;
        return true;
    }

    bool f32(float& v) {
        if (!requireBytes(o, 4, size)) return false;
        v = readF32(data, o);
        o += 4;
        return true;
    }

    bool str(std::string& v) {
        std::uint32_t len = 0;
        if (!u32(len) || !requireBytes(o, len, size)) return false;
        v.assign(reinterpret_cast<const char*>(data + o), len);
        o += len;
        return true;
    }
};

inline void pushString(std::vector<std::uint8_t>& dst, const std::string& s) {
    pushU32(dst, static_cast<std::uint32_t>(s.size()));
    dst.insert(dst.end(), s.begin(), s.end());
}

} // namespace paintcore::snapshot::detail
