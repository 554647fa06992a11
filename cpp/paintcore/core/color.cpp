#include "paintcore/core/color.h"
#include "paintcore/core/numeric.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace paintcore {

namespace {

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
    return -1;
}

bool readByte(std::string_view s, std::size_t at, float& out) {
    const int hi = hexDigit(s[at]);
    const int lo = hexDigit(s[at + 1]);
    if (hi < 0 || lo < 0) return false;
    out = static_cast<float>(hi * 16 + lo) / 255.0f;
    return true;
}

int toByte(float v) {
    return static_cast<int>(std::lround(clamp01(v) * 255.0f));
}

} // namespace

bool parseHexColor(std::string_view text, ColorRGBA& out) {
    if (!text.empty() && text.front() == '#') text.remove_prefix(1);

    ColorRGBA c{0.0f, 0.0f, 0.0f, 1.0f};
    if (text.size() == 3) {
        float* channels[3] = {&c.r, &c.g, &c.b};
        for (std::size_t i = 0; i < 3; ++i) {
            const int d = hexDigit(text[i]);
            if (d < 0) return false;
            *channels[i] = static_cast<float>(d * 17) / 255.0f;
        }
        out = c;
        return true;
    }
    if (text.size() != 6 && text.size() != 8) return false;
    if (!readByte(text, 0, c.r) || !readByte(text, 2, c.g) || !readByte(text, 4, c.b)) return false;
    if (text.size() == 8 && !readByte(text, 6, c.a)) return false;
    out = c;
    return true;
}

std::string toHexString(const ColorRGBA& color, bool includeAlpha) {
    char buf[10];
    if (includeAlpha) {
        std::snprintf(buf, sizeof(buf), "#%02x%02x%02x%02x",
            toByte(color.r), toByte(color.g), toByte(color.b), toByte(color.a));
    } else {
        std::snprintf(buf, sizeof(buf), "#%02x%02x%02x",
            toByte(color.r), toByte(color.g), toByte(color.b));
    }
    return std::string(buf);
}

HsbColor rgbToHsb(const ColorRGBA& color) {
    const float r = clamp01(color.r);
    const float g = clamp01(color.g);
    const float b = clamp01(color.b);
    const float maxC = std::max(r, std::max(g, b));
    const float minC = std::min(r, std::min(g, b));
    const float delta = maxC - minC;

    float h = 0.0f;
    if (delta > 0.0f) {
        if (maxC == r) {
            h = (g - b) / delta + (g < b ? 6.0f : 0.0f);
        } else if (maxC == g) {
            h = (b - r) / delta + 2.0f;
        } else {
            h = (r - g) / delta + 4.0f;
        }
        h *= 60.0f;
    }
    if (h >= 360.0f) h -= 360.0f;

    return HsbColor{h, maxC > 0.0f ? delta / maxC : 0.0f, maxC};
}

ColorRGBA hsbToRgb(const HsbColor& hsb, float alpha) {
    float h = std::isfinite(hsb.h) ? std::fmod(hsb.h, 360.0f) : 0.0f;
    if (h < 0.0f) h += 360.0f;
    const float s = clamp01(hsb.s);
    const float v = clamp01(hsb.b);

    const float scaled = h / 60.0f;
    const int sector = static_cast<int>(std::floor(scaled)) % 6;
    const float f = scaled - std::floor(scaled);
    const float p = v * (1.0f - s);
    const float q = v * (1.0f - f * s);
    const float t = v * (1.0f - (1.0f - f) * s);

    switch (sector) {
        case 0: return ColorRGBA{v, t, p, clamp01(alpha)};
        case 1: return ColorRGBA{q, v, p, clamp01(alpha)};
        case 2: return ColorRGBA{p, v, t, clamp01(alpha)};
        case 3: return ColorRGBA{p, q, v, clamp01(alpha)};
        case 4: return ColorRGBA{t, p, v, clamp01(alpha)};
        default: return ColorRGBA{v, p, q, clamp01(alpha)};
    }
}

ColorRGBA sanitizeColor(const ColorRGBA& color) {
    return ColorRGBA{clamp01(color.r), clamp01(color.g), clamp01(color.b), clamp01(color.a)};
}

void RecentColors::push(const ColorRGBA& color) {
    if (capacity_ == 0) return;
    const std::string key = toHexString(color, true);
    colors_.erase(std::remove_if(colors_.begin(), colors_.end(),
        [&](const ColorRGBA& c) { return toHexString(c, true) == key; }), colors_.end());
    colors_.insert(colors_.begin(), color);
    if (colors_.size() > capacity_) colors_.resize(capacity_);
}

} // namespace paintcore
