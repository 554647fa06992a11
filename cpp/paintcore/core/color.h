#pragma once

#include "paintcore/core/types.h"
#include <string>
#include <string_view>
#include <vector>

namespace paintcore {

struct HsbColor {
    float h; // degrees, [0, 360)
    float s; // [0, 1]
    float b; // [0, 1]
};

// Accepts "#rgb", "#rrggbb" and "#rrggbbaa" (leading '#' optional).
bool parseHexColor(std::string_view text, ColorRGBA& out);

// "#rrggbb", or "#rrggbbaa" when includeAlpha is set.
std::string toHexString(const ColorRGBA& color, bool includeAlpha = false);

HsbColor rgbToHsb(const ColorRGBA& color);

// Hue wraps into [0, 360); saturation, brightness and alpha are clamped.
ColorRGBA hsbToRgb(const HsbColor& hsb, float alpha = 1.0f);

// Clamps every channel into [0, 1]; non-finite channels become 0.
ColorRGBA sanitizeColor(const ColorRGBA& color);

// Most recent first, unique by 8-bit hex value, bounded.
class RecentColors {
public:
    explicit RecentColors(std::size_t capacity = kMaxRecentColors) : capacity_(capacity) {}

    void push(const ColorRGBA& color);
    void clear() { colors_.clear(); }
    const std::vector<ColorRGBA>& items() const noexcept { return colors_; }

private:
    std::size_t capacity_;
    std::vector<ColorRGBA> colors_;
};

} // namespace paintcore
