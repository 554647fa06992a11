#ifndef PAINTCORE_RENDER_RASTER_IMAGE_H
#define PAINTCORE_RENDER_RASTER_IMAGE_H

#include <cstdint>
#include <vector>

enum class PixelFormat : std::uint8_t {
    Rgba8 = 0,              // straight alpha
    Bgra8 = 1,              // straight alpha, blue first
    PremultipliedRgba8 = 2,
};

// Tightly packed 8-bit, 4-channel raster (stride = width * 4).
struct RasterImage {
    std::uint32_t width{0};
    std::uint32_t height{0};
    PixelFormat format{PixelFormat::Rgba8};
    std::vector<std::uint8_t> pixels;

    std::size_t byteSize() const noexcept { return pixels.size(); }
    bool empty() const noexcept { return width == 0 || height == 0; }

    const std::uint8_t* pixelAt(std::uint32_t x, std::uint32_t y) const {
        return pixels.data() + (static_cast<std::size_t>(y) * width + x) * 4;
    }
};

#endif // PAINTCORE_RENDER_RASTER_IMAGE_H
