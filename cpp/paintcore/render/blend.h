#pragma once

#include "paintcore/core/types.h"

namespace paintcore {

// Separable blend function B(Cb, Cs) on straight (non-premultiplied) channels.
float blendChannel(BlendMode mode, float cb, float cs);

// Composites a premultiplied RGBA source pixel onto a premultiplied backdrop.
void compositePixel(float* dst, const float* src, BlendMode mode);

const char* blendModeName(BlendMode mode) noexcept;

} // namespace paintcore
