#ifndef RASTER_COLOR_H
#define RASTER_COLOR_H

#include "vertex.h"
#include <cstdint>

// =============================================================================
// Color Conversion
// =============================================================================
//
// Colors move through the pipeline as non-premultiplied linear RGBA doubles
// (LinearColor). They enter in sRGB from textures and leave either sRGB
// encoded or raw, quantized to 8 bits per channel.
//
// Transfer functions (applied to r, g, b only, never alpha):
//
//   decode   c <= 0.04045    ? c / 12.92 : ((c + 0.055) / 1.055) ^ 2.4
//   encode   c <= 0.0031308  ? c * 12.92 : c ^ (1 / 2.4) * 1.055 - 0.055
//
// =============================================================================

// 8-bit RGBA output color
struct Color {
    uint8_t r, g, b, a;

    constexpr Color() : r(0), g(0), b(0), a(255) {}
    constexpr Color(uint8_t r_, uint8_t g_, uint8_t b_, uint8_t a_ = 255)
        : r(r_), g(g_), b(b_), a(a_) {}

    static constexpr Color transparent() { return Color(0, 0, 0, 0); }

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }
};

// Single channel transfer functions
double srgbToLinear(double c);
double linearToSrgb(double c);

// Convert the rgb channels of an 8-bit sRGB texel to linear; alpha is scaled
// to [0, 1] without conversion
LinearColor decodeSrgbTexel(uint8_t r, uint8_t g, uint8_t b, uint8_t a);

// Apply the forward transfer function to rgb, leaving alpha untouched
LinearColor encodeSrgb(const LinearColor& color);

// Quantize each channel to 8 bits by truncating c * 255 (clamped to 0-255)
Color quantize(const LinearColor& color);

// Non-premultiplied "over": src composited on top of dst
//   alpha = srcA + dstA - dstA * srcA
//   rgb   = (srcA * src + (1 - srcA) * dstA * dst) / alpha
// A result with alpha <= 0 is transparent black.
LinearColor blendOver(const LinearColor& src, const LinearColor& dst);

#endif // RASTER_COLOR_H
