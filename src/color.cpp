#include "color.h"
#include <cmath>

// =============================================================================
// Transfer functions
// =============================================================================

double srgbToLinear(double c) {
    using namespace SrgbConstants;
    if (c <= DECODE_THRESHOLD) {
        return c / LINEAR_SCALE;
    }
    return std::pow((c + OFFSET) / SCALE, GAMMA);
}

double linearToSrgb(double c) {
    using namespace SrgbConstants;
    if (c <= ENCODE_THRESHOLD) {
        return c * LINEAR_SCALE;
    }
    return std::pow(c, 1.0 / GAMMA) * SCALE - OFFSET;
}

LinearColor decodeSrgbTexel(uint8_t r, uint8_t g, uint8_t b, uint8_t a) {
    return LinearColor(
        srgbToLinear(r / 255.0),
        srgbToLinear(g / 255.0),
        srgbToLinear(b / 255.0),
        a / 255.0
    );
}

LinearColor encodeSrgb(const LinearColor& color) {
    return LinearColor(
        linearToSrgb(color.r),
        linearToSrgb(color.g),
        linearToSrgb(color.b),
        color.a
    );
}

// =============================================================================
// Quantization
// =============================================================================

static uint8_t quantizeChannel(double c) {
    double scaled = c * 255.0;
    // NaN fails both comparisons and lands on 0
    if (!(scaled > 0.0)) {
        return 0;
    }
    if (scaled >= 255.0) {
        return 255;
    }
    return static_cast<uint8_t>(scaled);
}

Color quantize(const LinearColor& color) {
    return Color(
        quantizeChannel(color.r),
        quantizeChannel(color.g),
        quantizeChannel(color.b),
        quantizeChannel(color.a)
    );
}

// =============================================================================
// Compositing
// =============================================================================

LinearColor blendOver(const LinearColor& src, const LinearColor& dst) {
    double alpha = src.a + dst.a - dst.a * src.a;
    if (!(alpha > 0.0)) {
        return LinearColor::transparent();
    }

    double dstWeight = (1.0 - src.a) * dst.a;
    return LinearColor(
        (src.a * src.r + dstWeight * dst.r) / alpha,
        (src.a * src.g + dstWeight * dst.g) / alpha,
        (src.a * src.b + dstWeight * dst.b) / alpha,
        alpha
    );
}
