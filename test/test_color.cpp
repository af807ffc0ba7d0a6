#include "test_framework.h"
#include "../src/color.h"
#include <limits>

// =============================================================================
// Color Tests
// =============================================================================

TEST(color_default_is_opaque_black) {
    Color c;
    ASSERT_EQ(c.r, 0);
    ASSERT_EQ(c.g, 0);
    ASSERT_EQ(c.b, 0);
    ASSERT_EQ(c.a, 255);
    ASSERT(Color::transparent() != c);
    ASSERT(Color::transparent() == Color(0, 0, 0, 0));
}

// =============================================================================
// Transfer Function Tests
// =============================================================================

TEST(srgb_endpoints) {
    ASSERT_NEAR(srgbToLinear(0.0), 0.0, 1e-12);
    ASSERT_NEAR(srgbToLinear(1.0), 1.0, 1e-12);
    ASSERT_NEAR(linearToSrgb(0.0), 0.0, 1e-12);
    ASSERT_NEAR(linearToSrgb(1.0), 1.0, 1e-12);
}

TEST(srgb_linear_segment) {
    ASSERT_NEAR(srgbToLinear(0.04), 0.04 / 12.92, 1e-12);
    ASSERT_NEAR(linearToSrgb(0.003), 0.003 * 12.92, 1e-12);
}

TEST(srgb_known_values) {
    ASSERT_NEAR(srgbToLinear(0.5), 0.214041, 1e-6);
    ASSERT_NEAR(linearToSrgb(0.5), 0.735357, 1e-6);
}

TEST(srgb_round_trip) {
    for (int i = 0; i <= 20; i++) {
        double c = i / 20.0;
        ASSERT_NEAR(linearToSrgb(srgbToLinear(c)), c, 1e-9);
    }
}

TEST(texel_decode_leaves_alpha_linear) {
    LinearColor c = decodeSrgbTexel(255, 0, 128, 128);
    ASSERT_NEAR(c.r, 1.0, 1e-12);
    ASSERT_NEAR(c.g, 0.0, 1e-12);
    ASSERT_NEAR(c.b, srgbToLinear(128 / 255.0), 1e-12);
    ASSERT_NEAR(c.a, 128 / 255.0, 1e-12);
}

TEST(encode_leaves_alpha_untouched) {
    LinearColor c = encodeSrgb(LinearColor(0.5, 0.5, 0.5, 0.5));
    ASSERT_NEAR(c.r, linearToSrgb(0.5), 1e-12);
    ASSERT_NEAR(c.a, 0.5, 1e-12);
}

// =============================================================================
// Quantization Tests
// =============================================================================

TEST(quantize_truncates) {
    Color c = quantize(LinearColor(1.0, 0.5, 0.999, 0.0));
    ASSERT_EQ(c.r, 255);
    ASSERT_EQ(c.g, 127);
    ASSERT_EQ(c.b, 254);
    ASSERT_EQ(c.a, 0);
}

TEST(quantize_clamps) {
    double nan = std::numeric_limits<double>::quiet_NaN();
    Color c = quantize(LinearColor(1.5, -0.5, nan, 2.0));
    ASSERT_EQ(c.r, 255);
    ASSERT_EQ(c.g, 0);
    ASSERT_EQ(c.b, 0);
    ASSERT_EQ(c.a, 255);
}

// =============================================================================
// Blend Tests
// =============================================================================

TEST(opaque_over_anything_is_source) {
    LinearColor src(0.2, 0.4, 0.6, 1.0);
    LinearColor out = blendOver(src, LinearColor(1.0, 1.0, 1.0, 1.0));
    ASSERT_NEAR(out.r, 0.2, 1e-12);
    ASSERT_NEAR(out.g, 0.4, 1e-12);
    ASSERT_NEAR(out.b, 0.6, 1e-12);
    ASSERT_NEAR(out.a, 1.0, 1e-12);
}

TEST(over_transparent_is_source) {
    LinearColor src(0.2, 0.4, 0.6, 0.3);
    LinearColor out = blendOver(src, LinearColor::transparent());
    ASSERT_NEAR(out.r, 0.2, 1e-12);
    ASSERT_NEAR(out.b, 0.6, 1e-12);
    ASSERT_NEAR(out.a, 0.3, 1e-12);
}

TEST(half_over_opaque) {
    LinearColor out = blendOver(LinearColor(1.0, 0.0, 0.0, 0.5), LinearColor(0.0, 0.0, 1.0, 1.0));
    ASSERT_NEAR(out.r, 0.5, 1e-12);
    ASSERT_NEAR(out.g, 0.0, 1e-12);
    ASSERT_NEAR(out.b, 0.5, 1e-12);
    ASSERT_NEAR(out.a, 1.0, 1e-12);
}

TEST(half_over_half) {
    LinearColor out = blendOver(LinearColor(1.0, 0.0, 0.0, 0.5), LinearColor(0.0, 0.0, 1.0, 0.5));
    ASSERT_NEAR(out.a, 0.75, 1e-12);
    ASSERT_NEAR(out.r, 0.5 / 0.75, 1e-12);
    ASSERT_NEAR(out.b, 0.25 / 0.75, 1e-12);
}

TEST(zero_alpha_result_is_transparent) {
    LinearColor out = blendOver(LinearColor(1.0, 1.0, 1.0, 0.0), LinearColor(1.0, 1.0, 1.0, 0.0));
    ASSERT_NEAR(out.r, 0.0, 1e-12);
    ASSERT_NEAR(out.a, 0.0, 1e-12);
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::printf("Color Unit Tests\n");
    std::printf("================\n\n");

    RUN_TEST(color_default_is_opaque_black);

    std::printf("\nTransfer function tests:\n");
    RUN_TEST(srgb_endpoints);
    RUN_TEST(srgb_linear_segment);
    RUN_TEST(srgb_known_values);
    RUN_TEST(srgb_round_trip);
    RUN_TEST(texel_decode_leaves_alpha_linear);
    RUN_TEST(encode_leaves_alpha_untouched);

    std::printf("\nQuantization tests:\n");
    RUN_TEST(quantize_truncates);
    RUN_TEST(quantize_clamps);

    std::printf("\nBlend tests:\n");
    RUN_TEST(opaque_over_anything_is_source);
    RUN_TEST(over_transparent_is_source);
    RUN_TEST(half_over_opaque);
    RUN_TEST(half_over_half);
    RUN_TEST(zero_alpha_result_is_transparent);

    return TEST_RESULT();
}
