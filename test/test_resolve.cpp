#include "test_framework.h"
#include "../src/resolve.h"

static Vertex fragment(double x, double y, const LinearColor& color) {
    Vertex v;
    v.position = Vec4(x, y, 0.0, 1.0);
    v.color = color;
    return v;
}

// =============================================================================
// Pixel Tests
// =============================================================================

TEST(single_sample_passes_through) {
    std::vector<LinearColor> samples = {LinearColor(0.3, 0.6, 0.9, 0.25)};
    LinearColor c = resolvePixel(samples, 1);
    ASSERT_NEAR(c.r, 0.3, 1e-12);
    ASSERT_NEAR(c.a, 0.25, 1e-12);
}

TEST(uniform_samples_average_to_themselves) {
    std::vector<LinearColor> samples(4, LinearColor(1.0, 0.5, 0.0, 1.0));
    LinearColor c = resolvePixel(samples, 2);
    ASSERT_NEAR(c.r, 1.0, 1e-12);
    ASSERT_NEAR(c.g, 0.5, 1e-12);
    ASSERT_NEAR(c.a, 1.0, 1e-12);
}

TEST(transparent_samples_do_not_darken) {
    std::vector<LinearColor> samples = {
        LinearColor(1.0, 0.0, 0.0, 1.0),
        LinearColor(1.0, 0.0, 0.0, 1.0),
        LinearColor::transparent(),
        LinearColor::transparent()
    };
    LinearColor c = resolvePixel(samples, 2);
    ASSERT_NEAR(c.r, 1.0, 1e-12);
    ASSERT_NEAR(c.a, 0.5, 1e-12);
}

TEST(premultiplied_average) {
    std::vector<LinearColor> samples = {
        LinearColor(1.0, 0.0, 0.0, 1.0),
        LinearColor(0.0, 0.0, 1.0, 0.5),
        LinearColor::transparent(),
        LinearColor::transparent()
    };
    LinearColor c = resolvePixel(samples, 2);
    ASSERT_NEAR(c.a, 1.5 / 4.0, 1e-12);
    ASSERT_NEAR(c.r, (1.0 / 4.0) / (1.5 / 4.0), 1e-12);
    ASSERT_NEAR(c.b, (0.5 / 4.0) / (1.5 / 4.0), 1e-12);
}

TEST(all_transparent_is_transparent) {
    std::vector<LinearColor> samples(9, LinearColor::transparent());
    LinearColor c = resolvePixel(samples, 3);
    ASSERT_NEAR(c.a, 0.0, 1e-12);
    ASSERT_NEAR(c.r, 0.0, 1e-12);
}

TEST(encode_pixel_raw_and_srgb) {
    LinearColor c(0.5, 0.0, 1.0, 0.5);

    Color raw = encodePixel(c, false);
    ASSERT(raw == Color(127, 0, 255, 127));

    Color srgb = encodePixel(c, true);
    ASSERT_EQ(srgb.r, 187);
    ASSERT_EQ(srgb.g, 0);
    ASSERT_EQ(srgb.a, 127);
}

// =============================================================================
// Frame Tests
// =============================================================================

TEST(unconfigured_frame_resolves_to_empty_image) {
    FrameBuffer frame;
    ImageSurface image(3, 3);
    resolveFrame(frame, ResolveOptions(), image);
    ASSERT_EQ(image.getWidth(), 0);
    ASSERT_EQ(image.getHeight(), 0);
}

TEST(untouched_pixels_are_transparent) {
    FrameBuffer frame;
    frame.configure(3, 2, 1);
    frame.addFragment(0, 0, fragment(0, 0, LinearColor(0, 1, 0)));

    ImageSurface image;
    resolveFrame(frame, ResolveOptions(), image);
    ASSERT_EQ(image.getWidth(), 3);
    ASSERT_EQ(image.getHeight(), 2);
    ASSERT(image.getPixel(0, 0) == Color(0, 255, 0, 255));
    ASSERT(image.getPixel(2, 1) == Color::transparent());
}

TEST(supersampled_coverage) {
    FrameBuffer frame;
    frame.configure(2, 1, 2);
    ASSERT_EQ(frame.getSampleWidth(), 4);
    ASSERT_EQ(frame.getSampleHeight(), 2);

    // Pixel 0 fully covered in red
    for (int sy = 0; sy < 2; sy++) {
        for (int sx = 0; sx < 2; sx++) {
            ASSERT(frame.addFragment(sx, sy, fragment(sx, sy, LinearColor(1, 0, 0))));
        }
    }
    // Pixel 1 half covered in white
    frame.addFragment(2, 0, fragment(2, 0, LinearColor(1, 1, 1)));
    frame.addFragment(3, 1, fragment(3, 1, LinearColor(1, 1, 1)));

    ImageSurface image;
    resolveFrame(frame, ResolveOptions(), image);
    ASSERT(image.getPixel(0, 0) == Color(255, 0, 0, 255));
    ASSERT(image.getPixel(1, 0) == Color(255, 255, 255, 127));
}

TEST(depth_option_reaches_compositor) {
    FrameBuffer frame;
    frame.configure(1, 1, 1);
    Vertex nearer = fragment(0, 0, LinearColor(1, 0, 0));
    nearer.position.z = 0.1;
    Vertex farther = fragment(0, 0, LinearColor(0, 0, 1));
    farther.position.z = 0.9;
    frame.addFragment(0, 0, nearer);
    frame.addFragment(0, 0, farther);

    ImageSurface image;
    ResolveOptions options;
    resolveFrame(frame, options, image);
    ASSERT(image.getPixel(0, 0) == Color(0, 0, 255, 255));

    options.depthTest = true;
    resolveFrame(frame, options, image);
    ASSERT(image.getPixel(0, 0) == Color(255, 0, 0, 255));
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::printf("Resolve Unit Tests\n");
    std::printf("==================\n\n");

    std::printf("Pixel tests:\n");
    RUN_TEST(single_sample_passes_through);
    RUN_TEST(uniform_samples_average_to_themselves);
    RUN_TEST(transparent_samples_do_not_darken);
    RUN_TEST(premultiplied_average);
    RUN_TEST(all_transparent_is_transparent);
    RUN_TEST(encode_pixel_raw_and_srgb);

    std::printf("\nFrame tests:\n");
    RUN_TEST(unconfigured_frame_resolves_to_empty_image);
    RUN_TEST(untouched_pixels_are_transparent);
    RUN_TEST(supersampled_coverage);
    RUN_TEST(depth_option_reaches_compositor);

    return TEST_RESULT();
}
