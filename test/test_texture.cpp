#include "test_framework.h"
#include "../src/texture.h"
#include "../src/image.h"

// 2x2 texture:
//   (0,0) red      (1,0) green
//   (0,1) blue     (1,1) white, half alpha
static Texture makeCheckerTexture() {
    Texture texture;
    std::vector<uint8_t> rgba = {
        255, 0, 0, 255,     0, 255, 0, 255,
        0, 0, 255, 255,     255, 255, 255, 128
    };
    texture.setPixels(2, 2, rgba);
    return texture;
}

// =============================================================================
// Setup Tests
// =============================================================================

TEST(empty_texture) {
    Texture texture;
    ASSERT(texture.isEmpty());
    ASSERT_EQ(texture.getWidth(), 0);
}

TEST(set_pixels_rejects_wrong_size) {
    Texture texture;
    std::vector<uint8_t> rgba(12, 0);
    ASSERT(!texture.setPixels(2, 2, rgba));
    ASSERT(texture.isEmpty());
    ASSERT(!texture.setPixels(0, 3, std::vector<uint8_t>()));
}

TEST(get_texel) {
    Texture texture = makeCheckerTexture();
    ASSERT(!texture.isEmpty());
    ASSERT(texture.getTexel(1, 0) == Color(0, 255, 0, 255));
    ASSERT(texture.getTexel(1, 1) == Color(255, 255, 255, 128));
}

// =============================================================================
// Sampling Tests
// =============================================================================

TEST(nearest_texel_lookup) {
    Texture texture = makeCheckerTexture();

    LinearColor c = texture.sample(0.25, 0.25);
    ASSERT_NEAR(c.r, 1.0, 1e-12);
    ASSERT_NEAR(c.g, 0.0, 1e-12);

    c = texture.sample(0.75, 0.25);
    ASSERT_NEAR(c.g, 1.0, 1e-12);

    c = texture.sample(0.25, 0.75);
    ASSERT_NEAR(c.b, 1.0, 1e-12);

    c = texture.sample(0.75, 0.75);
    ASSERT_NEAR(c.r, 1.0, 1e-12);
    ASSERT_NEAR(c.a, 128 / 255.0, 1e-12);
}

TEST(coordinates_wrap) {
    Texture texture = makeCheckerTexture();

    // 1.25 wraps to 0.25, -0.25 wraps to 0.75
    LinearColor c = texture.sample(1.25, 0.25);
    ASSERT_NEAR(c.r, 1.0, 1e-12);
    ASSERT_NEAR(c.g, 0.0, 1e-12);

    c = texture.sample(-0.25, 0.25);
    ASSERT_NEAR(c.g, 1.0, 1e-12);
    ASSERT_NEAR(c.r, 0.0, 1e-12);

    c = texture.sample(0.25, -0.25);
    ASSERT_NEAR(c.b, 1.0, 1e-12);

    // Exactly 1.0 wraps to the first texel
    c = texture.sample(1.0, 0.0);
    ASSERT_NEAR(c.r, 1.0, 1e-12);
}

TEST(sample_decodes_srgb) {
    Texture texture;
    std::vector<uint8_t> rgba = {128, 64, 0, 255};
    ASSERT(texture.setPixels(1, 1, rgba));

    LinearColor c = texture.sample(0.5, 0.5);
    ASSERT_NEAR(c.r, srgbToLinear(128 / 255.0), 1e-12);
    ASSERT_NEAR(c.g, srgbToLinear(64 / 255.0), 1e-12);
    ASSERT_NEAR(c.a, 1.0, 1e-12);
}

// =============================================================================
// File Tests
// =============================================================================

TEST(load_missing_file_fails) {
    Texture texture;
    ASSERT(!texture.load("does_not_exist_texture.png"));
    ASSERT(texture.isEmpty());
}

TEST(load_written_png) {
    ImageSurface image(3, 2);
    image.setPixel(0, 0, Color(10, 20, 30, 255));
    image.setPixel(2, 1, Color(200, 100, 50, 77));
    ASSERT(image.savePNG("test_texture_input.png"));

    Texture texture;
    ASSERT(texture.load("test_texture_input.png"));
    ASSERT_EQ(texture.getWidth(), 3);
    ASSERT_EQ(texture.getHeight(), 2);
    ASSERT(texture.getTexel(0, 0) == Color(10, 20, 30, 255));
    ASSERT(texture.getTexel(2, 1) == Color(200, 100, 50, 77));
    ASSERT(texture.getTexel(1, 0) == Color::transparent());

    std::remove("test_texture_input.png");
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::printf("Texture Unit Tests\n");
    std::printf("==================\n\n");

    std::printf("Setup tests:\n");
    RUN_TEST(empty_texture);
    RUN_TEST(set_pixels_rejects_wrong_size);
    RUN_TEST(get_texel);

    std::printf("\nSampling tests:\n");
    RUN_TEST(nearest_texel_lookup);
    RUN_TEST(coordinates_wrap);
    RUN_TEST(sample_decodes_srgb);

    std::printf("\nFile tests:\n");
    RUN_TEST(load_missing_file_fails);
    RUN_TEST(load_written_png);

    return TEST_RESULT();
}
