#ifndef RASTER_TEXTURE_H
#define RASTER_TEXTURE_H

#include "color.h"
#include <cstdint>
#include <string>
#include <vector>

// =============================================================================
// Texture
// =============================================================================
//
// An RGBA8 image holding sRGB texels, addressed with nearest-texel lookup.
//
// Texture coordinates wrap into [0, 1) (coord mod 1, so negative coordinates
// wrap as well). s runs across the columns, t down the rows.
//
// =============================================================================

class Texture {
public:
    Texture() : width(0), height(0) {}

    // Build from raw RGBA8 texels, row-major, 4 bytes per texel.
    // Returns false if the data size does not match width * height * 4.
    bool setPixels(int w, int h, const std::vector<uint8_t>& rgba);

    // Load an image file with stb_image, forcing 4 channels
    bool load(const std::string& path);

    bool isEmpty() const { return width == 0 || height == 0; }
    int getWidth() const { return width; }
    int getHeight() const { return height; }

    // Raw texel at integer coordinates (caller keeps them in range)
    Color getTexel(int x, int y) const;

    // Nearest texel at wrapped (s, t), converted to linear space
    LinearColor sample(double s, double t) const;

private:
    int width;
    int height;
    std::vector<uint8_t> pixels;
};

#endif // RASTER_TEXTURE_H
