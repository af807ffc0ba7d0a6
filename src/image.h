#ifndef RASTER_IMAGE_H
#define RASTER_IMAGE_H

#include "color.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// =============================================================================
// Image Surface
// =============================================================================
//
// The finished output image: width x height RGBA pixels, 8 bits per channel,
// tightly packed row by row. New surfaces start fully transparent.
//
// The pixel data is laid out the way both stb_image_write and an
// SDL_PIXELFORMAT_RGBA32 streaming texture expect it.
//
// =============================================================================

class ImageSurface {
public:
    ImageSurface();
    ImageSurface(int width, int height);

    // Reallocate to a new size, transparent
    void create(int width, int height);

    int getWidth() const { return width; }
    int getHeight() const { return height; }

    // Write a pixel (ignored when out of bounds)
    void setPixel(int x, int y, Color color);

    // Read a pixel (transparent when out of bounds)
    Color getPixel(int x, int y) const;

    bool inBounds(int x, int y) const {
        return x >= 0 && x < width && y >= 0 && y < height;
    }

    const uint8_t* getData() const { return buffer.data(); }

    // Bytes per row
    int getPitch() const { return width * OUTPUT_CHANNELS; }

    // Save to a PNG file; returns true on success
    bool savePNG(const std::string& filename) const;

private:
    size_t pixelOffset(int x, int y) const {
        return (static_cast<size_t>(y) * width + x) * OUTPUT_CHANNELS;
    }

    int width;
    int height;
    std::vector<uint8_t> buffer;
};

#endif // RASTER_IMAGE_H
