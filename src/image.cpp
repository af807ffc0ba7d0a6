#include "image.h"
#include <SDL.h>

// Include stb_image_write implementation in this compilation unit
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"

ImageSurface::ImageSurface() : width(0), height(0) {}

ImageSurface::ImageSurface(int w, int h) : width(0), height(0) {
    create(w, h);
}

void ImageSurface::create(int w, int h) {
    width = w > 0 ? w : 0;
    height = h > 0 ? h : 0;
    buffer.assign(static_cast<size_t>(width) * height * OUTPUT_CHANNELS, 0);
}

void ImageSurface::setPixel(int x, int y, Color color) {
    if (!inBounds(x, y)) {
        return;
    }

    size_t offset = pixelOffset(x, y);
    buffer[offset + 0] = color.r;
    buffer[offset + 1] = color.g;
    buffer[offset + 2] = color.b;
    buffer[offset + 3] = color.a;
}

Color ImageSurface::getPixel(int x, int y) const {
    if (!inBounds(x, y)) {
        return Color::transparent();
    }

    size_t offset = pixelOffset(x, y);
    return Color(
        buffer[offset + 0],
        buffer[offset + 1],
        buffer[offset + 2],
        buffer[offset + 3]
    );
}

bool ImageSurface::savePNG(const std::string& filename) const {
    if (width == 0 || height == 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Cannot save empty image to %s",
                     filename.c_str());
        return false;
    }

    // stbi_write_png expects: filename, width, height, components, data, stride
    int result = stbi_write_png(
        filename.c_str(),
        width,
        height,
        OUTPUT_CHANNELS,
        buffer.data(),
        getPitch()
    );
    if (result == 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to write %s", filename.c_str());
        return false;
    }
    return true;
}
