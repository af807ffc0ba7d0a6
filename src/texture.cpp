#include "texture.h"
#include <SDL.h>
#include <cmath>
#include <cstring>

// Include stb_image implementation in this compilation unit
#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"

bool Texture::setPixels(int w, int h, const std::vector<uint8_t>& rgba) {
    if (w <= 0 || h <= 0 || rgba.size() != static_cast<size_t>(w) * h * 4) {
        SDL_LogError(SDL_LOG_CATEGORY_RENDER,
                     "Texture data does not match %dx%d RGBA (%zu bytes)", w, h, rgba.size());
        return false;
    }

    width = w;
    height = h;
    pixels = rgba;
    return true;
}

bool Texture::load(const std::string& path) {
    int w = 0, h = 0, channels = 0;
    unsigned char* data = stbi_load(path.c_str(), &w, &h, &channels, 4);
    if (!data) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to load texture %s: %s",
                     path.c_str(), stbi_failure_reason());
        return false;
    }

    width = w;
    height = h;
    pixels.assign(static_cast<size_t>(w) * h * 4, 0);
    std::memcpy(pixels.data(), data, pixels.size());
    stbi_image_free(data);

    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "Loaded texture %s (%dx%d, %d channels)",
                 path.c_str(), w, h, channels);
    return true;
}

Color Texture::getTexel(int x, int y) const {
    size_t offset = (static_cast<size_t>(y) * width + x) * 4;
    return Color(pixels[offset + 0], pixels[offset + 1], pixels[offset + 2], pixels[offset + 3]);
}

// Wrap a coordinate into [0, 1) and map it to a texel index
static int wrapToTexel(double coord, int size) {
    double wrapped = coord - std::floor(coord);
    if (!(wrapped >= 0.0)) {
        return 0;
    }
    int index = static_cast<int>(wrapped * size);
    if (index < 0) index = 0;
    if (index >= size) index = size - 1;
    return index;
}

LinearColor Texture::sample(double s, double t) const {
    Color texel = getTexel(wrapToTexel(s, width), wrapToTexel(t, height));
    return decodeSrgbTexel(texel.r, texel.g, texel.b, texel.a);
}
