#include "resolve.h"
#include "compositor.h"
#include <SDL.h>

LinearColor resolvePixel(const std::vector<LinearColor>& samples, int fsaa) {
    if (fsaa == 1 && samples.size() == 1) {
        return samples[0];
    }

    // Average premultiplied so transparent samples do not darken the color
    double sumR = 0.0, sumG = 0.0, sumB = 0.0, sumA = 0.0;
    for (const auto& sample : samples) {
        sumR += sample.r * sample.a;
        sumG += sample.g * sample.a;
        sumB += sample.b * sample.a;
        sumA += sample.a;
    }

    double count = static_cast<double>(fsaa) * fsaa;
    double alpha = sumA / count;
    if (alpha == 0.0) {
        return LinearColor::transparent();
    }

    return LinearColor(
        (sumR / count) / alpha,
        (sumG / count) / alpha,
        (sumB / count) / alpha,
        alpha
    );
}

Color encodePixel(const LinearColor& color, bool srgbOutput) {
    if (srgbOutput) {
        return quantize(encodeSrgb(color));
    }
    return quantize(color);
}

void resolveFrame(const FrameBuffer& frame, const ResolveOptions& options, ImageSurface& image) {
    int width = frame.getWidth();
    int height = frame.getHeight();
    int fsaa = frame.getFsaa();

    image.create(width, height);

    std::vector<LinearColor> samples;
    samples.reserve(static_cast<size_t>(fsaa) * fsaa);

    for (int y = 0; y < height; y++) {
        for (int x = 0; x < width; x++) {
            samples.clear();
            for (int sy = y * fsaa; sy < (y + 1) * fsaa; sy++) {
                for (int sx = x * fsaa; sx < (x + 1) * fsaa; sx++) {
                    samples.push_back(compositeSample(frame.getFragments(sx, sy), options.depthTest));
                }
            }

            image.setPixel(x, y, encodePixel(resolvePixel(samples, fsaa), options.srgbOutput));
        }
    }

    SDL_LogDebug(SDL_LOG_CATEGORY_RENDER, "Resolved %dx%d image from %zu fragments (fsaa %d)",
                 width, height, frame.getFragmentCount(), fsaa);
}
