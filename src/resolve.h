#ifndef RASTER_RESOLVE_H
#define RASTER_RESOLVE_H

#include "color.h"
#include "frame_buffer.h"
#include "image.h"
#include <vector>

// =============================================================================
// Resolve and Output
// =============================================================================
//
// Turns the sample grid into the final image:
//
//   1. composite each sample's fragment list into one color
//   2. average the fsaa x fsaa samples of each pixel with premultiplied
//      alpha (sum rgb * a and a, divide by fsaa^2, then unpremultiply)
//   3. optionally sRGB encode rgb, then truncate every channel to 8 bits
//
// With fsaa == 1 the single sample color is used directly.
//
// =============================================================================

struct ResolveOptions {
    bool depthTest;   // Sort fragments by z before compositing
    bool srgbOutput;  // Encode rgb with the sRGB transfer function

    ResolveOptions() : depthTest(false), srgbOutput(false) {}
};

// Box-filter fsaa * fsaa composited samples into one pixel color.
// Returns transparent black if the averaged alpha is 0.
LinearColor resolvePixel(const std::vector<LinearColor>& samples, int fsaa);

// Final encoding of a resolved color
Color encodePixel(const LinearColor& color, bool srgbOutput);

// Resolve every pixel of the frame into the image. The image is (re)created
// at the frame's output size.
void resolveFrame(const FrameBuffer& frame, const ResolveOptions& options, ImageSurface& image);

#endif // RASTER_RESOLVE_H
