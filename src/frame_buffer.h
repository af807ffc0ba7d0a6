// frame_buffer.h
// Per-sample fragment lists for deferred compositing

#ifndef RASTER_FRAME_BUFFER_H
#define RASTER_FRAME_BUFFER_H

#include "vertex.h"
#include <cstddef>
#include <vector>

// =============================================================================
// Frame Buffer (Sample Grid)
// =============================================================================
//
// A grid of (width * fsaa) x (height * fsaa) samples. Fragments are not
// composited when they are drawn; each sample keeps every fragment that
// landed on it, in the order the draw calls produced them. Depth ordering and
// alpha compositing happen once, when the frame is resolved.
//
// The grid is allocated lazily on the first fragment, after the image size
// and supersampling level are known. From then on its dimensions are fixed.
//
// A sample with no fragments resolves to transparent black.
//
// =============================================================================

class FrameBuffer {
public:
    FrameBuffer();

    // Set output size and supersampling level. Has no effect once the grid
    // is allocated; returns false in that case.
    bool configure(int width, int height, int fsaa);

    bool isConfigured() const { return width > 0 && height > 0; }
    bool isAllocated() const { return !samples.empty(); }

    // Output image dimensions
    int getWidth() const { return width; }
    int getHeight() const { return height; }
    int getFsaa() const { return fsaa; }

    // Sample grid dimensions
    int getSampleWidth() const { return width * fsaa; }
    int getSampleHeight() const { return height * fsaa; }

    bool inBounds(int sx, int sy) const {
        return sx >= 0 && sx < getSampleWidth() && sy >= 0 && sy < getSampleHeight();
    }

    // Append a fragment to a sample. Out-of-bounds samples are discarded and
    // false is returned.
    bool addFragment(int sx, int sy, const Vertex& fragment);

    // Fragments at a sample in generation order (empty if out of bounds or
    // nothing was drawn)
    const std::vector<Vertex>& getFragments(int sx, int sy) const;

    // Total fragments stored
    size_t getFragmentCount() const { return fragmentCount; }

private:
    void allocate();

    int width;
    int height;
    int fsaa;
    size_t fragmentCount;

    // Row-major sample lists (empty until the first fragment)
    std::vector<std::vector<Vertex>> samples;
};

#endif // RASTER_FRAME_BUFFER_H
