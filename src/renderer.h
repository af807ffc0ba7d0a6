#ifndef RASTER_RENDERER_H
#define RASTER_RENDERER_H

#include "clipping.h"
#include "frame_buffer.h"
#include "texture.h"
#include "vertex.h"
#include <cstddef>

// =============================================================================
// Primitive Renderer
// =============================================================================
//
// The per-primitive pipeline shared by every draw command:
//
//   1. Copy the vertices (the bound buffers are never modified)
//   2. Transform positions by the uniform matrix, if one is set
//   3. Clip against the frustum (triangles, when enabled)
//   4. Divide by w and map to device space on the sample grid
//   5. Cull back faces (triangles, when enabled)
//   6. Scanline fill, undo the divide per fragment (perspective-correct mode)
//   7. Deposit fragments, plus textured copies, into the frame buffer
//
// =============================================================================

// Mode flags that affect drawing and resolving
struct RenderModes {
    bool depthTest;        // Sort fragments by depth when resolving
    bool srgbOutput;       // sRGB encode the final image
    bool hyperbolic;       // Perspective-correct attribute interpolation
    bool cullBackfaces;    // Discard triangles facing away from the viewer
    bool frustumClipping;  // Clip triangles against the view frustum
    int fsaa;              // Samples per pixel along each axis (>= 1)

    RenderModes()
        : depthTest(false)
        , srgbOutput(false)
        , hyperbolic(false)
        , cullBackfaces(false)
        , frustumClipping(false)
        , fsaa(1)
    {}
};

// Uniform state: an optional position transform and an optional texture.
// The texture is owned by the caller and must outlive the draw calls.
struct UniformState {
    bool hasMatrix;
    Mat4 matrix;
    const Texture* texture;

    UniformState() : hasMatrix(false), matrix(Mat4::identity()), texture(nullptr) {}
};

// Everything a draw call reads; fixed for the duration of one draw call
struct RenderState {
    RenderModes modes;
    UniformState uniforms;
};

// Counters reported per draw call
struct DrawStats {
    size_t primitives;   // Triangles (after clipping) or sprites rasterized
    size_t culled;       // Triangles dropped by back-face culling
    size_t fragments;    // Fragments deposited on screen

    DrawStats() : primitives(0), culled(0), fragments(0) {}
};

// Draw one clip-space triangle. Returns false on invalid geometry.
bool drawTriangle(const RenderState& state, FrameBuffer& frame,
                  const Vertex& a, const Vertex& b, const Vertex& c, DrawStats& stats);

// Draw one point sprite: a square of side pointSize pixels centered on the
// vertex, texture coordinates (0,0) top-left to (1,1) bottom-right.
// Returns false on invalid geometry.
bool drawPointSprite(const RenderState& state, FrameBuffer& frame,
                     const Vertex& point, DrawStats& stats);

#endif // RASTER_RENDERER_H
