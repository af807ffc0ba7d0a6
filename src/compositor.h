#ifndef RASTER_COMPOSITOR_H
#define RASTER_COMPOSITOR_H

#include "frame_buffer.h"
#include "texture.h"
#include "vertex.h"
#include <vector>

// =============================================================================
// Fragment Compositor
// =============================================================================
//
// Fragments are accumulated per sample while drawing and composited per
// sample when the frame is resolved.
//
// Accumulation: each fragment is appended to the list of the sample at its
// rounded device position (never overwriting). With a texture bound, a second
// fragment follows it on the same sample carrying the texel color at the
// fragment's texture coordinate, converted to linear space.
//
// Compositing: optionally sort the list by z, farthest first, then apply the
// "over" operator fragment by fragment so the last fragment ends on top.
// Fragments with alpha <= 0 contribute nothing.
//
// =============================================================================

// Back-face test on a device-space triangle. The viewer looks down +z, so a
// triangle whose normal cross(b - a, c - b) has z >= 0 faces away.
bool isBackFace(const Vertex& a, const Vertex& b, const Vertex& c);

// Copy of a fragment with its color replaced by the texture sample at its
// texture coordinate; alpha comes from the texel unconverted
Vertex texturedFragment(const Vertex& fragment, const Texture& texture);

// Append a device-space fragment (plus its textured copy when a texture is
// given) to the sample it covers. Returns false if the sample is off-screen.
bool depositFragment(FrameBuffer& frame, const Vertex& fragment, const Texture* texture);

// Composite one sample's fragments into a single non-premultiplied color
LinearColor compositeSample(const std::vector<Vertex>& fragments, bool depthTest);

#endif // RASTER_COMPOSITOR_H
