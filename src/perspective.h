#ifndef RASTER_PERSPECTIVE_H
#define RASTER_PERSPECTIVE_H

#include "vertex.h"

// =============================================================================
// Perspective Divide
// =============================================================================
//
// Moves clip-space vertices into device space:
//
//   1. divide by w     clip space -> normalized device space [-1, 1]
//   2. viewport map    [-1, 1]    -> [0, width) x [0, height)
//
// For perspective-correct ("hyperbolic") interpolation every attribute is
// divided by w and w itself is replaced by 1/w. All of those quantities are
// linear in screen space, so the scanline filler can interpolate them
// directly; undoDivideByW() then divides by the interpolated 1/w to recover
// the true attribute values for each fragment.
//
// Without perspective correction only the position is divided, and the
// attributes are interpolated affinely in screen space.
//
// A vertex with w == 0 has no projection. Both divide functions refuse it and
// log the vertex so bad geometry is visible instead of turning into NaNs.
//
// =============================================================================

// Divide every component by w and store 1/w in position.w.
// Returns false (and leaves v untouched) if w == 0.
bool divideByW(Vertex& v);

// Divide only x, y and z by w; attributes and w are left as they are.
// Returns false (and leaves v untouched) if w == 0.
bool dividePositionByW(Vertex& v);

// Recover true attribute values from an interpolated fragment whose
// components are all divided by w and whose position.w holds 1/w.
// The device-space x, y and z are kept; position.w becomes the true w.
Vertex undoDivideByW(const Vertex& fragment);

// Map normalized x and y from [-1, 1] to [0, width) and [0, height).
// z, w and all attributes pass through unchanged.
void toDeviceCoordinates(Vertex& v, int width, int height);

#endif // RASTER_PERSPECTIVE_H
