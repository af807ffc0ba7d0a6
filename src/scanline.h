#ifndef RASTER_SCANLINE_H
#define RASTER_SCANLINE_H

#include "vertex.h"
#include <functional>
#include <vector>

// =============================================================================
// Scanline Triangle Fill
// =============================================================================
//
// Edge-walking fill built on a digital differential analyzer (DDA).
//
// dda(a, b, d) walks the segment a-b along dimension d. Samples land on the
// integer grid lines ceil(low) .. < high of that dimension, and every vertex
// component is stepped along with it, so attributes interpolate linearly with
// the walk. A segment with no extent in d produces nothing.
//
// scanlineTriangle() sorts the vertices by y into top, middle and bottom and
// walks the long edge (top-bottom) in y against the two short edges
// (top-middle, then middle-bottom). Each pair of samples on the same row is
// walked in x, producing one fragment per covered sample.
//
// Coverage follows the ceil rule in both dimensions: a sample is produced at
// integer (x, y) when low <= coordinate < high on each walk. For the triangle
// (0,0) (4,0) (0,4) that is every grid point with x + y < 4.
//
// The bounded forms also stop every walk at the edges of the sample grid, so
// a primitive reaching far outside the image only costs the samples inside it.
//
// =============================================================================

using FragmentCallback = std::function<void(const Vertex&)>;

// Sample grid extent: walks keep to 0 <= x < width and 0 <= y < height
struct SampleBounds {
    int width;
    int height;
};

// Samples on the segment a-b along one dimension (0 = x, 1 = y)
std::vector<Vertex> dda(const Vertex& a, const Vertex& b, int dimension);

// Same walk restricted to grid lines 0 .. < limit
std::vector<Vertex> dda(const Vertex& a, const Vertex& b, int dimension, int limit);

// Emit every fragment covered by the triangle p, q, r in generation order
void scanlineTriangle(const Vertex& p, const Vertex& q, const Vertex& r,
                      const FragmentCallback& emit);

// Emit only the fragments that land inside the sample grid
void scanlineTriangle(const Vertex& p, const Vertex& q, const Vertex& r,
                      const SampleBounds& bounds, const FragmentCallback& emit);

// Convenience form collecting the fragments into a list
std::vector<Vertex> scanlineTriangle(const Vertex& p, const Vertex& q, const Vertex& r);

#endif // RASTER_SCANLINE_H
