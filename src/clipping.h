// clipping.h
// Homogeneous frustum clipping for triangles

#ifndef RASTER_CLIPPING_H
#define RASTER_CLIPPING_H

#include "constants.h"
#include "vertex.h"
#include <vector>

// =============================================================================
// Frustum Clipping
// =============================================================================
//
// Triangles are clipped in clip space, before the perspective divide, against
// six homogeneous planes. A point p is inside plane n when dot(n, p) >= 0:
//
//   left    x + w >= 0        right   w - x >= 0
//   bottom  y + w >= 0        top     w - y >= 0
//   near    z     >= 0        far     w - z >= 0
//
// Planes are applied one after another; every triangle produced by one plane
// is fed to the next. Against a single plane a triangle produces:
//
//   0 vertices outside   the triangle itself
//   1 vertex outside     two triangles tiling the clipped quad
//   2 vertices outside   one smaller triangle
//   3 vertices outside   nothing
//
// Intersection vertices interpolate every attribute along with the position:
//
//   new = (d_good * bad - d_bad * good) / (d_good - d_bad)
//
// Output triangles keep the winding of the input triangle.
//
// =============================================================================

struct Triangle {
    Vertex v[3];
};

// A triangle clipped against one plane has at most 4 vertices
constexpr int MAX_CLIP_VERTICES = 4;

struct ClippedPolygon {
    Vertex vertices[MAX_CLIP_VERTICES];
    int count;  // Number of valid vertices (0 = fully clipped)
};

// Signed distance of a vertex's homogeneous position from plane 0-5
// (order as listed above)
double planeDistance(const Vertex& v, int planeIndex);

// Clip one triangle against one plane, appending 0-2 triangles to output.
// Returns false if the vertex classification is invalid (NaN
// distances); nothing is appended in that case.
bool clipTriangleAgainstPlane(const Triangle& triangle, int planeIndex,
                              std::vector<Triangle>& output);

// Clip one triangle against all six planes, appending the surviving
// triangles to output. Returns false on an invalid classification.
bool clipTriangleToFrustum(const Triangle& triangle, std::vector<Triangle>& output);

// True if a homogeneous position lies inside all six planes
bool insideFrustum(const Vec4& position);

#endif // RASTER_CLIPPING_H
