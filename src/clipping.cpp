// clipping.cpp
// Homogeneous frustum clipping for triangles

#include "clipping.h"
#include <SDL.h>
#include <cmath>

// =============================================================================
// Frustum planes
// =============================================================================

static const Vec4 FRUSTUM_PLANES[FRUSTUM_PLANE_COUNT] = {
    Vec4( 1.0,  0.0,  0.0, 1.0),   // left:   x + w >= 0
    Vec4(-1.0,  0.0,  0.0, 1.0),   // right:  w - x >= 0
    Vec4( 0.0,  1.0,  0.0, 1.0),   // bottom: y + w >= 0
    Vec4( 0.0, -1.0,  0.0, 1.0),   // top:    w - y >= 0
    Vec4( 0.0,  0.0,  1.0, 0.0),   // near:   z >= 0
    Vec4( 0.0,  0.0, -1.0, 1.0),   // far:    w - z >= 0
};

double planeDistance(const Vertex& v, int planeIndex) {
    return FRUSTUM_PLANES[planeIndex].dot(v.position);
}

bool insideFrustum(const Vec4& position) {
    for (int plane = 0; plane < FRUSTUM_PLANE_COUNT; plane++) {
        if (FRUSTUM_PLANES[plane].dot(position) < 0.0) {
            return false;
        }
    }
    return true;
}

// =============================================================================
// Helper: Intersection of an edge with the plane
// =============================================================================
// good is inside (d_good >= 0), bad is outside (d_bad < 0)

static Vertex intersect(const Vertex& good, double goodDist, const Vertex& bad, double badDist) {
    return (bad * goodDist - good * badDist) / (goodDist - badDist);
}

// =============================================================================
// Clip triangle against one plane
// =============================================================================

bool clipTriangleAgainstPlane(const Triangle& triangle, int planeIndex,
                              std::vector<Triangle>& output) {
    double dist[3];
    int outside = 0;
    for (int i = 0; i < 3; i++) {
        dist[i] = planeDistance(triangle.v[i], planeIndex);
        if (std::isnan(dist[i])) {
            SDL_LogError(SDL_LOG_CATEGORY_RENDER,
                         "Invalid geometry: NaN clip distance against plane %d",
                         planeIndex);
            return false;
        }
        if (dist[i] < 0.0) {
            outside++;
        }
    }

    switch (outside) {
        case 0:
            // Fully inside this plane
            output.push_back(triangle);
            return true;
        case 3:
            // Fully outside this plane
            return true;
        case 1:
        case 2:
            break;
        default:
            SDL_LogError(SDL_LOG_CATEGORY_RENDER,
                         "Invalid clip classification: %d vertices outside plane %d",
                         outside, planeIndex);
            return false;
    }

    // Walk the edges in order so the clipped polygon keeps the input winding
    ClippedPolygon poly;
    poly.count = 0;

    for (int i = 0; i < 3; i++) {
        int next = (i + 1) % 3;
        const Vertex& current = triangle.v[i];
        const Vertex& following = triangle.v[next];

        bool currentInside = dist[i] >= 0.0;
        bool nextInside = dist[next] >= 0.0;

        if (currentInside) {
            poly.vertices[poly.count++] = current;

            if (!nextInside) {
                // Edge leaves the half-space
                poly.vertices[poly.count++] = intersect(current, dist[i], following, dist[next]);
            }
        } else if (nextInside) {
            // Edge enters the half-space
            poly.vertices[poly.count++] = intersect(following, dist[next], current, dist[i]);
        }
    }

    // One vertex outside leaves a quad, two leave a triangle
    Triangle first;
    first.v[0] = poly.vertices[0];
    first.v[1] = poly.vertices[1];
    first.v[2] = poly.vertices[2];
    output.push_back(first);

    if (poly.count == 4) {
        Triangle second;
        second.v[0] = poly.vertices[0];
        second.v[1] = poly.vertices[2];
        second.v[2] = poly.vertices[3];
        output.push_back(second);
    }

    return true;
}

// =============================================================================
// Clip triangle against the whole frustum
// =============================================================================

bool clipTriangleToFrustum(const Triangle& triangle, std::vector<Triangle>& output) {
    std::vector<Triangle> current;
    current.push_back(triangle);

    std::vector<Triangle> next;
    for (int plane = 0; plane < FRUSTUM_PLANE_COUNT; plane++) {
        next.clear();
        for (const auto& tri : current) {
            if (!clipTriangleAgainstPlane(tri, plane, next)) {
                return false;
            }
        }
        current.swap(next);

        if (current.empty()) {
            break;
        }
    }

    output.insert(output.end(), current.begin(), current.end());
    return true;
}
