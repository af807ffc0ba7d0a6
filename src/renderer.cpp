#include "renderer.h"
#include "compositor.h"
#include "perspective.h"
#include "scanline.h"
#include <vector>

// =============================================================================
// Primitive Renderer Implementation
// =============================================================================

// Apply the uniform matrix to the position only
static void transformVertex(const UniformState& uniforms, Vertex& v) {
    if (uniforms.hasMatrix) {
        v.position = uniforms.matrix * v.position;
    }
}

// Divide by w (all attributes in perspective-correct mode, position only
// otherwise) and map onto the sample grid
static bool projectVertex(const RenderState& state, const FrameBuffer& frame, Vertex& v) {
    bool ok = state.modes.hyperbolic ? divideByW(v) : dividePositionByW(v);
    if (!ok) {
        return false;
    }
    toDeviceCoordinates(v, frame.getSampleWidth(), frame.getSampleHeight());
    return true;
}

// Rasterize a clipped triangle
static bool rasterizeTriangle(const RenderState& state, FrameBuffer& frame,
                              const Triangle& triangle, DrawStats& stats) {
    Vertex device[3] = {triangle.v[0], triangle.v[1], triangle.v[2]};
    for (int i = 0; i < 3; i++) {
        if (!projectVertex(state, frame, device[i])) {
            return false;
        }
    }

    if (state.modes.cullBackfaces && isBackFace(device[0], device[1], device[2])) {
        stats.culled++;
        return true;
    }

    stats.primitives++;

    bool hyperbolic = state.modes.hyperbolic;
    const Texture* texture = state.uniforms.texture;
    const SampleBounds bounds = {frame.getSampleWidth(), frame.getSampleHeight()};
    scanlineTriangle(device[0], device[1], device[2], bounds, [&](const Vertex& fragment) {
        const Vertex shaded = hyperbolic ? undoDivideByW(fragment) : fragment;
        if (depositFragment(frame, shaded, texture)) {
            stats.fragments++;
        }
    });
    return true;
}

bool drawTriangle(const RenderState& state, FrameBuffer& frame,
                  const Vertex& a, const Vertex& b, const Vertex& c, DrawStats& stats) {
    Triangle triangle;
    triangle.v[0] = a;
    triangle.v[1] = b;
    triangle.v[2] = c;
    for (int i = 0; i < 3; i++) {
        transformVertex(state.uniforms, triangle.v[i]);
    }

    if (!state.modes.frustumClipping) {
        return rasterizeTriangle(state, frame, triangle, stats);
    }

    std::vector<Triangle> clipped;
    if (!clipTriangleToFrustum(triangle, clipped)) {
        return false;
    }

    for (const auto& tri : clipped) {
        if (!rasterizeTriangle(state, frame, tri, stats)) {
            return false;
        }
    }
    return true;
}

bool drawPointSprite(const RenderState& state, FrameBuffer& frame,
                     const Vertex& point, DrawStats& stats) {
    Vertex center = point;
    transformVertex(state.uniforms, center);

    if (state.modes.frustumClipping && !insideFrustum(center.position)) {
        return true;
    }

    // Sprites are screen-aligned; attributes are constant across them
    if (!dividePositionByW(center)) {
        return false;
    }
    toDeviceCoordinates(center, frame.getSampleWidth(), frame.getSampleHeight());

    double half = center.pointSize * frame.getFsaa() / 2.0;
    if (half <= 0.0) {
        return true;
    }

    Vertex topLeft = center;
    topLeft.position.x -= half;
    topLeft.position.y -= half;
    topLeft.texCoord = TexCoord(0.0, 0.0);

    Vertex topRight = center;
    topRight.position.x += half;
    topRight.position.y -= half;
    topRight.texCoord = TexCoord(1.0, 0.0);

    Vertex bottomRight = center;
    bottomRight.position.x += half;
    bottomRight.position.y += half;
    bottomRight.texCoord = TexCoord(1.0, 1.0);

    Vertex bottomLeft = center;
    bottomLeft.position.x -= half;
    bottomLeft.position.y += half;
    bottomLeft.texCoord = TexCoord(0.0, 1.0);

    stats.primitives++;

    const Texture* texture = state.uniforms.texture;
    auto deposit = [&](const Vertex& fragment) {
        if (depositFragment(frame, fragment, texture)) {
            stats.fragments++;
        }
    };
    const SampleBounds bounds = {frame.getSampleWidth(), frame.getSampleHeight()};
    scanlineTriangle(topLeft, topRight, bottomRight, bounds, deposit);
    scanlineTriangle(topLeft, bottomRight, bottomLeft, bounds, deposit);
    return true;
}
