#include "perspective.h"
#include <SDL.h>

// =============================================================================
// Perspective Divide Implementation
// =============================================================================

static void logInvalidW(const Vertex& v) {
    SDL_LogError(SDL_LOG_CATEGORY_RENDER,
                 "Invalid geometry: vertex (%g, %g, %g, %g) has w == 0",
                 v.position.x, v.position.y, v.position.z, v.position.w);
}

bool divideByW(Vertex& v) {
    double w = v.position.w;
    if (w == 0.0) {
        logInvalidW(v);
        return false;
    }

    v = v / w;
    v.position.w = 1.0 / w;
    return true;
}

bool dividePositionByW(Vertex& v) {
    double w = v.position.w;
    if (w == 0.0) {
        logInvalidW(v);
        return false;
    }

    v.position.x /= w;
    v.position.y /= w;
    v.position.z /= w;
    return true;
}

Vertex undoDivideByW(const Vertex& fragment) {
    // position.w holds the interpolated 1/w
    Vertex result = fragment / fragment.position.w;

    // x, y and z are already in device space and must stay there
    result.position.x = fragment.position.x;
    result.position.y = fragment.position.y;
    result.position.z = fragment.position.z;
    result.position.w = 1.0 / fragment.position.w;
    return result;
}

void toDeviceCoordinates(Vertex& v, int width, int height) {
    v.position.x = (v.position.x + 1.0) * width / 2.0;
    v.position.y = (v.position.y + 1.0) * height / 2.0;
}
