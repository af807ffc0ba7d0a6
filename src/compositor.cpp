#include "compositor.h"
#include "color.h"
#include <algorithm>
#include <cmath>

bool isBackFace(const Vertex& a, const Vertex& b, const Vertex& c) {
    // Only the z component of the normal matters for the view direction
    double e1x = b.position.x - a.position.x;
    double e1y = b.position.y - a.position.y;
    double e2x = c.position.x - b.position.x;
    double e2y = c.position.y - b.position.y;

    double normalZ = e1x * e2y - e1y * e2x;
    return normalZ >= 0.0;
}

Vertex texturedFragment(const Vertex& fragment, const Texture& texture) {
    Vertex result = fragment;
    result.color = texture.sample(fragment.texCoord.s, fragment.texCoord.t);
    return result;
}

bool depositFragment(FrameBuffer& frame, const Vertex& fragment, const Texture* texture) {
    // Walked positions sit on integer grid lines; round away the float noise
    long sx = std::lround(fragment.position.x);
    long sy = std::lround(fragment.position.y);
    if (sx < 0 || sx >= frame.getSampleWidth() || sy < 0 || sy >= frame.getSampleHeight()) {
        return false;
    }

    if (!frame.addFragment(static_cast<int>(sx), static_cast<int>(sy), fragment)) {
        return false;
    }

    if (texture != nullptr && !texture->isEmpty()) {
        frame.addFragment(static_cast<int>(sx), static_cast<int>(sy),
                          texturedFragment(fragment, *texture));
    }
    return true;
}

LinearColor compositeSample(const std::vector<Vertex>& fragments, bool depthTest) {
    LinearColor destination = LinearColor::transparent();
    if (fragments.empty()) {
        return destination;
    }

    const std::vector<Vertex>* ordered = &fragments;
    std::vector<Vertex> sorted;
    if (depthTest) {
        // Farthest first so the nearest fragment is composited last
        sorted = fragments;
        std::stable_sort(sorted.begin(), sorted.end(), [](const Vertex& lhs, const Vertex& rhs) {
            return lhs.position.z > rhs.position.z;
        });
        ordered = &sorted;
    }

    for (const auto& fragment : *ordered) {
        if (fragment.color.a <= 0.0) {
            continue;
        }
        destination = blendOver(fragment.color, destination);
    }
    return destination;
}
