#include "scanline.h"
#include <algorithm>
#include <cmath>
#include <limits>

static const double UNBOUNDED = std::numeric_limits<double>::infinity();

// =============================================================================
// DDA
// =============================================================================

// Walk a-b along one dimension, keeping to grid lines in [lowLimit, highLimit)
static std::vector<Vertex> walk(const Vertex& a, const Vertex& b, int dimension,
                                double lowLimit, double highLimit) {
    std::vector<Vertex> samples;

    double aValue = a.axis(dimension);
    double bValue = b.axis(dimension);

    // No extent in the walk dimension (horizontal edge, zero-width span)
    if (aValue == bValue) {
        return samples;
    }

    const Vertex& low = aValue < bValue ? a : b;
    const Vertex& high = aValue < bValue ? b : a;
    double lowValue = low.axis(dimension);
    double highValue = high.axis(dimension);

    Vertex step = (high - low) / (highValue - lowValue);

    // First sample on the first grid line at or after the low end, skipping
    // straight to the grid when the segment starts before it
    double start = std::max(std::ceil(lowValue), lowLimit);
    double stop = std::min(highValue, highLimit);
    if (!(start < stop)) {
        return samples;
    }
    Vertex point = low + step * (start - lowValue);

    while (point.axis(dimension) < stop) {
        samples.push_back(point);
        point += step;
    }

    return samples;
}

std::vector<Vertex> dda(const Vertex& a, const Vertex& b, int dimension) {
    return walk(a, b, dimension, -UNBOUNDED, UNBOUNDED);
}

std::vector<Vertex> dda(const Vertex& a, const Vertex& b, int dimension, int limit) {
    return walk(a, b, dimension, 0.0, static_cast<double>(limit));
}

// =============================================================================
// Scanline
// =============================================================================

static void fillTriangle(const Vertex& p, const Vertex& q, const Vertex& r,
                         const SampleBounds* bounds, const FragmentCallback& emit) {
    // Sort top to bottom by y
    Vertex sorted[3] = {p, q, r};
    std::stable_sort(sorted, sorted + 3, [](const Vertex& lhs, const Vertex& rhs) {
        return lhs.position.y < rhs.position.y;
    });

    const Vertex& top = sorted[0];
    const Vertex& middle = sorted[1];
    const Vertex& bottom = sorted[2];

    auto walkY = [bounds](const Vertex& a, const Vertex& b) {
        return bounds ? dda(a, b, DIMENSION_Y, bounds->height) : dda(a, b, DIMENSION_Y);
    };
    auto walkX = [bounds](const Vertex& a, const Vertex& b) {
        return bounds ? dda(a, b, DIMENSION_X, bounds->width) : dda(a, b, DIMENSION_X);
    };

    std::vector<Vertex> longEdge = walkY(top, bottom);
    size_t longIndex = 0;

    const std::vector<Vertex> shortEdges[2] = {
        walkY(top, middle),
        walkY(middle, bottom)
    };

    for (const auto& shortEdge : shortEdges) {
        // The short edge drives the pairing; the long edge only advances
        // when the short edge still has a row to pair with it
        for (const auto& shortSample : shortEdge) {
            if (longIndex >= longEdge.size()) {
                return;
            }
            const Vertex& longSample = longEdge[longIndex++];

            for (const auto& fragment : walkX(shortSample, longSample)) {
                emit(fragment);
            }
        }
    }
}

void scanlineTriangle(const Vertex& p, const Vertex& q, const Vertex& r,
                      const FragmentCallback& emit) {
    fillTriangle(p, q, r, nullptr, emit);
}

void scanlineTriangle(const Vertex& p, const Vertex& q, const Vertex& r,
                      const SampleBounds& bounds, const FragmentCallback& emit) {
    fillTriangle(p, q, r, &bounds, emit);
}

std::vector<Vertex> scanlineTriangle(const Vertex& p, const Vertex& q, const Vertex& r) {
    std::vector<Vertex> fragments;
    scanlineTriangle(p, q, r, [&fragments](const Vertex& fragment) {
        fragments.push_back(fragment);
    });
    return fragments;
}
