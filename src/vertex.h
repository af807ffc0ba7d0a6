#ifndef RASTER_VERTEX_H
#define RASTER_VERTEX_H

#include "constants.h"

// =============================================================================
// Vertex and Matrix Math
// =============================================================================
//
// A vertex is a fixed 11-component record of doubles:
//
//   position       (x, y, z, w)   default (0, 0, 0, 1)
//   color          (r, g, b, a)   default (0, 0, 0, 1)
//   texture coord  (s, t)         default (0, 0)
//   point size     (size)         default 0
//
// Everything the pipeline interpolates (clip intersections, edge walks,
// perspective divide) is whole-record arithmetic, so the arithmetic operators
// below always touch every component.
//
// =============================================================================

// =============================================================================
// Vec4 - Homogeneous position
// =============================================================================

struct Vec4 {
    double x, y, z, w;

    constexpr Vec4() : x(0.0), y(0.0), z(0.0), w(1.0) {}
    constexpr Vec4(double x_, double y_, double z_, double w_)
        : x(x_), y(y_), z(z_), w(w_) {}

    constexpr double dot(const Vec4& other) const {
        return x * other.x + y * other.y + z * other.z + w * other.w;
    }
};

// =============================================================================
// LinearColor - Non-premultiplied RGBA in linear space, channels in [0, 1]
// =============================================================================

struct LinearColor {
    double r, g, b, a;

    constexpr LinearColor() : r(0.0), g(0.0), b(0.0), a(1.0) {}
    constexpr LinearColor(double r_, double g_, double b_, double a_ = 1.0)
        : r(r_), g(g_), b(b_), a(a_) {}

    // Fully transparent black, the value of an empty sample
    static constexpr LinearColor transparent() { return LinearColor(0.0, 0.0, 0.0, 0.0); }
};

struct TexCoord {
    double s, t;

    constexpr TexCoord() : s(0.0), t(0.0) {}
    constexpr TexCoord(double s_, double t_) : s(s_), t(t_) {}
};

// =============================================================================
// Vertex
// =============================================================================

struct Vertex {
    Vec4 position;
    LinearColor color;
    TexCoord texCoord;
    double pointSize;

    constexpr Vertex() : position(), color(), texCoord(), pointSize(0.0) {}

    // Component by walk dimension (0 = x, 1 = y, 2 = z, 3 = w)
    double axis(int dimension) const;

    // Whole-record arithmetic
    Vertex operator+(const Vertex& other) const;
    Vertex operator-(const Vertex& other) const;
    Vertex operator*(double scalar) const;
    Vertex operator/(double scalar) const;
    Vertex& operator+=(const Vertex& other);

    // Component-wise approximate equality (for tests and clip bookkeeping)
    bool approxEquals(const Vertex& other, double tolerance = 1e-9) const;
};

inline Vertex operator*(double scalar, const Vertex& v) {
    return v * scalar;
}

// Linear interpolation between two vertices: a + t * (b - a)
Vertex lerp(const Vertex& a, const Vertex& b, double t);

// =============================================================================
// Mat4 - 4x4 uniform matrix (row-major)
// =============================================================================
//
// Stored the way the command language lists it: row by row. Applying the
// matrix to a position computes M * p with p as a column vector.
//
// =============================================================================

struct Mat4 {
    double m[4][4];

    Mat4();

    static Mat4 identity();

    // Build from 16 values in row-major order
    static Mat4 fromRowMajor(const double values[16]);

    Vec4 operator*(const Vec4& v) const;
};

#endif // RASTER_VERTEX_H
