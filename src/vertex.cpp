#include "vertex.h"
#include <cmath>

// =============================================================================
// Vertex
// =============================================================================

double Vertex::axis(int dimension) const {
    switch (dimension) {
        case 0: return position.x;
        case 1: return position.y;
        case 2: return position.z;
        default: return position.w;
    }
}

Vertex Vertex::operator+(const Vertex& other) const {
    Vertex result = *this;
    result += other;
    return result;
}

Vertex Vertex::operator-(const Vertex& other) const {
    Vertex result;
    result.position = Vec4(position.x - other.position.x, position.y - other.position.y,
                           position.z - other.position.z, position.w - other.position.w);
    result.color = LinearColor(color.r - other.color.r, color.g - other.color.g,
                               color.b - other.color.b, color.a - other.color.a);
    result.texCoord = TexCoord(texCoord.s - other.texCoord.s, texCoord.t - other.texCoord.t);
    result.pointSize = pointSize - other.pointSize;
    return result;
}

Vertex Vertex::operator*(double scalar) const {
    Vertex result;
    result.position = Vec4(position.x * scalar, position.y * scalar,
                           position.z * scalar, position.w * scalar);
    result.color = LinearColor(color.r * scalar, color.g * scalar,
                               color.b * scalar, color.a * scalar);
    result.texCoord = TexCoord(texCoord.s * scalar, texCoord.t * scalar);
    result.pointSize = pointSize * scalar;
    return result;
}

Vertex Vertex::operator/(double scalar) const {
    Vertex result;
    result.position = Vec4(position.x / scalar, position.y / scalar,
                           position.z / scalar, position.w / scalar);
    result.color = LinearColor(color.r / scalar, color.g / scalar,
                               color.b / scalar, color.a / scalar);
    result.texCoord = TexCoord(texCoord.s / scalar, texCoord.t / scalar);
    result.pointSize = pointSize / scalar;
    return result;
}

Vertex& Vertex::operator+=(const Vertex& other) {
    position.x += other.position.x;
    position.y += other.position.y;
    position.z += other.position.z;
    position.w += other.position.w;
    color.r += other.color.r;
    color.g += other.color.g;
    color.b += other.color.b;
    color.a += other.color.a;
    texCoord.s += other.texCoord.s;
    texCoord.t += other.texCoord.t;
    pointSize += other.pointSize;
    return *this;
}

bool Vertex::approxEquals(const Vertex& other, double tolerance) const {
    const double mine[VERTEX_COMPONENTS] = {
        position.x, position.y, position.z, position.w,
        color.r, color.g, color.b, color.a,
        texCoord.s, texCoord.t, pointSize
    };
    const double theirs[VERTEX_COMPONENTS] = {
        other.position.x, other.position.y, other.position.z, other.position.w,
        other.color.r, other.color.g, other.color.b, other.color.a,
        other.texCoord.s, other.texCoord.t, other.pointSize
    };
    for (int i = 0; i < VERTEX_COMPONENTS; i++) {
        if (!(std::fabs(mine[i] - theirs[i]) <= tolerance)) {
            return false;
        }
    }
    return true;
}

Vertex lerp(const Vertex& a, const Vertex& b, double t) {
    return a + (b - a) * t;
}

// =============================================================================
// Mat4
// =============================================================================

Mat4::Mat4() {
    for (int row = 0; row < 4; row++) {
        for (int col = 0; col < 4; col++) {
            m[row][col] = 0.0;
        }
    }
}

Mat4 Mat4::identity() {
    Mat4 result;
    for (int i = 0; i < 4; i++) {
        result.m[i][i] = 1.0;
    }
    return result;
}

Mat4 Mat4::fromRowMajor(const double values[16]) {
    Mat4 result;
    for (int row = 0; row < 4; row++) {
        for (int col = 0; col < 4; col++) {
            result.m[row][col] = values[row * 4 + col];
        }
    }
    return result;
}

Vec4 Mat4::operator*(const Vec4& v) const {
    // Each component of the result is the dot product of a row with v
    return Vec4(
        m[0][0] * v.x + m[0][1] * v.y + m[0][2] * v.z + m[0][3] * v.w,
        m[1][0] * v.x + m[1][1] * v.y + m[1][2] * v.z + m[1][3] * v.w,
        m[2][0] * v.x + m[2][1] * v.y + m[2][2] * v.z + m[2][3] * v.w,
        m[3][0] * v.x + m[3][1] * v.y + m[3][2] * v.z + m[3][3] * v.w
    );
}
