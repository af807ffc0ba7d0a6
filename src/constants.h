#ifndef RASTER_CONSTANTS_H
#define RASTER_CONSTANTS_H

// =============================================================================
// Pipeline Constants
// =============================================================================

// Number of scalar components in a vertex record:
//   position (4) + color (4) + texture coordinate (2) + point size (1)
constexpr int VERTEX_COMPONENTS = 11;

// Walk dimensions used by the scanline filler
constexpr int DIMENSION_X = 0;
constexpr int DIMENSION_Y = 1;

// Six canonical homogeneous clip planes
constexpr int FRUSTUM_PLANE_COUNT = 6;

// sRGB transfer function thresholds
namespace SrgbConstants {
    constexpr double DECODE_THRESHOLD = 0.04045;
    constexpr double ENCODE_THRESHOLD = 0.0031308;
    constexpr double LINEAR_SCALE = 12.92;
    constexpr double OFFSET = 0.055;
    constexpr double SCALE = 1.055;
    constexpr double GAMMA = 2.4;
}

// Largest supported supersampling factor per axis
constexpr int MAX_FSAA = 8;

// Output channels (RGBA, 8 bits each)
constexpr int OUTPUT_CHANNELS = 4;

// =============================================================================
// Program Settings
// =============================================================================

constexpr const char* PROGRAM_NAME = "rasterizer";
constexpr const char* WINDOW_TITLE = "Rasterizer";

#endif // RASTER_CONSTANTS_H
