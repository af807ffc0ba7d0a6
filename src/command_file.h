// command_file.h
// Parse rasterizer command files into typed commands

#ifndef RASTER_COMMAND_FILE_H
#define RASTER_COMMAND_FILE_H

#include <string>
#include <vector>

// =============================================================================
// Command File Format
// =============================================================================
//
// One command per line, whitespace separated:
//
//   png W H FILE                    create the output image
//   depth | sRGB | hyp | cull | frustum
//   fsaa N                          supersampling level
//   texture FILE                    bind a texture
//   uniformMatrix m00 m01 .. m33    16 values, row-major
//   position N v v v ..             buffer binds, values grouped by N
//   color N v v v ..
//   texcoord N v v ..
//   pointsize N v ..
//   elements i i i ..               element index list
//   drawArraysTriangles FIRST COUNT
//   drawElementsTriangles COUNT OFFSET
//   drawArraysPoints FIRST COUNT
//
// Blank lines, comments and unknown keywords are ignored. A trailing
// incomplete group in a buffer command is dropped.
//
// =============================================================================

enum class CommandType {
    Png,
    Depth,
    Srgb,
    Hyperbolic,
    Fsaa,
    Cull,
    Frustum,
    Texture,
    UniformMatrix,
    Position,
    Color,
    TexCoord,
    PointSize,
    Elements,
    DrawArraysTriangles,
    DrawElementsTriangles,
    DrawArraysPoints
};

struct Command {
    CommandType type;
    int line;                       // 1-based source line
    std::vector<int> integers;      // Sizes, counts, indices, group size
    std::vector<double> values;     // Buffer values, matrix entries
    std::string path;               // Output or texture file

    Command() : type(CommandType::Png), line(0) {}
};

enum class ParseResult {
    Parsed,     // out holds a command
    Ignored,    // Blank, comment or unknown keyword
    Malformed   // Known keyword with bad arguments
};

// Parse a single line
ParseResult parseCommandLine(const std::string& line, int lineNumber, Command& out);

// Parse a whole file. Malformed lines are logged and skipped.
// Returns false if the file cannot be read.
bool parseCommandFile(const std::string& path, std::vector<Command>& commands);

// Keyword for a command type (for log messages)
const char* commandName(CommandType type);

#endif // RASTER_COMMAND_FILE_H
