// draw_commands.h
// Draw dispatch: grouping buffered vertices into primitives

#ifndef RASTER_DRAW_COMMANDS_H
#define RASTER_DRAW_COMMANDS_H

#include "frame_buffer.h"
#include "renderer.h"
#include "vertex_buffer.h"

// =============================================================================
// Draw Commands
// =============================================================================
//
// drawArraysTriangles(first, count)
//     triangles (first+0, first+1, first+2), (first+3, first+4, first+5), ...
//
// drawElementsTriangles(count, offset)
//     the same, reading vertex indices from elements[offset .. offset+count)
//
// drawArraysPoints(first, count)
//     one point sprite per vertex first .. first+count-1
//
// Primitives are drawn in ascending index order. count for the triangle
// commands is expected to be a multiple of 3; a trailing partial triangle is
// ignored with a warning.
//
// Each command validates its whole index range before drawing anything and
// returns false (after logging) if an index is out of range, the frame has no
// size yet, or a primitive has invalid geometry.
//
// =============================================================================

bool drawArraysTriangles(const RenderState& state, const VertexBufferStore& buffers,
                         FrameBuffer& frame, int first, int count);

bool drawElementsTriangles(const RenderState& state, const VertexBufferStore& buffers,
                           FrameBuffer& frame, int count, int offset);

bool drawArraysPoints(const RenderState& state, const VertexBufferStore& buffers,
                      FrameBuffer& frame, int first, int count);

#endif // RASTER_DRAW_COMMANDS_H
