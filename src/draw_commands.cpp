// draw_commands.cpp
// Draw dispatch: grouping buffered vertices into primitives

#include "draw_commands.h"
#include <SDL.h>
#include <vector>

// =============================================================================
// Validation helpers
// =============================================================================

static bool checkFrame(const FrameBuffer& frame, const char* command)
{
    if (!frame.isConfigured()) {
        SDL_LogError(SDL_LOG_CATEGORY_RENDER, "%s: no image size set before drawing", command);
        return false;
    }
    return true;
}

static bool checkRange(int first, int count, size_t available, const char* what,
                       const char* command)
{
    if (first < 0 || count < 0 ||
        static_cast<size_t>(first) + static_cast<size_t>(count) > available) {
        SDL_LogError(SDL_LOG_CATEGORY_RENDER,
                     "%s: range [%d, %lld) outside %zu %s",
                     command, first, static_cast<long long>(first) + count, available, what);
        return false;
    }
    return true;
}

// Drop a trailing partial triangle
static int wholeTriangles(int count, const char* command)
{
    if (count % 3 != 0) {
        SDL_LogWarn(SDL_LOG_CATEGORY_RENDER,
                    "%s: count %d is not a multiple of 3; ignoring last %d vertices",
                    command, count, count % 3);
    }
    return count - count % 3;
}

static void logStats(const char* command, int first, int count, const DrawStats& stats)
{
    SDL_LogDebug(SDL_LOG_CATEGORY_RENDER,
                 "%s(%d, %d): %zu primitives, %zu culled, %zu fragments",
                 command, first, count, stats.primitives, stats.culled, stats.fragments);
}

// =============================================================================
// Draw commands
// =============================================================================

bool drawArraysTriangles(const RenderState& state, const VertexBufferStore& buffers,
                         FrameBuffer& frame, int first, int count)
{
    const char* command = "drawArraysTriangles";
    if (!checkFrame(frame, command) ||
        !checkRange(first, count, buffers.getVertexCount(), "vertices", command)) {
        return false;
    }

    DrawStats stats;
    int usable = wholeTriangles(count, command);
    for (int i = first; i < first + usable; i += 3) {
        if (!drawTriangle(state, frame, buffers.getVertex(i), buffers.getVertex(i + 1),
                          buffers.getVertex(i + 2), stats)) {
            return false;
        }
    }

    logStats(command, first, count, stats);
    return true;
}

bool drawElementsTriangles(const RenderState& state, const VertexBufferStore& buffers,
                           FrameBuffer& frame, int count, int offset)
{
    const char* command = "drawElementsTriangles";
    const std::vector<int>& elements = buffers.getElements();
    if (!checkFrame(frame, command) ||
        !checkRange(offset, count, elements.size(), "elements", command)) {
        return false;
    }

    int usable = wholeTriangles(count, command);
    for (int i = offset; i < offset + usable; i++) {
        if (!buffers.hasVertex(elements[i])) {
            SDL_LogError(SDL_LOG_CATEGORY_RENDER,
                         "%s: element %d refers to vertex %d of %zu",
                         command, i, elements[i], buffers.getVertexCount());
            return false;
        }
    }

    DrawStats stats;
    for (int i = offset; i < offset + usable; i += 3) {
        if (!drawTriangle(state, frame, buffers.getVertex(elements[i]),
                          buffers.getVertex(elements[i + 1]),
                          buffers.getVertex(elements[i + 2]), stats)) {
            return false;
        }
    }

    logStats(command, offset, count, stats);
    return true;
}

bool drawArraysPoints(const RenderState& state, const VertexBufferStore& buffers,
                      FrameBuffer& frame, int first, int count)
{
    const char* command = "drawArraysPoints";
    if (!checkFrame(frame, command) ||
        !checkRange(first, count, buffers.getVertexCount(), "vertices", command)) {
        return false;
    }

    DrawStats stats;
    for (int i = first; i < first + count; i++) {
        if (!drawPointSprite(state, frame, buffers.getVertex(i), stats)) {
            return false;
        }
    }

    logStats(command, first, count, stats);
    return true;
}
