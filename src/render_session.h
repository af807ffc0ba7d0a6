#ifndef RASTER_RENDER_SESSION_H
#define RASTER_RENDER_SESSION_H

#include "command_file.h"
#include "frame_buffer.h"
#include "image.h"
#include "renderer.h"
#include "settings.h"
#include "texture.h"
#include "vertex_buffer.h"
#include <string>
#include <vector>

// =============================================================================
// Render Session
// =============================================================================
//
// Executes a command stream against one pipeline instance. The session owns
// the three pieces of pipeline state and hands them to each draw call:
//
//   RenderState        modes and uniforms, read-only during a draw call
//   VertexBufferStore  bound attributes and elements, read-only while drawing
//   FrameBuffer        the sample grid, the only thing a draw call writes
//
// Commands run strictly in order. resolve() composites the frame into the
// output image once all commands have executed.
//
// =============================================================================

class RenderSession {
public:
    explicit RenderSession(const RenderSettings& settings);

    // Non-copyable: the render state points at the session's texture
    RenderSession(const RenderSession&) = delete;
    RenderSession& operator=(const RenderSession&) = delete;

    // Execute one command. Returns false on a fatal error (bad texture,
    // invalid geometry, out-of-range indices).
    bool execute(const Command& command);

    // Execute a list of commands, stopping at the first failure
    bool executeAll(const std::vector<Command>& commands);

    // Composite the frame into an image at the requested output size.
    // Returns false if no png command was seen.
    bool resolve(ImageSurface& image) const;

    const std::string& getOutputPath() const { return outputPath; }
    const RenderState& getState() const { return state; }
    const FrameBuffer& getFrame() const { return frame; }

private:
    bool bindBuffer(const Command& command);
    void configureFrame();

    RenderState state;
    VertexBufferStore buffers;
    FrameBuffer frame;
    Texture texture;

    int width;
    int height;
    std::string outputPath;
};

#endif // RASTER_RENDER_SESSION_H
