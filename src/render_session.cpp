#include "render_session.h"
#include "draw_commands.h"
#include "resolve.h"
#include <SDL.h>

RenderSession::RenderSession(const RenderSettings& settings)
    : width(0)
    , height(0)
{
    state.modes = settings.modes;
}

void RenderSession::configureFrame() {
    if (width > 0 && height > 0) {
        frame.configure(width, height, state.modes.fsaa);
    }
}

bool RenderSession::bindBuffer(const Command& command) {
    int group = command.integers[0];
    const std::vector<double>& values = command.values;
    size_t count = values.size() / static_cast<size_t>(group);

    switch (command.type) {
        case CommandType::Position: {
            std::vector<Vec4> positions(count);
            for (size_t i = 0; i < count; i++) {
                double p[4] = {0.0, 0.0, 0.0, 1.0};
                for (int c = 0; c < group; c++) {
                    p[c] = values[i * group + c];
                }
                positions[i] = Vec4(p[0], p[1], p[2], p[3]);
            }
            buffers.setPositions(positions);
            break;
        }
        case CommandType::Color: {
            std::vector<LinearColor> colors(count);
            for (size_t i = 0; i < count; i++) {
                double c[4] = {0.0, 0.0, 0.0, 1.0};
                for (int k = 0; k < group; k++) {
                    c[k] = values[i * group + k];
                }
                colors[i] = LinearColor(c[0], c[1], c[2], c[3]);
            }
            buffers.setColors(colors);
            break;
        }
        case CommandType::TexCoord: {
            std::vector<TexCoord> texCoords(count);
            for (size_t i = 0; i < count; i++) {
                double t[2] = {0.0, 0.0};
                for (int k = 0; k < group; k++) {
                    t[k] = values[i * group + k];
                }
                texCoords[i] = TexCoord(t[0], t[1]);
            }
            buffers.setTexCoords(texCoords);
            break;
        }
        case CommandType::PointSize: {
            std::vector<double> sizes(count);
            for (size_t i = 0; i < count; i++) {
                sizes[i] = values[i * group];
            }
            buffers.setPointSizes(sizes);
            break;
        }
        default:
            return false;
    }

    SDL_LogVerbose(SDL_LOG_CATEGORY_APPLICATION, "line %d: bound %zu %s values",
                   command.line, count, commandName(command.type));
    return true;
}

bool RenderSession::execute(const Command& command) {
    const std::vector<int>& args = command.integers;

    switch (command.type) {
        // Image
        case CommandType::Png:
            width = args[0];
            height = args[1];
            outputPath = command.path;
            configureFrame();
            return true;

        // Modes
        case CommandType::Depth:
            state.modes.depthTest = true;
            return true;
        case CommandType::Srgb:
            state.modes.srgbOutput = true;
            return true;
        case CommandType::Hyperbolic:
            state.modes.hyperbolic = true;
            return true;
        case CommandType::Cull:
            state.modes.cullBackfaces = true;
            return true;
        case CommandType::Frustum:
            state.modes.frustumClipping = true;
            return true;
        case CommandType::Fsaa:
            if (args[0] > MAX_FSAA) {
                SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "line %d: fsaa %d clamped to %d",
                            command.line, args[0], MAX_FSAA);
            }
            state.modes.fsaa = args[0] > MAX_FSAA ? MAX_FSAA : args[0];
            configureFrame();
            return true;

        // Uniform state
        case CommandType::Texture:
            if (!texture.load(command.path)) {
                return false;
            }
            state.uniforms.texture = &texture;
            return true;
        case CommandType::UniformMatrix:
            state.uniforms.matrix = Mat4::fromRowMajor(command.values.data());
            state.uniforms.hasMatrix = true;
            return true;

        // Buffers
        case CommandType::Position:
        case CommandType::Color:
        case CommandType::TexCoord:
        case CommandType::PointSize:
            return bindBuffer(command);
        case CommandType::Elements:
            buffers.setElements(args);
            return true;

        // Draw calls
        case CommandType::DrawArraysTriangles:
            return drawArraysTriangles(state, buffers, frame, args[0], args[1]);
        case CommandType::DrawElementsTriangles:
            return drawElementsTriangles(state, buffers, frame, args[0], args[1]);
        case CommandType::DrawArraysPoints:
            return drawArraysPoints(state, buffers, frame, args[0], args[1]);
    }
    return false;
}

bool RenderSession::executeAll(const std::vector<Command>& commands) {
    for (const auto& command : commands) {
        if (!execute(command)) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "line %d: %s failed",
                         command.line, commandName(command.type));
            return false;
        }
    }
    return true;
}

bool RenderSession::resolve(ImageSurface& image) const {
    if (!frame.isConfigured()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "No png command: nothing to render");
        return false;
    }

    ResolveOptions options;
    options.depthTest = state.modes.depthTest;
    options.srgbOutput = state.modes.srgbOutput;
    resolveFrame(frame, options, image);
    return true;
}
