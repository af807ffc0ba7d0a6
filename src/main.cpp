#include <SDL.h>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>
#include "constants.h"
#include "command_file.h"
#include "image.h"
#include "render_session.h"
#include "settings.h"

// =============================================================================
// Rasterizer - command-file driven software rasterization pipeline
// =============================================================================

// Window that displays a finished image until closed
class Preview {
public:
    Preview() = default;
    ~Preview() { shutdown(); }

    Preview(const Preview&) = delete;
    Preview& operator=(const Preview&) = delete;

    bool init(const ImageSurface& image);
    void run();
    void shutdown();

private:
    void handleEvents();
    void render();

    SDL_Window* window = nullptr;
    SDL_Renderer* renderer = nullptr;
    SDL_Texture* texture = nullptr;
    bool initialized = false;
    bool running = false;
};

bool Preview::init(const ImageSurface& image) {
    if (SDL_Init(SDL_INIT_VIDEO) < 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SDL_Init failed: %s", SDL_GetError());
        return false;
    }
    initialized = true;

    window = SDL_CreateWindow(
        WINDOW_TITLE,
        SDL_WINDOWPOS_CENTERED,
        SDL_WINDOWPOS_CENTERED,
        image.getWidth(),
        image.getHeight(),
        SDL_WINDOW_SHOWN | SDL_WINDOW_ALLOW_HIGHDPI | SDL_WINDOW_RESIZABLE
    );

    if (!window) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SDL_CreateWindow failed: %s", SDL_GetError());
        return false;
    }

    renderer = SDL_CreateRenderer(
        window,
        -1,
        SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC
    );

    if (!renderer) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SDL_CreateRenderer failed: %s", SDL_GetError());
        return false;
    }

    // Keep the image aspect ratio when the window is resized
    SDL_RenderSetLogicalSize(renderer, image.getWidth(), image.getHeight());

    texture = SDL_CreateTexture(
        renderer,
        SDL_PIXELFORMAT_RGBA32,
        SDL_TEXTUREACCESS_STREAMING,
        image.getWidth(),
        image.getHeight()
    );

    if (!texture) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SDL_CreateTexture failed: %s", SDL_GetError());
        return false;
    }

    // Show transparency against black
    SDL_SetTextureBlendMode(texture, SDL_BLENDMODE_BLEND);
    SDL_SetRenderDrawColor(renderer, 0, 0, 0, 255);

    if (SDL_UpdateTexture(texture, nullptr, image.getData(), image.getPitch()) < 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SDL_UpdateTexture failed: %s", SDL_GetError());
        return false;
    }

    running = true;
    return true;
}

void Preview::shutdown() {
    if (texture) {
        SDL_DestroyTexture(texture);
        texture = nullptr;
    }
    if (renderer) {
        SDL_DestroyRenderer(renderer);
        renderer = nullptr;
    }
    if (window) {
        SDL_DestroyWindow(window);
        window = nullptr;
    }
    if (initialized) {
        SDL_Quit();
        initialized = false;
    }
}

void Preview::handleEvents() {
    SDL_Event event;
    while (SDL_PollEvent(&event)) {
        switch (event.type) {
            case SDL_QUIT:
                running = false;
                break;

            case SDL_KEYDOWN:
                if (event.key.keysym.sym == SDLK_ESCAPE) {
                    running = false;
                }
                break;

            default:
                break;
        }
    }
}

void Preview::render() {
    SDL_RenderClear(renderer);
    SDL_RenderCopy(renderer, texture, nullptr, nullptr);
    SDL_RenderPresent(renderer);
}

void Preview::run() {
    while (running) {
        handleEvents();
        render();
        SDL_Delay(16);
    }
}

// =============================================================================
// Command line
// =============================================================================

struct Options {
    std::string settingsPath;
    std::string commandFile;
    bool verbose = false;
    bool show = false;
};

static void printUsage() {
    SDL_Log("Usage: %s [--settings FILE] [--verbose] [--show] COMMAND_FILE", PROGRAM_NAME);
}

static bool parseArguments(int argc, char* argv[], Options& options) {
    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--settings") == 0 && i + 1 < argc) {
            options.settingsPath = argv[++i];
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            options.verbose = true;
        } else if (std::strcmp(argv[i], "--show") == 0) {
            options.show = true;
        } else if (argv[i][0] == '-') {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Unknown option %s", argv[i]);
            return false;
        } else if (options.commandFile.empty()) {
            options.commandFile = argv[i];
        } else {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Unexpected argument %s", argv[i]);
            return false;
        }
    }
    return !options.commandFile.empty();
}

int main(int argc, char* argv[]) {
    Options options;
    if (!parseArguments(argc, argv, options)) {
        printUsage();
        return EXIT_FAILURE;
    }

    // Load defaults before the command file runs
    if (options.settingsPath.empty()) {
        options.settingsPath = getSettingsPath();
    }
    RenderSettings settings = loadSettings(options.settingsPath);

    if (options.verbose || settings.verbose) {
        SDL_LogSetAllPriority(SDL_LOG_PRIORITY_VERBOSE);
    }
    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "Settings from %s", options.settingsPath.c_str());

    std::vector<Command> commands;
    if (!parseCommandFile(options.commandFile, commands)) {
        return EXIT_FAILURE;
    }

    RenderSession session(settings);
    if (!session.executeAll(commands)) {
        return EXIT_FAILURE;
    }

    ImageSurface image;
    if (!session.resolve(image)) {
        return EXIT_FAILURE;
    }

    if (!image.savePNG(session.getOutputPath())) {
        return EXIT_FAILURE;
    }
    SDL_Log("Rendered %dx%d (fsaa %d) to: %s", image.getWidth(), image.getHeight(),
            session.getFrame().getFsaa(), session.getOutputPath().c_str());

    if (options.show) {
        Preview preview;
        if (!preview.init(image)) {
            return EXIT_FAILURE;
        }
        preview.run();
    }

    return EXIT_SUCCESS;
}
