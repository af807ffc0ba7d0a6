// settings.cpp
// Load default render settings

#include "settings.h"
#include <SDL.h>
#include <cstdlib>
#include <fstream>

// =============================================================================
// Settings path - use platform-appropriate location
// =============================================================================

std::string getSettingsPath() {
    const char* configHome = std::getenv("XDG_CONFIG_HOME");
    if (configHome && configHome[0] != '\0') {
        return std::string(configHome) + "/rasterizer/settings.cfg";
    }

    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home) + "/.config/rasterizer/settings.cfg";
    }

    // Fallback to current directory
    return "settings.cfg";
}

// =============================================================================
// Load settings
// =============================================================================

static bool parseFlag(const std::string& value, bool& out) {
    if (value == "1" || value == "true" || value == "on") {
        out = true;
        return true;
    }
    if (value == "0" || value == "false" || value == "off") {
        out = false;
        return true;
    }
    return false;
}

RenderSettings loadSettings(const std::string& path) {
    RenderSettings settings;  // Start with defaults

    std::ifstream file(path);
    if (!file.is_open()) {
        // File doesn't exist, return defaults
        return settings;
    }

    std::string line;
    int lineNumber = 0;
    while (std::getline(file, line)) {
        lineNumber++;

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Parse key=value
        size_t pos = line.find('=');
        if (pos == std::string::npos) {
            continue;
        }

        std::string key = line.substr(0, pos);
        std::string value = line.substr(pos + 1);

        bool ok = true;
        if (key == "fsaa") {
            int v = std::atoi(value.c_str());
            if (v >= 1 && v <= MAX_FSAA) {
                settings.modes.fsaa = v;
            } else {
                ok = false;
            }
        } else if (key == "depth") {
            ok = parseFlag(value, settings.modes.depthTest);
        } else if (key == "srgb") {
            ok = parseFlag(value, settings.modes.srgbOutput);
        } else if (key == "hyp") {
            ok = parseFlag(value, settings.modes.hyperbolic);
        } else if (key == "cull") {
            ok = parseFlag(value, settings.modes.cullBackfaces);
        } else if (key == "frustum") {
            ok = parseFlag(value, settings.modes.frustumClipping);
        } else if (key == "verbose") {
            ok = parseFlag(value, settings.verbose);
        }

        if (!ok) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "%s:%d: invalid value '%s' for %s",
                        path.c_str(), lineNumber, value.c_str(), key.c_str());
        }
    }

    return settings;
}
