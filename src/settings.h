// settings.h
// Load default render settings

#ifndef RASTER_SETTINGS_H
#define RASTER_SETTINGS_H

#include "renderer.h"
#include <string>

// Defaults applied before a command file runs. Mode commands in the file
// can only switch modes on, so these set the baseline.
struct RenderSettings {
    RenderModes modes;   // depth, srgb, hyp, fsaa, cull, frustum
    bool verbose;        // Verbose logging for every category

    RenderSettings()
        : modes()
        , verbose(false)
    {}
};

// Get the path to the settings file
// $XDG_CONFIG_HOME/rasterizer/settings.cfg, else
// $HOME/.config/rasterizer/settings.cfg, else settings.cfg in the working
// directory
std::string getSettingsPath();

// Load settings from a key=value file
// Returns default settings if the file doesn't exist or can't be read;
// unknown keys and invalid values are skipped
RenderSettings loadSettings(const std::string& path);

#endif // RASTER_SETTINGS_H
