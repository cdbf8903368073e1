#pragma once

#include "color_stops.hpp"
#include "dither.hpp"
#include "gradient.hpp"

#include <string>
#include <vector>

// Rotation advance per displayed frame at speed 1.
static constexpr double ROTATION_STEP = 0.02;

struct SceneState {
    // Gradient
    GradientType             gradient = GradientType::Radial;
    int                      palette  = 0;
    std::vector<std::string> colors   = palette_colors(0, 3);
    double                   speed    = 1.0;   // 0..5
    bool                     playing  = true;
    double                   rotation = 0.0;   // accumulated phase, radians

    // Dither
    DitherSettings dither;

    // Compositing
    std::string background = "#000000";
    std::string mask_path;              // empty: solid white mask

    // Canvas (logical pixels) and pixel-density multiplier
    int width   = 600;
    int height  = 600;
    int density = 1;
};

// Steps the host-owned rotation by `frames` display frames when playing.
inline void advance_rotation(SceneState& scene, double frames = 1.0)
{
    if (scene.playing)
        scene.rotation += scene.speed * ROTATION_STEP * frames;
}

// Switches the color stops to another preset, keeping the stop count.
inline void apply_palette_keep_count(SceneState& scene, int palette)
{
    const int count = static_cast<int>(scene.colors.size());
    scene.palette   = palette;
    scene.colors    = palette_colors(palette, count);
}
