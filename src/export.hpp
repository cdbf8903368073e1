#pragma once

#include "renderer.hpp"
#include "scene_state.hpp"

#include <functional>
#include <string>

// Returns empty string on success, or an error message on failure.
std::string export_png(const char* path, const PixelBuffer& buf);

#ifdef HAVE_JXL
std::string export_jxl(const char* path, const PixelBuffer& buf);
#endif

// True when compiled with JPEG XL support.
inline bool jxl_available()
{
#ifdef HAVE_JXL
    return true;
#else
    return false;
#endif
}

// Reads any PNG into an RGBA buffer (gray and palette images are expanded,
// 16-bit samples stripped, missing alpha filled with 255).
// Returns empty string on success, or an error message on failure.
std::string load_png(const char* path, PixelBuffer& buf);

// "720p" -> 1280x720, "1080p" -> 1920x1080. Returns false for other names.
bool resolution_preset(const std::string& name, int& w, int& h);

struct SequenceExport {
    std::string directory = "frames";
    int         width     = 1920;
    int         height    = 1080;
    int         fps       = 60;
    double      duration  = 3.0;   // seconds
    int         threads   = 0;     // 0 = hardware concurrency
};

// fraction in [0,1], status is a short human-readable line.
using ExportProgress = std::function<void(float fraction, const char* status)>;

int sequence_frame_count(const SequenceExport& opts);

// The scene used for frame `index`: export resolution, density 1, rotation
// advanced `index` frames from scene.rotation. A seeded random dither gets
// seed + index so frames differ but stay reproducible.
SceneState sequence_frame_scene(const SceneState& scene, const SequenceExport& opts,
                                int index);

// Renders ceil(duration * fps) frames to directory/frame00000.png, ...
// Frames are rendered concurrently, one renderer per worker. The scene is
// not modified. Throws ConfigError on invalid scene parameters (checked
// before any frame is rendered); I/O failures are returned as a message.
std::string export_png_sequence(const SceneState& scene, const SequenceExport& opts,
                                const ExportProgress& progress = {});
