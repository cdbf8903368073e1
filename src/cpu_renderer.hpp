#pragma once

#include "dither.hpp"
#include "renderer.hpp"
#include "scene_state.hpp"

#include <string>

// Runs gradient -> mask composite -> dither for one frame on the calling
// thread. Intermediate buffers are kept between frames; one instance must
// not be shared across threads.
class CpuRenderer : public IFrameRenderer {
public:
    // buf is resized to (width * density) x (height * density).
    // Throws ConfigError for fewer than 2 colors or color_levels < 2.
    void render(const SceneState& scene, double rotation, PixelBuffer& buf) override;

    double      last_render_ms = 0.0;
    std::string mask_error;        // set when scene.mask_path failed to load

private:
    void sync_mask(const SceneState& scene, int w, int h);

    DitherEngine dither;

    PixelBuffer gradient_buf;
    PixelBuffer mask_buf;
    PixelBuffer composite_buf;

    PixelBuffer mask_image;        // as loaded, before resampling
    std::string mask_image_path;
    bool        mask_dirty = true;
};
