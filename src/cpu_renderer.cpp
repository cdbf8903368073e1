#include "cpu_renderer.hpp"
#include "config_error.hpp"
#include "export.hpp"
#include "gradient.hpp"
#include "mask.hpp"

#include <algorithm>
#include <chrono>

// -----------------------------------------------------------------------
// Mask: reload when the path changes, resample when the frame size does
// -----------------------------------------------------------------------
void CpuRenderer::sync_mask(const SceneState& scene, int w, int h)
{
    if (scene.mask_path != mask_image_path) {
        mask_image_path = scene.mask_path;
        mask_error.clear();
        mask_image = PixelBuffer{};
        if (!mask_image_path.empty()) {
            mask_error = load_png(mask_image_path.c_str(), mask_image);
            if (!mask_error.empty())
                mask_image = PixelBuffer{};
        }
        mask_dirty = true;
    }

    if (!mask_dirty && mask_buf.width == w && mask_buf.height == h)
        return;

    if (mask_image.width > 0 && mask_image.height > 0)
        resample_nearest(mask_image, w, h, mask_buf);
    else
        make_solid_mask(mask_buf, w, h);
    mask_dirty = false;
}

// -----------------------------------------------------------------------
// Frame
// -----------------------------------------------------------------------
void CpuRenderer::render(const SceneState& scene, double rotation, PixelBuffer& buf)
{
    using clock = std::chrono::steady_clock;
    const auto t0 = clock::now();

    // Validate once, before any pixel loop.
    const std::vector<Rgb> stops = parse_color_stops(scene.colors);
    if (dither_quantizes(scene.dither.algorithm) && scene.dither.color_levels < 2)
        throw ConfigError("color levels must be at least 2, got "
                          + std::to_string(scene.dither.color_levels));

    const int density = std::max(1, scene.density);
    const int W = scene.width  * density;
    const int H = scene.height * density;
    if (W <= 0 || H <= 0) {
        buf.resize(0, 0);
        return;
    }

    if (gradient_buf.width != W || gradient_buf.height != H) {
        gradient_buf.resize(W, H);
        composite_buf.resize(W, H);
    }

    GradientParams gp;
    gp.center_x = scene.width  * 0.5;
    gp.center_y = scene.height * 0.5;
    gp.rotation = rotation;
    gp.size     = std::max(scene.width, scene.height);
    gp.density  = density;
    render_gradient(scene.gradient, gradient_buf, stops, gp);

    sync_mask(scene, W, H);
    composite_mask(gradient_buf, mask_buf, hex_to_rgb(scene.background), composite_buf);

    dither.apply(composite_buf, scene.dither, buf);

    last_render_ms = std::chrono::duration<double, std::milli>(
                         clock::now() - t0).count();
}
