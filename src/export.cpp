#include "export.hpp"
#include "config_error.hpp"
#include "cpu_renderer.hpp"
#include "thread_pool.hpp"

#include <png.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <exception>
#include <filesystem>
#include <memory>
#include <mutex>
#include <system_error>
#include <thread>
#include <vector>

#ifdef HAVE_JXL
#include <jxl/encode.h>
#include <jxl/color_encoding.h>
#endif

// ---------------------------------------------------------------------------
// PNG export
//
// PixelBuffer bytes are already [R, G, B, A] per pixel, which is exactly
// what PNG_COLOR_TYPE_RGBA expects.
// ---------------------------------------------------------------------------
std::string export_png(const char* path, const PixelBuffer& buf)
{
    if (buf.width <= 0 || buf.height <= 0)
        return "Cannot export an empty image";

    FILE* fp = std::fopen(path, "wb");
    if (!fp)
        return std::string("Cannot open file for writing: ") + path;

    png_structp png = png_create_write_struct(
        PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png) {
        std::fclose(fp);
        return "png_create_write_struct failed";
    }

    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_write_struct(&png, nullptr);
        std::fclose(fp);
        return "png_create_info_struct failed";
    }

    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        std::fclose(fp);
        return "PNG write error (libpng longjmp)";
    }

    png_init_io(png, fp);
    png_set_IHDR(png, info,
                 static_cast<png_uint_32>(buf.width),
                 static_cast<png_uint_32>(buf.height),
                 8, PNG_COLOR_TYPE_RGBA,
                 PNG_INTERLACE_NONE,
                 PNG_COMPRESSION_TYPE_DEFAULT,
                 PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png, info);

    for (int y = 0; y < buf.height; ++y)
        png_write_row(png, reinterpret_cast<png_const_bytep>(buf.at(0, y)));

    png_write_end(png, nullptr);
    png_destroy_write_struct(&png, &info);
    if (std::fclose(fp) != 0)
        return std::string("Error closing file: ") + path;
    return {};  // success
}

// ---------------------------------------------------------------------------
// PNG import (mask images)
// ---------------------------------------------------------------------------
std::string load_png(const char* path, PixelBuffer& buf)
{
    FILE* fp = std::fopen(path, "rb");
    if (!fp)
        return std::string("Cannot open file for reading: ") + path;

    png_byte sig[8];
    if (std::fread(sig, 1, sizeof(sig), fp) != sizeof(sig) ||
        png_sig_cmp(sig, 0, sizeof(sig)) != 0) {
        std::fclose(fp);
        return std::string("Not a PNG file: ") + path;
    }

    png_structp png = png_create_read_struct(
        PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png) {
        std::fclose(fp);
        return "png_create_read_struct failed";
    }

    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_read_struct(&png, nullptr, nullptr);
        std::fclose(fp);
        return "png_create_info_struct failed";
    }

    if (setjmp(png_jmpbuf(png))) {
        png_destroy_read_struct(&png, &info, nullptr);
        std::fclose(fp);
        return std::string("PNG read error (libpng longjmp): ") + path;
    }

    png_init_io(png, fp);
    png_set_sig_bytes(png, sizeof(sig));
    png_read_info(png, info);

    const png_uint_32 w          = png_get_image_width(png, info);
    const png_uint_32 h          = png_get_image_height(png, info);
    const int         color_type = png_get_color_type(png, info);
    const int         bit_depth  = png_get_bit_depth(png, info);

    // Normalize everything to 8-bit RGBA.
    if (color_type == PNG_COLOR_TYPE_PALETTE)
        png_set_palette_to_rgb(png);
    if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8)
        png_set_expand_gray_1_2_4_to_8(png);
    const bool has_trns = png_get_valid(png, info, PNG_INFO_tRNS) != 0;
    if (has_trns)
        png_set_tRNS_to_alpha(png);
    if (bit_depth == 16)
        png_set_strip_16(png);
    if (color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_GRAY_ALPHA)
        png_set_gray_to_rgb(png);
    if (!(color_type & PNG_COLOR_MASK_ALPHA) && !has_trns)
        png_set_filler(png, 0xFF, PNG_FILLER_AFTER);

    const int passes = png_set_interlace_handling(png);
    png_read_update_info(png, info);

    buf.resize(static_cast<int>(w), static_cast<int>(h));
    for (int pass = 0; pass < passes; ++pass)
        for (png_uint_32 y = 0; y < h; ++y)
            png_read_row(png, buf.at(0, static_cast<int>(y)), nullptr);

    png_read_end(png, nullptr);
    png_destroy_read_struct(&png, &info, nullptr);
    std::fclose(fp);
    return {};  // success
}

// ---------------------------------------------------------------------------
// JPEG XL export (lossless RGBA, 8-bit)
// ---------------------------------------------------------------------------
#ifdef HAVE_JXL
std::string export_jxl(const char* path, const PixelBuffer& buf)
{
    JxlEncoder* enc = JxlEncoderCreate(nullptr);
    if (!enc) return "JxlEncoderCreate failed";

    JxlBasicInfo bi;
    JxlEncoderInitBasicInfo(&bi);
    bi.xsize                     = static_cast<uint32_t>(buf.width);
    bi.ysize                     = static_cast<uint32_t>(buf.height);
    bi.bits_per_sample           = 8;
    bi.exponent_bits_per_sample  = 0;
    bi.alpha_bits                = 8;
    bi.alpha_exponent_bits       = 0;
    bi.num_color_channels        = 3;
    bi.num_extra_channels        = 1;
    bi.uses_original_profile     = JXL_TRUE;

    if (JxlEncoderSetBasicInfo(enc, &bi) != JXL_ENC_SUCCESS) {
        JxlEncoderDestroy(enc);
        return "JxlEncoderSetBasicInfo failed";
    }

    JxlExtraChannelInfo eci;
    JxlEncoderInitExtraChannelInfo(JXL_CHANNEL_ALPHA, &eci);
    eci.bits_per_sample          = 8;
    eci.exponent_bits_per_sample = 0;
    if (JxlEncoderSetExtraChannelInfo(enc, 0, &eci) != JXL_ENC_SUCCESS) {
        JxlEncoderDestroy(enc);
        return "JxlEncoderSetExtraChannelInfo failed";
    }

    JxlColorEncoding color;
    JxlColorEncodingSetToSRGB(&color, /*is_gray=*/JXL_FALSE);
    if (JxlEncoderSetColorEncoding(enc, &color) != JXL_ENC_SUCCESS) {
        JxlEncoderDestroy(enc);
        return "JxlEncoderSetColorEncoding failed";
    }

    JxlEncoderFrameSettings* opts = JxlEncoderFrameSettingsCreate(enc, nullptr);
    if (JxlEncoderSetFrameLossless(opts, JXL_TRUE) != JXL_ENC_SUCCESS) {
        JxlEncoderDestroy(enc);
        return "JxlEncoderSetFrameLossless failed";
    }

    JxlPixelFormat fmt = {4, JXL_TYPE_UINT8, JXL_NATIVE_ENDIAN, 0};
    if (JxlEncoderAddImageFrame(opts, &fmt, buf.pixels.data(), buf.pixels.size())
            != JXL_ENC_SUCCESS) {
        JxlEncoderDestroy(enc);
        return "JxlEncoderAddImageFrame failed";
    }
    JxlEncoderCloseInput(enc);

    std::vector<uint8_t> output(65536);
    uint8_t* next_out  = output.data();
    size_t   avail_out = output.size();
    JxlEncoderStatus status;
    while ((status = JxlEncoderProcessOutput(enc, &next_out, &avail_out))
               == JXL_ENC_NEED_MORE_OUTPUT) {
        const size_t used = next_out - output.data();
        output.resize(output.size() * 2);
        next_out  = output.data() + used;
        avail_out = output.size() - used;
    }
    JxlEncoderDestroy(enc);

    if (status != JXL_ENC_SUCCESS)
        return "JxlEncoderProcessOutput failed";

    output.resize(static_cast<size_t>(next_out - output.data()));

    FILE* fp = std::fopen(path, "wb");
    if (!fp) return std::string("Cannot open file for writing: ") + path;
    const size_t written = std::fwrite(output.data(), 1, output.size(), fp);
    std::fclose(fp);
    if (written != output.size())
        return std::string("Short write: ") + path;
    return {};  // success
}
#endif  // HAVE_JXL

// ---------------------------------------------------------------------------
// Animation frame sequence
// ---------------------------------------------------------------------------
bool resolution_preset(const std::string& name, int& w, int& h)
{
    if (name == "720p")  { w = 1280; h = 720;  return true; }
    if (name == "1080p") { w = 1920; h = 1080; return true; }
    return false;
}

int sequence_frame_count(const SequenceExport& opts)
{
    return static_cast<int>(std::ceil(opts.duration * opts.fps));
}

SceneState sequence_frame_scene(const SceneState& scene, const SequenceExport& opts,
                                int index)
{
    SceneState fs = scene;
    fs.width   = opts.width;
    fs.height  = opts.height;
    fs.density = 1;
    advance_rotation(fs, index);
    if (fs.dither.seed)
        fs.dither.seed = *fs.dither.seed + static_cast<uint32_t>(index);
    return fs;
}

std::string export_png_sequence(const SceneState& scene, const SequenceExport& opts,
                                const ExportProgress& progress)
{
    parse_color_stops(scene.colors);
    if (dither_quantizes(scene.dither.algorithm) && scene.dither.color_levels < 2)
        throw ConfigError("color levels must be at least 2, got "
                          + std::to_string(scene.dither.color_levels));
    if (opts.width <= 0 || opts.height <= 0)
        return "Export resolution must be positive";

    const int total = sequence_frame_count(opts);
    if (total <= 0)
        return "Nothing to export: duration * fps is zero";

    std::error_code ec;
    std::filesystem::create_directories(opts.directory, ec);
    if (ec)
        return "Cannot create directory " + opts.directory + ": " + ec.message();

    int n_threads = opts.threads;
    if (n_threads < 1) n_threads = static_cast<int>(std::thread::hardware_concurrency());
    if (n_threads < 1) n_threads = 4;
    n_threads = std::min(n_threads, total);

    std::vector<std::unique_ptr<CpuRenderer>> renderers;
    for (int i = 0; i < n_threads; ++i)
        renderers.push_back(std::make_unique<CpuRenderer>());

    std::mutex  mtx;
    std::string first_error;
    int         done = 0;

    if (progress) progress(0.0f, "Rendering frames...");

    {
        ThreadPool pool(n_threads);
        for (int i = 0; i < total; ++i) {
            pool.submit([&, i](int worker) {
                {
                    std::lock_guard<std::mutex> lock(mtx);
                    if (!first_error.empty()) return;
                }

                // Nothing may escape a pool task: the worker would terminate
                // and wait() would never see the frame finish.
                try {
                    const SceneState fs = sequence_frame_scene(scene, opts, i);
                    PixelBuffer      buf;
                    renderers[worker]->render(fs, fs.rotation, buf);

                    char name[32];
                    std::snprintf(name, sizeof(name), "frame%05d.png", i);
                    const std::string path = (std::filesystem::path(opts.directory) / name).string();
                    const std::string err  = export_png(path.c_str(), buf);

                    std::lock_guard<std::mutex> lock(mtx);
                    if (!err.empty() && first_error.empty())
                        first_error = err;
                    ++done;
                    if (progress) {
                        char status[64];
                        std::snprintf(status, sizeof(status), "Frame %d/%d", done, total);
                        progress(static_cast<float>(done) / total, status);
                    }
                } catch (const std::exception& ex) {
                    std::lock_guard<std::mutex> lock(mtx);
                    if (first_error.empty())
                        first_error = "Frame " + std::to_string(i) + ": " + ex.what();
                }
            });
        }
        pool.wait();
    }

    if (!first_error.empty())
        return first_error;
    if (progress) progress(1.0f, "Complete");
    return {};  // success
}
