#include "cli_benchmark.hpp"
#include "config_error.hpp"
#include "cpu_renderer.hpp"
#include "export.hpp"
#include "scene_config.hpp"

#include <cxxopts.hpp>

#include <cstdio>
#include <exception>
#include <string>

static bool ends_with(const std::string& s, const char* suffix)
{
    const std::string suf(suffix);
    return s.size() >= suf.size() && s.compare(s.size() - suf.size(), suf.size(), suf) == 0;
}

int main(int argc, char* argv[])
{
    cxxopts::Options options("gradient_dither_cli",
                             "Render dithered gradients to PNG / JPEG XL or a PNG frame sequence");
    options.add_options()
        ("c,config", "Scene file (TOML)", cxxopts::value<std::string>()->default_value("gradient_dither.toml"))
        ("o,output", "Output image, or directory with --frames", cxxopts::value<std::string>())
        ("r,resolution", "720p or 1080p", cxxopts::value<std::string>())
        ("width", "Output width in pixels", cxxopts::value<int>())
        ("height", "Output height in pixels", cxxopts::value<int>())
        ("g,gradient", "radial, linear or conic", cxxopts::value<std::string>())
        ("a,algorithm", "bayer, floyd-steinberg, atkinson or random", cxxopts::value<std::string>())
        ("strength", "Dither strength 0..1", cxxopts::value<double>())
        ("size", "Tile size / downsample factor / grain", cxxopts::value<int>())
        ("levels", "Color levels per channel (>= 2)", cxxopts::value<int>())
        ("rotation", "Starting rotation phase in radians", cxxopts::value<double>())
        ("seed", "Seed for random dithering", cxxopts::value<uint32_t>())
        ("frames", "Export an animation frame sequence")
        ("fps", "Frames per second for --frames", cxxopts::value<int>())
        ("duration", "Seconds of animation for --frames", cxxopts::value<double>())
        ("threads", "Worker threads for --frames (0 = auto)", cxxopts::value<int>())
        ("benchmark", "Run the dithering benchmark and exit")
        ("h,help", "Print usage");

    try {
        const auto result = options.parse(argc, argv);

        if (result.count("help")) {
            printf("%s\n", options.help().c_str());
            return 0;
        }
        if (result.count("benchmark"))
            return run_cli_benchmark();

        const std::string config_path = result["config"].as<std::string>();
        const SceneConfigResult loaded = load_scene_config_from_file(config_path);
        if (loaded.loaded_file)
            fprintf(stderr, "[config] loaded '%s'\n", config_path.c_str());
        else
            fprintf(stderr, "[config] using built-in defaults (missing '%s')\n", config_path.c_str());
        for (const std::string& warning : loaded.warnings)
            fprintf(stderr, "[config] %s\n", warning.c_str());

        SceneConfig     config   = loaded.config;
        SceneState&     scene    = config.scene;
        SequenceExport& sequence = config.sequence;

        if (result.count("resolution")) {
            const std::string res = result["resolution"].as<std::string>();
            if (!resolution_preset(res, sequence.width, sequence.height)) {
                fprintf(stderr, "Unknown resolution '%s' (use 720p or 1080p)\n", res.c_str());
                return 1;
            }
        }
        if (result.count("width"))  sequence.width  = result["width"].as<int>();
        if (result.count("height")) sequence.height = result["height"].as<int>();
        if (result.count("gradient")) {
            const std::string name = result["gradient"].as<std::string>();
            if (!parse_gradient_type(name, scene.gradient)) {
                fprintf(stderr, "Unknown gradient type '%s'\n", name.c_str());
                return 1;
            }
        }
        if (result.count("algorithm"))
            scene.dither.algorithm = parse_dither_algorithm(result["algorithm"].as<std::string>());
        if (result.count("strength")) scene.dither.strength     = result["strength"].as<double>();
        if (result.count("size"))     scene.dither.size         = result["size"].as<int>();
        if (result.count("levels"))   scene.dither.color_levels = result["levels"].as<int>();
        if (result.count("rotation")) scene.rotation            = result["rotation"].as<double>();
        if (result.count("seed"))     scene.dither.seed         = result["seed"].as<uint32_t>();
        if (result.count("fps"))      sequence.fps              = result["fps"].as<int>();
        if (result.count("duration")) sequence.duration         = result["duration"].as<double>();
        if (result.count("threads"))  sequence.threads          = result["threads"].as<int>();

        for (const std::string& warning : clamp_scene_config(config))
            fprintf(stderr, "[options] %s\n", warning.c_str());

        if (result.count("frames")) {
            if (result.count("output"))
                sequence.directory = result["output"].as<std::string>();
            fprintf(stderr, "[export] %d frames at %dx%d, %d fps -> %s/\n",
                    sequence_frame_count(sequence), sequence.width, sequence.height,
                    sequence.fps, sequence.directory.c_str());

            int last_pct = -1;
            const std::string err = export_png_sequence(scene, sequence,
                [&last_pct](float fraction, const char* status) {
                    const int pct = static_cast<int>(fraction * 100.0f);
                    if (pct / 10 != last_pct / 10) {
                        fprintf(stderr, "[export] %3d%%  %s\n", pct, status);
                        last_pct = pct;
                    }
                });
            if (!err.empty()) {
                fprintf(stderr, "[export] failed: %s\n", err.c_str());
                return 1;
            }
            return 0;
        }

        std::string output = result.count("output") ? result["output"].as<std::string>()
                                                    : std::string("gradient-dither.png");

        CpuRenderer      renderer;
        PixelBuffer      buf;
        const SceneState still = sequence_frame_scene(scene, sequence, 0);
        renderer.render(still, still.rotation, buf);
        if (!renderer.mask_error.empty())
            fprintf(stderr, "[mask] %s (using a solid mask)\n", renderer.mask_error.c_str());

        std::string err;
        if (ends_with(output, ".jxl")) {
#ifdef HAVE_JXL
            err = export_jxl(output.c_str(), buf);
#else
            err = "JPEG XL support was not compiled in";
#endif
        } else {
            err = export_png(output.c_str(), buf);
        }
        if (!err.empty()) {
            fprintf(stderr, "[export] failed: %s\n", err.c_str());
            return 1;
        }
        fprintf(stderr, "[export] %s  %dx%d  %.1f ms\n", output.c_str(),
                buf.width, buf.height, renderer.last_render_ms);
        return 0;
    } catch (const cxxopts::exceptions::exception& ex) {
        fprintf(stderr, "%s\n%s\n", ex.what(), options.help().c_str());
        return 1;
    } catch (const ConfigError& ex) {
        fprintf(stderr, "Configuration error: %s\n", ex.what());
        return 1;
    } catch (const std::exception& ex) {
        fprintf(stderr, "Error: %s\n", ex.what());
        return 1;
    }
}
