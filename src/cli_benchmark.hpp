#pragma once

#include "cpu_renderer.hpp"
#include "scene_state.hpp"
#include <cstdio>
#include <algorithm>
#include <vector>

inline int run_cli_benchmark()
{
    CpuRenderer renderer;

    constexpr int W = 1920, H = 1080, RUNS = 4, BEST_N = 2;
    PixelBuffer buf;

    struct TestCase {
        const char*     label;
        GradientType    gradient;
        DitherAlgorithm algorithm;
        int             size;
    };

    const TestCase tests[] = {
        {"Gradient only (radial)",     GradientType::Radial, DitherAlgorithm::None,           4},
        {"Gradient only (conic)",      GradientType::Conic,  DitherAlgorithm::None,           4},
        {"Bayer 4x4",                  GradientType::Radial, DitherAlgorithm::Bayer,          4},
        {"Bayer 16x16",                GradientType::Radial, DitherAlgorithm::Bayer,          16},
        {"Floyd-Steinberg (scale 1)",  GradientType::Radial, DitherAlgorithm::FloydSteinberg, 1},
        {"Floyd-Steinberg (scale 4)",  GradientType::Radial, DitherAlgorithm::FloydSteinberg, 4},
        {"Atkinson (scale 1)",         GradientType::Radial, DitherAlgorithm::Atkinson,       1},
        {"Atkinson (scale 4)",         GradientType::Radial, DitherAlgorithm::Atkinson,       4},
        {"Random (grain 1)",           GradientType::Radial, DitherAlgorithm::Random,         1},
        {"Random (grain 4)",           GradientType::Radial, DitherAlgorithm::Random,         4},
    };

    printf("Gradient Dither CLI Benchmark\n");
    printf("%dx%d, 4 levels, strength 0.5, %d runs (avg best %d)\n", W, H, RUNS, BEST_N);
    printf("%-30s %10s %10s\n", "Label", "ms", "Mpix/s");
    printf("------------------------------------------------------\n");

    for (const auto& t : tests) {
        SceneState scene;
        scene.width            = W;
        scene.height           = H;
        scene.gradient         = t.gradient;
        scene.colors           = palette_colors(0, 5);
        scene.dither.algorithm = t.algorithm;
        scene.dither.size      = t.size;
        scene.dither.strength  = 0.5;

        // Warm-up
        renderer.render(scene, 0.0, buf);

        std::vector<double> times(RUNS);
        for (int r = 0; r < RUNS; ++r) {
            renderer.render(scene, 0.1 * r, buf);
            times[r] = renderer.last_render_ms;
        }
        std::sort(times.begin(), times.end());
        double avg_ms = 0.0;
        for (int i = 0; i < BEST_N; ++i) avg_ms += times[i];
        avg_ms /= BEST_N;
        const double mpixs = (W * H) / (avg_ms * 1000.0);

        printf("%-30s %10.2f %10.2f\n", t.label, avg_ms, mpixs);
    }

    return 0;
}
