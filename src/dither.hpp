#pragma once

#include "bayer.hpp"
#include "renderer.hpp"

#include <cmath>
#include <cstdint>
#include <optional>
#include <string>

enum class DitherAlgorithm {
    Bayer          = 0,  // ordered, threshold from a Bayer tile
    FloydSteinberg = 1,  // error diffusion, 7/3/5/1 sixteenths
    Atkinson       = 2,  // error diffusion, 6 x 1/8, 2/8 discarded
    Random         = 3,  // uniform noise per grain cell
    None           = 4,  // pass-through
};
constexpr int DITHER_ALGORITHM_COUNT = 4;  // selectable algorithms (excludes None)

const char* dither_algorithm_name(DitherAlgorithm algo);

// Unknown names map to DitherAlgorithm::None.
DitherAlgorithm parse_dither_algorithm(const std::string& name);

// True for the four quantizing algorithms; false means pass-through.
bool dither_quantizes(DitherAlgorithm algo);

struct DitherSettings {
    DitherAlgorithm algorithm    = DitherAlgorithm::Bayer;
    double          strength     = 0.5;  // 0..1
    int             size         = 4;    // tile size / downsample factor / grain
    int             color_levels = 4;    // >= 2
    // Noise seed for DitherAlgorithm::Random. Unset: a fresh
    // non-deterministic stream per call.
    std::optional<uint32_t> seed;
};

// Snaps v to the nearest of `levels` evenly spaced values over [0,255].
// The result is not clamped: inputs outside [0,255] may map one step
// beyond the range.
inline int quantize(double value, int levels)
{
    const double step = 255.0 / (levels - 1);
    return static_cast<int>(std::floor(std::floor(value / step + 0.5) * step + 0.5));
}

// One error-diffusion target relative to the current pixel.
struct DiffusionTap {
    int   dx;
    int   dy;
    float weight;  // fraction of the strength-scaled error
};

struct DiffusionKernel {
    const DiffusionTap* taps;
    int                 count;
};

extern const DiffusionKernel FLOYD_STEINBERG_KERNEL;
extern const DiffusionKernel ATKINSON_KERNEL;

class DitherEngine {
public:
    // Writes a dithered copy of in into out (resized to match; alpha 255).
    // out must not alias in. Throws ConfigError if color_levels < 2 for
    // any quantizing algorithm.
    void apply(const PixelBuffer& in, const DitherSettings& s, PixelBuffer& out);

    PixelBuffer apply(const PixelBuffer& in, const DitherSettings& s);

    // Downsample by `scale`, diffuse in raster order with the given kernel,
    // upsample nearest-neighbor. Exposed for custom kernels.
    static void diffuse(const PixelBuffer& in, int scale, double strength,
                        int levels, const DiffusionKernel& kernel, PixelBuffer& out);

    const BayerMatrix& bayer_matrix(int requested_size) { return bayer.get(requested_size); }

private:
    void ordered(const PixelBuffer& in, const DitherSettings& s, PixelBuffer& out);
    static void noise(const PixelBuffer& in, const DitherSettings& s, PixelBuffer& out);

    BayerCache bayer;
};
