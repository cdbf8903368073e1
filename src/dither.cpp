#include "dither.hpp"
#include "config_error.hpp"

#include <algorithm>
#include <random>
#include <vector>

static const DiffusionTap k_floyd_steinberg_taps[] = {
    { 1, 0, 7.0f / 16.0f},
    {-1, 1, 3.0f / 16.0f},
    { 0, 1, 5.0f / 16.0f},
    { 1, 1, 1.0f / 16.0f},
};

// Six targets at 1/8 each; the remaining 2/8 of the error is dropped.
static const DiffusionTap k_atkinson_taps[] = {
    { 1, 0, 1.0f / 8.0f},
    { 2, 0, 1.0f / 8.0f},
    {-1, 1, 1.0f / 8.0f},
    { 0, 1, 1.0f / 8.0f},
    { 1, 1, 1.0f / 8.0f},
    { 0, 2, 1.0f / 8.0f},
};

const DiffusionKernel FLOYD_STEINBERG_KERNEL = {k_floyd_steinberg_taps, 4};
const DiffusionKernel ATKINSON_KERNEL        = {k_atkinson_taps, 6};

const char* dither_algorithm_name(DitherAlgorithm algo)
{
    switch (algo) {
        case DitherAlgorithm::Bayer:          return "bayer";
        case DitherAlgorithm::FloydSteinberg: return "floyd-steinberg";
        case DitherAlgorithm::Atkinson:       return "atkinson";
        case DitherAlgorithm::Random:         return "random";
        case DitherAlgorithm::None:           return "none";
    }
    return "none";
}

DitherAlgorithm parse_dither_algorithm(const std::string& name)
{
    for (int i = 0; i < DITHER_ALGORITHM_COUNT; ++i) {
        const auto algo = static_cast<DitherAlgorithm>(i);
        if (name == dither_algorithm_name(algo))
            return algo;
    }
    return DitherAlgorithm::None;
}

bool dither_quantizes(DitherAlgorithm algo)
{
    switch (algo) {
        case DitherAlgorithm::Bayer:
        case DitherAlgorithm::FloydSteinberg:
        case DitherAlgorithm::Atkinson:
        case DitherAlgorithm::Random:
            return true;
        case DitherAlgorithm::None:
            return false;
    }
    return false;
}

static inline uint8_t clamp_channel(double v)
{
    return static_cast<uint8_t>(std::max(0.0, std::min(255.0, v)));
}

// ---------------------------------------------------------------------------
// Ordered: threshold = (m / max - 0.5) * strength * 255 added before quantize.
// ---------------------------------------------------------------------------
void DitherEngine::ordered(const PixelBuffer& in, const DitherSettings& s, PixelBuffer& out)
{
    const BayerMatrix& m     = bayer.get(s.size);
    const double       scale = s.strength * 255.0;

    for (int y = 0; y < in.height; ++y) {
        const int my = y % m.size;
        for (int x = 0; x < in.width; ++x) {
            const double threshold =
                (static_cast<double>(m.at(x % m.size, my)) / m.max - 0.5) * scale;
            const uint8_t* src = in.at(x, y);
            uint8_t*       dst = out.at(x, y);
            for (int c = 0; c < 3; ++c) {
                const double v = std::max(0.0, std::min(255.0, src[c] + threshold));
                dst[c] = clamp_channel(quantize(v, s.color_levels));
            }
            dst[3] = 255;
        }
    }
}

// ---------------------------------------------------------------------------
// Error diffusion shell shared by Floyd-Steinberg and Atkinson.
// Errors accumulate in a float working buffer so that rounding does not
// compound; only the upsample step converts back to 8 bits.
// ---------------------------------------------------------------------------
void DitherEngine::diffuse(const PixelBuffer& in, int scale, double strength,
                           int levels, const DiffusionKernel& kernel, PixelBuffer& out)
{
    scale = std::max(1, scale);
    const int W  = in.width;
    const int H  = in.height;
    const int sw = std::max(1, W / scale);
    const int sh = std::max(1, H / scale);

    out.resize(W, H);
    if (W <= 0 || H <= 0) return;

    // Downsample: nearest neighbor, RGB only.
    std::vector<float> work(static_cast<size_t>(sw) * sh * 3);
    for (int y = 0; y < sh; ++y) {
        const int sy = std::min(y * scale, H - 1);
        for (int x = 0; x < sw; ++x) {
            const int      sx  = std::min(x * scale, W - 1);
            const uint8_t* src = in.at(sx, sy);
            float*         dst = &work[3 * (static_cast<size_t>(y) * sw + x)];
            dst[0] = src[0];
            dst[1] = src[1];
            dst[2] = src[2];
        }
    }

    // Raster-order diffusion.
    for (int y = 0; y < sh; ++y) {
        for (int x = 0; x < sw; ++x) {
            float* px = &work[3 * (static_cast<size_t>(y) * sw + x)];
            for (int c = 0; c < 3; ++c) {
                const double old_value = px[c];
                const int    new_value = quantize(old_value, levels);
                px[c] = static_cast<float>(new_value);

                const double error = (old_value - new_value) * strength;
                for (int k = 0; k < kernel.count; ++k) {
                    const DiffusionTap& tap = kernel.taps[k];
                    const int tx = x + tap.dx;
                    const int ty = y + tap.dy;
                    if (tx < 0 || tx >= sw || ty >= sh) continue;
                    work[3 * (static_cast<size_t>(ty) * sw + tx) + c] +=
                        static_cast<float>(error * tap.weight);
                }
            }
        }
    }

    // Upsample: nearest neighbor, clamped to the working extent.
    for (int y = 0; y < H; ++y) {
        const int sy = std::min(y / scale, sh - 1);
        for (int x = 0; x < W; ++x) {
            const int    sx  = std::min(x / scale, sw - 1);
            const float* src = &work[3 * (static_cast<size_t>(sy) * sw + sx)];
            uint8_t*     dst = out.at(x, y);
            dst[0] = clamp_channel(src[0]);
            dst[1] = clamp_channel(src[1]);
            dst[2] = clamp_channel(src[2]);
            dst[3] = 255;
        }
    }
}

// ---------------------------------------------------------------------------
// Random: one uniform sample in [-0.5, 0.5) * strength * 255 per grain cell.
// ---------------------------------------------------------------------------
void DitherEngine::noise(const PixelBuffer& in, const DitherSettings& s, PixelBuffer& out)
{
    const int grain = std::max(1, s.size);
    const int nw    = (in.width  + grain - 1) / grain;
    const int nh    = (in.height + grain - 1) / grain;

    std::mt19937 rng;
    if (s.seed) {
        rng.seed(*s.seed);
    } else {
        std::random_device rd;
        rng.seed(rd());
    }
    std::uniform_real_distribution<double> uniform(0.0, 1.0);

    std::vector<double> cells(static_cast<size_t>(nw) * nh);
    for (auto& v : cells)
        v = (uniform(rng) - 0.5) * s.strength * 255.0;

    for (int y = 0; y < in.height; ++y) {
        const double* row = &cells[static_cast<size_t>(y / grain) * nw];
        for (int x = 0; x < in.width; ++x) {
            const double   n   = row[x / grain];
            const uint8_t* src = in.at(x, y);
            uint8_t*       dst = out.at(x, y);
            for (int c = 0; c < 3; ++c) {
                const double v = std::max(0.0, std::min(255.0, src[c] + n));
                dst[c] = clamp_channel(quantize(v, s.color_levels));
            }
            dst[3] = 255;
        }
    }
}

// ---------------------------------------------------------------------------
// Dispatch
// ---------------------------------------------------------------------------
void DitherEngine::apply(const PixelBuffer& in, const DitherSettings& s, PixelBuffer& out)
{
    if (!dither_quantizes(s.algorithm)) {
        out = in;
        return;
    }
    if (s.color_levels < 2)
        throw ConfigError("color levels must be at least 2, got "
                          + std::to_string(s.color_levels));

    switch (s.algorithm) {
        case DitherAlgorithm::Bayer:
            out.resize(in.width, in.height);
            ordered(in, s, out);
            break;
        case DitherAlgorithm::FloydSteinberg:
            diffuse(in, s.size, s.strength, s.color_levels, FLOYD_STEINBERG_KERNEL, out);
            break;
        case DitherAlgorithm::Atkinson:
            diffuse(in, s.size, s.strength, s.color_levels, ATKINSON_KERNEL, out);
            break;
        case DitherAlgorithm::Random:
            out.resize(in.width, in.height);
            noise(in, s, out);
            break;
        case DitherAlgorithm::None:
            break;
    }
}

PixelBuffer DitherEngine::apply(const PixelBuffer& in, const DitherSettings& s)
{
    PixelBuffer out;
    apply(in, s, out);
    return out;
}
