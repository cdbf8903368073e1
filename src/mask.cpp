#include "mask.hpp"

#include <algorithm>
#include <cstring>

void composite_mask(const PixelBuffer& gradient, const PixelBuffer& mask,
                    const Rgb& background, PixelBuffer& out)
{
    const size_t n = gradient.pixels.size();
    const uint8_t* g = gradient.pixels.data();
    const uint8_t* m = mask.pixels.data();
    uint8_t*       o = out.pixels.data();

    for (size_t i = 0; i < n; i += 4) {
        const double a  = m[i] / 255.0;
        const double ia = 1.0 - a;
        o[i]     = static_cast<uint8_t>(round_half_up(g[i]     * a + background.r * ia));
        o[i + 1] = static_cast<uint8_t>(round_half_up(g[i + 1] * a + background.g * ia));
        o[i + 2] = static_cast<uint8_t>(round_half_up(g[i + 2] * a + background.b * ia));
        o[i + 3] = 255;
    }
}

void make_solid_mask(PixelBuffer& buf, int w, int h, uint8_t value)
{
    buf.width  = w;
    buf.height = h;
    buf.pixels.assign(static_cast<size_t>(w) * static_cast<size_t>(h) * 4, value);
}

void resample_nearest(const PixelBuffer& src, int w, int h, PixelBuffer& dst)
{
    dst.resize(w, h);
    if (src.width <= 0 || src.height <= 0) return;

    if (src.width == w && src.height == h) {
        std::memcpy(dst.pixels.data(), src.pixels.data(), src.pixels.size());
        return;
    }

    for (int y = 0; y < h; ++y) {
        const int sy = std::min(static_cast<int>(static_cast<long long>(y) * src.height / h),
                                src.height - 1);
        for (int x = 0; x < w; ++x) {
            const int sx = std::min(static_cast<int>(static_cast<long long>(x) * src.width / w),
                                    src.width - 1);
            std::memcpy(dst.at(x, y), src.at(sx, sy), 4);
        }
    }
}
