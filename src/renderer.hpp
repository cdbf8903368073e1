#pragma once

#include <vector>
#include <cstddef>
#include <cstdint>

struct SceneState;

// Pixel buffer: RGBA, 8 bits per channel, row-major.
// pixels.size() == width * height * 4
struct PixelBuffer {
    std::vector<uint8_t> pixels;
    int width  = 0;
    int height = 0;

    // Reallocates and clears to opaque black.
    void resize(int w, int h)
    {
        width  = w;
        height = h;
        pixels.assign(static_cast<size_t>(w) * static_cast<size_t>(h) * 4, 0);
        for (size_t i = 3; i < pixels.size(); i += 4)
            pixels[i] = 255;
    }

    uint8_t* at(int x, int y)
    {
        return pixels.data() + 4 * (static_cast<size_t>(y) * width + x);
    }

    const uint8_t* at(int x, int y) const
    {
        return pixels.data() + 4 * (static_cast<size_t>(y) * width + x);
    }
};

class IFrameRenderer {
public:
    virtual ~IFrameRenderer() = default;
    // rotation is the host-owned phase in radians; any magnitude is accepted.
    virtual void render(const SceneState& scene, double rotation, PixelBuffer& buf) = 0;
};
