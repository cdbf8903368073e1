#pragma once

#include "color_stops.hpp"
#include "renderer.hpp"

// out = gradient * m + background * (1 - m), m = mask red / 255.
// All three buffers must have the same dimensions (unchecked). out may
// alias gradient. Output alpha is always 255.
void composite_mask(const PixelBuffer& gradient, const PixelBuffer& mask,
                    const Rgb& background, PixelBuffer& out);

// Fills buf (resized to w x h) with a uniform gray mask.
void make_solid_mask(PixelBuffer& buf, int w, int h, uint8_t value = 255);

// Nearest-neighbor resample of src into dst at w x h.
void resample_nearest(const PixelBuffer& src, int w, int h, PixelBuffer& dst);
