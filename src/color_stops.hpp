#pragma once

#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

struct Rgb {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
};

inline bool operator==(const Rgb& a, const Rgb& b)
{
    return a.r == b.r && a.g == b.g && a.b == b.b;
}

// Nearest integer, halves rounded towards +infinity.
inline double round_half_up(double v)
{
    return std::floor(v + 0.5);
}

// Parses "#rrggbb" or "rrggbb" (any case). Returns false and leaves out
// untouched on malformed input.
bool parse_hex_color(const std::string& hex, Rgb& out);

// Like parse_hex_color, but malformed input yields black.
Rgb hex_to_rgb(const std::string& hex);

std::string rgb_to_hex(const Rgb& c);

// Parses an ordered stop list once. Order and duplicates are preserved.
// Throws ConfigError if fewer than 2 stops are given.
std::vector<Rgb> parse_color_stops(const std::vector<std::string>& hex_colors);

// Piecewise-linear interpolation over equally spaced stops.
// Requires stops.size() >= 2 and t in [0,1]; callers normalize t.
inline Rgb lerp_colors(const std::vector<Rgb>& stops, double t)
{
    const int    segments = static_cast<int>(stops.size()) - 1;
    const double scaled   = t * segments;
    int seg = static_cast<int>(std::floor(scaled));
    if (seg > segments - 1) seg = segments - 1;
    if (seg < 0)            seg = 0;
    const double local = scaled - seg;

    const Rgb& a = stops[seg];
    const Rgb& b = stops[seg + 1];
    Rgb c;
    c.r = static_cast<uint8_t>(round_half_up(a.r + (b.r - a.r) * local));
    c.g = static_cast<uint8_t>(round_half_up(a.g + (b.g - a.g) * local));
    c.b = static_cast<uint8_t>(round_half_up(a.b + (b.b - a.b) * local));
    return c;
}

// ---------------------------------------------------------------------------
// Named color-stop presets for the control surface
// ---------------------------------------------------------------------------
static constexpr int PALETTE_COUNT      = 6;
static constexpr int PALETTE_MAX_COLORS = 8;

extern const char* g_palette_names[PALETTE_COUNT];

// First `count` colors (1..PALETTE_MAX_COLORS) of preset `palette` as hex.
std::vector<std::string> palette_colors(int palette, int count);
