#include "color_stops.hpp"
#include "config_error.hpp"

#include <algorithm>
#include <cstdio>

const char* g_palette_names[PALETTE_COUNT] = {
    "Default",
    "Sunset",
    "Ocean",
    "Forest",
    "Neon",
    "Grayscale",
};

// ---------------------------------------------------------------------------
// Preset definitions. Every preset carries PALETTE_MAX_COLORS entries so the
// stop count can be changed without switching palettes.
// ---------------------------------------------------------------------------
static const char* const k_palettes[PALETTE_COUNT][PALETTE_MAX_COLORS] = {
    // 0: Default  (warm red, teal, sky blue, golden yellow, deep purple,
    //              bright cyan, coral pink, ocean blue)
    {"#ff6b6b", "#4ecdc4", "#45b7d1", "#f7b731",
     "#5f27cd", "#00d2d3", "#ee5a6f", "#2d98da"},

    // 1: Sunset
    {"#2d1b69", "#b0305c", "#eb564b", "#ff9e4f",
     "#ffd166", "#fff3b0", "#ff7b54", "#6a2c70"},

    // 2: Ocean
    {"#03045e", "#0077b6", "#00b4d8", "#90e0ef",
     "#caf0f8", "#48cae4", "#0096c7", "#023e8a"},

    // 3: Forest
    {"#081c15", "#1b4332", "#2d6a4f", "#52b788",
     "#95d5b2", "#d8f3dc", "#40916c", "#74c69d"},

    // 4: Neon
    {"#ff00ff", "#00ffff", "#ffff00", "#ff0080",
     "#00ff80", "#8000ff", "#ff8000", "#0080ff"},

    // 5: Grayscale
    {"#000000", "#ffffff", "#808080", "#404040",
     "#c0c0c0", "#202020", "#e0e0e0", "#606060"},
};

static int hex_digit(char ch)
{
    if (ch >= '0' && ch <= '9') return ch - '0';
    if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
    if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
    return -1;
}

bool parse_hex_color(const std::string& hex, Rgb& out)
{
    size_t pos = 0;
    if (!hex.empty() && hex[0] == '#') pos = 1;
    if (hex.size() - pos != 6) return false;

    uint8_t ch[3];
    for (int i = 0; i < 3; ++i) {
        const int hi = hex_digit(hex[pos + 2 * i]);
        const int lo = hex_digit(hex[pos + 2 * i + 1]);
        if (hi < 0 || lo < 0) return false;
        ch[i] = static_cast<uint8_t>(hi * 16 + lo);
    }
    out.r = ch[0];
    out.g = ch[1];
    out.b = ch[2];
    return true;
}

Rgb hex_to_rgb(const std::string& hex)
{
    Rgb c;
    if (!parse_hex_color(hex, c))
        return Rgb{};
    return c;
}

std::string rgb_to_hex(const Rgb& c)
{
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", c.r, c.g, c.b);
    return buf;
}

std::vector<Rgb> parse_color_stops(const std::vector<std::string>& hex_colors)
{
    if (hex_colors.size() < 2)
        throw ConfigError("at least 2 color stops are required, got "
                          + std::to_string(hex_colors.size()));

    std::vector<Rgb> stops;
    stops.reserve(hex_colors.size());
    for (const auto& hex : hex_colors)
        stops.push_back(hex_to_rgb(hex));
    return stops;
}

std::vector<std::string> palette_colors(int palette, int count)
{
    palette = std::max(0, std::min(palette, PALETTE_COUNT - 1));
    count   = std::max(1, std::min(count, PALETTE_MAX_COLORS));

    std::vector<std::string> colors;
    colors.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i)
        colors.emplace_back(k_palettes[palette][i]);
    return colors;
}
