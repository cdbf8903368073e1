#pragma once

#include "color_stops.hpp"
#include "renderer.hpp"

#include <string>
#include <vector>

enum class GradientType {
    Radial = 0,  // concentric rings, rotation cycles the colors outward
    Linear = 1,  // band across the canvas, rotation turns the band
    Conic  = 2,  // angular sweep around the center, rotation spins it
};
constexpr int GRADIENT_TYPE_COUNT = 3;

const char* gradient_type_name(GradientType type);

// Returns false for unknown names; out is left untouched.
bool parse_gradient_type(const std::string& name, GradientType& out);

// Spatial parameters in logical (unscaled) pixels. The target buffer is
// expected to be density times larger on each axis; every length below is
// multiplied by density before use.
struct GradientParams {
    double center_x = 0.0;
    double center_y = 0.0;
    double rotation = 0.0;  // radians, unbounded
    double size     = 600.0;
    int    density  = 1;
};

// Maps any phase into [0, 2*pi).
double normalize_rotation(double rotation);

void fill_radial_gradient(PixelBuffer& buf, const std::vector<Rgb>& stops,
                          const GradientParams& p);
void fill_linear_gradient(PixelBuffer& buf, const std::vector<Rgb>& stops,
                          const GradientParams& p);
void fill_conic_gradient(PixelBuffer& buf, const std::vector<Rgb>& stops,
                         const GradientParams& p);

// Dispatches on type. Throws ConfigError if stops.size() < 2.
void render_gradient(GradientType type, PixelBuffer& buf,
                     const std::vector<Rgb>& stops, const GradientParams& p);
