#include "gradient.hpp"
#include "config_error.hpp"

#include <algorithm>
#include <cmath>

static constexpr double PI     = 3.14159265358979323846;
static constexpr double TWO_PI = 2.0 * PI;

const char* gradient_type_name(GradientType type)
{
    switch (type) {
        case GradientType::Radial: return "radial";
        case GradientType::Linear: return "linear";
        case GradientType::Conic:  return "conic";
    }
    return "unknown";
}

bool parse_gradient_type(const std::string& name, GradientType& out)
{
    for (int i = 0; i < GRADIENT_TYPE_COUNT; ++i) {
        const auto type = static_cast<GradientType>(i);
        if (name == gradient_type_name(type)) {
            out = type;
            return true;
        }
    }
    return false;
}

double normalize_rotation(double rotation)
{
    double r = std::fmod(rotation, TWO_PI);
    if (r < 0.0) r += TWO_PI;
    if (r >= TWO_PI) r = 0.0;  // fmod of a tiny negative can round up to 2*pi
    return r;
}

// Wraps into [0,1).
static double wrap_unit(double t)
{
    t = std::fmod(t, 1.0);
    if (t < 0.0) t += 1.0;
    if (t >= 1.0) t = 0.0;
    return t;
}

static inline void put(uint8_t* px, const Rgb& c)
{
    px[0] = c.r;
    px[1] = c.g;
    px[2] = c.b;
    px[3] = 255;
}

// ---------------------------------------------------------------------------
// Radial: t = distance / radius, shifted by the rotation phase.
// Pixels at or beyond the radius saturate at t = 1 and then wrap with the
// phase like every other pixel.
// ---------------------------------------------------------------------------
void fill_radial_gradient(PixelBuffer& buf, const std::vector<Rgb>& stops,
                          const GradientParams& p)
{
    const double d        = p.density;
    const double cx       = p.center_x * d;
    const double cy       = p.center_y * d;
    const double max_dist = p.size * d * 0.5;
    const double phase    = normalize_rotation(p.rotation) / TWO_PI;

    for (int y = 0; y < buf.height; ++y) {
        uint8_t*     row = buf.at(0, y);
        const double dy  = y - cy;
        for (int x = 0; x < buf.width; ++x) {
            const double dx   = x - cx;
            const double dist = std::sqrt(dx * dx + dy * dy);
            double t = max_dist > 0.0 ? std::min(dist / max_dist, 1.0) : 1.0;
            t = wrap_unit(t + phase);
            put(row + 4 * x, lerp_colors(stops, t));
        }
    }
}

// ---------------------------------------------------------------------------
// Linear: project the offset from the buffer center onto the rotated axis.
// ---------------------------------------------------------------------------
void fill_linear_gradient(PixelBuffer& buf, const std::vector<Rgb>& stops,
                          const GradientParams& p)
{
    const double rot      = normalize_rotation(p.rotation);
    const double dir_x    = std::cos(rot);
    const double dir_y    = std::sin(rot);
    const double cx       = buf.width  * 0.5;
    const double cy       = buf.height * 0.5;
    const double max_proj = p.size * p.density * 0.5;

    for (int y = 0; y < buf.height; ++y) {
        uint8_t*     row = buf.at(0, y);
        const double dy  = y - cy;
        for (int x = 0; x < buf.width; ++x) {
            const double proj = (x - cx) * dir_x + dy * dir_y;
            double t = max_proj > 0.0 ? (proj + max_proj) / (2.0 * max_proj) : 0.5;
            t = std::max(0.0, std::min(1.0, t));
            put(row + 4 * x, lerp_colors(stops, t));
        }
    }
}

// ---------------------------------------------------------------------------
// Conic: angle around the center plus rotation, mapped to [0,1).
// ---------------------------------------------------------------------------
void fill_conic_gradient(PixelBuffer& buf, const std::vector<Rgb>& stops,
                         const GradientParams& p)
{
    const double d   = p.density;
    const double cx  = p.center_x * d;
    const double cy  = p.center_y * d;
    const double rot = normalize_rotation(p.rotation);

    for (int y = 0; y < buf.height; ++y) {
        uint8_t*     row = buf.at(0, y);
        const double dy  = y - cy;
        for (int x = 0; x < buf.width; ++x) {
            const double angle = std::atan2(dy, x - cx) + rot;
            const double t     = wrap_unit((angle + PI) / TWO_PI);
            put(row + 4 * x, lerp_colors(stops, t));
        }
    }
}

void render_gradient(GradientType type, PixelBuffer& buf,
                     const std::vector<Rgb>& stops, const GradientParams& p)
{
    if (stops.size() < 2)
        throw ConfigError("gradient needs at least 2 color stops");

    switch (type) {
        case GradientType::Radial: fill_radial_gradient(buf, stops, p); break;
        case GradientType::Linear: fill_linear_gradient(buf, stops, p); break;
        case GradientType::Conic:  fill_conic_gradient(buf, stops, p);  break;
    }
}
