#include "scene_config.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <string_view>
#include <system_error>

#include <toml++/toml.hpp>

namespace {

using Warnings = std::vector<std::string>;

// Accepted ranges, shared by the file loader and clamp_scene_config().
const double SPEED_MIN = 0.0, SPEED_MAX = 5.0;
const int    SIZE_MIN = 1, SIZE_MAX = 16;
const int    LEVELS_MIN = 2, LEVELS_MAX = 32;
const int    DIM_MIN = 16, WIDTH_MAX = 7680, HEIGHT_MAX = 4320;
const int    DENSITY_MIN = 1, DENSITY_MAX = 4;
const int    FPS_MIN = 24, FPS_MAX = 60;
const double DURATION_MIN = 1.0, DURATION_MAX = 10.0;

double get_double(const toml::table& table, std::string_view key, double fallback)
{
    if (const auto value = table[key].value<double>()) {
        return *value;
    }
    if (const auto value_int = table[key].value<std::int64_t>()) {
        return static_cast<double>(*value_int);
    }
    return fallback;
}

std::int64_t get_int(const toml::table& table, std::string_view key, int fallback)
{
    if (const auto value = table[key].value<std::int64_t>()) {
        return *value;
    }
    return fallback;
}

double clamp_warn(double value, double lo, double hi, const char* name, Warnings& warnings)
{
    if (value < lo || value > hi) {
        std::ostringstream msg;
        msg << name << " = " << value << " is outside [" << lo << ", " << hi << "], clamped";
        warnings.push_back(msg.str());
        return std::max(lo, std::min(hi, value));
    }
    return value;
}

// Clamps in 64 bits so oversized TOML integers never wrap into range.
int clamp_warn(std::int64_t value, int lo, int hi, const char* name, Warnings& warnings)
{
    if (value < lo || value > hi) {
        std::ostringstream msg;
        msg << name << " = " << value << " is outside [" << lo << ", " << hi << "], clamped";
        warnings.push_back(msg.str());
        return value < lo ? lo : hi;
    }
    return static_cast<int>(value);
}

void load_gradient(const toml::table& table, SceneState& scene, Warnings& warnings)
{
    if (const auto type = table["type"].value<std::string>()) {
        if (!parse_gradient_type(*type, scene.gradient)) {
            warnings.push_back("unknown gradient type '" + *type + "', keeping '"
                               + gradient_type_name(scene.gradient) + "'");
        }
    }

    if (const auto palette = table["palette"].value<std::int64_t>()) {
        const int index = clamp_warn(*palette, 0, PALETTE_COUNT - 1,
                                     "gradient.palette", warnings);
        apply_palette_keep_count(scene, index);
    }

    if (const auto* array = table["colors"].as_array()) {
        std::vector<std::string> colors;
        colors.reserve(array->size());
        for (const auto& node : *array) {
            const auto value = node.value<std::string>();
            if (!value) {
                warnings.push_back("gradient.colors entries must be strings");
                continue;
            }
            Rgb parsed;
            if (!parse_hex_color(*value, parsed)) {
                warnings.push_back("gradient.colors: '" + *value + "' is not #rrggbb, using black");
            }
            colors.push_back(*value);
        }
        if (colors.size() >= 2) {
            scene.colors = std::move(colors);
        } else {
            warnings.push_back("gradient.colors needs at least 2 entries, keeping defaults");
        }
    }

    scene.speed = clamp_warn(get_double(table, "speed", scene.speed), SPEED_MIN, SPEED_MAX,
                             "gradient.speed", warnings);
    if (const auto playing = table["playing"].value<bool>()) {
        scene.playing = *playing;
    }
    scene.rotation = get_double(table, "rotation", scene.rotation);
}

void load_dither(const toml::table& table, DitherSettings& dither, Warnings& warnings)
{
    if (const auto algorithm = table["algorithm"].value<std::string>()) {
        dither.algorithm = parse_dither_algorithm(*algorithm);
        if (dither.algorithm == DitherAlgorithm::None && *algorithm != "none") {
            warnings.push_back("unknown dither algorithm '" + *algorithm + "', output is not dithered");
        }
    }
    dither.strength = clamp_warn(get_double(table, "strength", dither.strength), 0.0, 1.0,
                                 "dither.strength", warnings);
    dither.size = clamp_warn(get_int(table, "size", dither.size), SIZE_MIN, SIZE_MAX,
                             "dither.size", warnings);
    dither.color_levels = clamp_warn(get_int(table, "color_levels", dither.color_levels),
                                     LEVELS_MIN, LEVELS_MAX,
                                     "dither.color_levels", warnings);
    if (const auto seed = table["seed"].value<std::int64_t>()) {
        dither.seed = static_cast<uint32_t>(*seed);
    }
}

void load_canvas(const toml::table& table, SceneState& scene, Warnings& warnings)
{
    scene.width   = clamp_warn(get_int(table, "width", scene.width), DIM_MIN, WIDTH_MAX,
                               "canvas.width", warnings);
    scene.height  = clamp_warn(get_int(table, "height", scene.height), DIM_MIN, HEIGHT_MAX,
                               "canvas.height", warnings);
    scene.density = clamp_warn(get_int(table, "density", scene.density), DENSITY_MIN, DENSITY_MAX,
                               "canvas.density", warnings);
}

void load_export(const toml::table& table, SequenceExport& sequence, Warnings& warnings)
{
    if (const auto resolution = table["resolution"].value<std::string>()) {
        if (!resolution_preset(*resolution, sequence.width, sequence.height)) {
            warnings.push_back("unknown export resolution '" + *resolution + "'");
        }
    }
    sequence.width  = clamp_warn(get_int(table, "width", sequence.width), DIM_MIN, WIDTH_MAX,
                                 "export.width", warnings);
    sequence.height = clamp_warn(get_int(table, "height", sequence.height), DIM_MIN, HEIGHT_MAX,
                                 "export.height", warnings);
    sequence.fps = clamp_warn(get_int(table, "fps", sequence.fps), FPS_MIN, FPS_MAX,
                              "export.fps", warnings);
    sequence.duration = clamp_warn(get_double(table, "duration", sequence.duration),
                                   DURATION_MIN, DURATION_MAX, "export.duration", warnings);
    if (const auto directory = table["directory"].value<std::string>()) {
        sequence.directory = *directory;
    }
}

void load_tables(const toml::table& root, const std::filesystem::path& base_dir,
                 SceneConfigResult& result)
{
    SceneState& scene = result.config.scene;

    if (const auto* gradient = root["gradient"].as_table()) {
        load_gradient(*gradient, scene, result.warnings);
    }
    if (const auto* dither = root["dither"].as_table()) {
        load_dither(*dither, scene.dither, result.warnings);
    }
    if (const auto* background = root["background"].as_table()) {
        if (const auto color = (*background)["color"].value<std::string>()) {
            Rgb parsed;
            if (parse_hex_color(*color, parsed)) {
                scene.background = *color;
            } else {
                result.warnings.push_back("background.color '" + *color + "' is not #rrggbb");
            }
        }
    }
    if (const auto* mask = root["mask"].as_table()) {
        if (const auto mask_path = (*mask)["path"].value<std::string>()) {
            std::filesystem::path path{*mask_path};
            if (path.is_relative() && !base_dir.empty()) {
                path = base_dir / path;
            }
            scene.mask_path = path.string();
        }
    }
    if (const auto* canvas = root["canvas"].as_table()) {
        load_canvas(*canvas, scene, result.warnings);
    }
    if (const auto* exp = root["export"].as_table()) {
        load_export(*exp, result.config.sequence, result.warnings);
    }
}

std::string describe_parse_error(const toml::parse_error& err)
{
    std::ostringstream msg;
    msg << "parse error: " << err.description();
    const auto& region = err.source();
    if (region.begin) {
        msg << " (line " << region.begin.line << ", column " << region.begin.column << ")";
    }
    return msg.str();
}

} // namespace

SceneConfigResult load_scene_config_from_string(const std::string& text,
                                                const std::filesystem::path& base_dir)
{
    SceneConfigResult result{};
    try {
        const toml::table root = toml::parse(text);
        load_tables(root, base_dir, result);
    } catch (const toml::parse_error& err) {
        result.config = SceneConfig{};
        result.warnings.push_back(describe_parse_error(err));
    }
    return result;
}

std::vector<std::string> clamp_scene_config(SceneConfig& config)
{
    Warnings        warnings;
    SceneState&     scene    = config.scene;
    DitherSettings& dither   = scene.dither;
    SequenceExport& sequence = config.sequence;

    scene.speed = clamp_warn(scene.speed, SPEED_MIN, SPEED_MAX, "gradient.speed", warnings);
    dither.strength = clamp_warn(dither.strength, 0.0, 1.0, "dither.strength", warnings);
    dither.size = clamp_warn(dither.size, SIZE_MIN, SIZE_MAX, "dither.size", warnings);
    dither.color_levels = clamp_warn(dither.color_levels, LEVELS_MIN, LEVELS_MAX,
                                     "dither.color_levels", warnings);
    scene.width   = clamp_warn(scene.width, DIM_MIN, WIDTH_MAX, "canvas.width", warnings);
    scene.height  = clamp_warn(scene.height, DIM_MIN, HEIGHT_MAX, "canvas.height", warnings);
    scene.density = clamp_warn(scene.density, DENSITY_MIN, DENSITY_MAX, "canvas.density", warnings);
    sequence.width  = clamp_warn(sequence.width, DIM_MIN, WIDTH_MAX, "export.width", warnings);
    sequence.height = clamp_warn(sequence.height, DIM_MIN, HEIGHT_MAX, "export.height", warnings);
    sequence.fps = clamp_warn(sequence.fps, FPS_MIN, FPS_MAX, "export.fps", warnings);
    sequence.duration = clamp_warn(sequence.duration, DURATION_MIN, DURATION_MAX,
                                   "export.duration", warnings);
    return warnings;
}

SceneConfigResult load_scene_config_from_file(const std::filesystem::path& path)
{
    SceneConfigResult result{};

    std::error_code exists_error;
    if (!std::filesystem::exists(path, exists_error)) {
        return result;
    }

    std::ifstream in(path);
    if (!in) {
        result.warnings.push_back("cannot open '" + path.string() + "'");
        return result;
    }
    std::ostringstream text;
    text << in.rdbuf();

    result = load_scene_config_from_string(text.str(), path.parent_path());
    result.loaded_file = true;
    return result;
}
