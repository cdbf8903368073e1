#include <gtest/gtest.h>

#include "scene_config.hpp"
#include "test_paths.hpp"

#include <algorithm>
#include <fstream>

namespace {
bool has_warning(const SceneConfigResult& result, const std::string& needle) {
    return std::any_of(result.warnings.begin(), result.warnings.end(),
                       [&](const std::string& w) { return w.find(needle) != std::string::npos; });
}

} // namespace

TEST(SceneConfigTest, EmptyDocumentKeepsDefaults) {
    const SceneConfigResult result = load_scene_config_from_string("");
    EXPECT_TRUE(result.warnings.empty());
    const SceneState defaults;
    EXPECT_EQ(result.config.scene.gradient, defaults.gradient);
    EXPECT_EQ(result.config.scene.colors, defaults.colors);
    EXPECT_EQ(result.config.scene.dither.algorithm, DitherAlgorithm::Bayer);
    EXPECT_EQ(result.config.scene.dither.color_levels, 4);
    EXPECT_FALSE(result.config.scene.dither.seed.has_value());
    EXPECT_EQ(result.config.sequence.fps, 60);
}

TEST(SceneConfigTest, ReadsEveryTable) {
    const SceneConfigResult result = load_scene_config_from_string(R"(
[gradient]
type = "conic"
colors = ["#000000", "#ff0000", "#ffffff"]
speed = 2.5
playing = false
rotation = 1.5

[dither]
algorithm = "atkinson"
strength = 0.25
size = 8
color_levels = 6
seed = 42

[background]
color = "#102030"

[mask]
path = "masks/logo.png"

[canvas]
width = 800
height = 400
density = 2

[export]
resolution = "720p"
fps = 30
duration = 2
)", "/tmp/scenes");

    EXPECT_TRUE(result.warnings.empty()) << result.warnings.front();
    const SceneState& s = result.config.scene;
    EXPECT_EQ(s.gradient, GradientType::Conic);
    EXPECT_EQ(s.colors, (std::vector<std::string>{"#000000", "#ff0000", "#ffffff"}));
    EXPECT_DOUBLE_EQ(s.speed, 2.5);
    EXPECT_FALSE(s.playing);
    EXPECT_DOUBLE_EQ(s.rotation, 1.5);
    EXPECT_EQ(s.dither.algorithm, DitherAlgorithm::Atkinson);
    EXPECT_DOUBLE_EQ(s.dither.strength, 0.25);
    EXPECT_EQ(s.dither.size, 8);
    EXPECT_EQ(s.dither.color_levels, 6);
    ASSERT_TRUE(s.dither.seed.has_value());
    EXPECT_EQ(*s.dither.seed, 42u);
    EXPECT_EQ(s.background, "#102030");
    EXPECT_EQ(s.mask_path, "/tmp/scenes/masks/logo.png");
    EXPECT_EQ(s.width, 800);
    EXPECT_EQ(s.height, 400);
    EXPECT_EQ(s.density, 2);

    const SequenceExport& e = result.config.sequence;
    EXPECT_EQ(e.width, 1280);
    EXPECT_EQ(e.height, 720);
    EXPECT_EQ(e.fps, 30);
    EXPECT_DOUBLE_EQ(e.duration, 2.0);
}

TEST(SceneConfigTest, OutOfRangeValuesAreClampedWithWarnings) {
    const SceneConfigResult result = load_scene_config_from_string(R"(
[gradient]
speed = -1.0

[dither]
strength = 3.0
size = 40
color_levels = 1

[export]
fps = 100
duration = 0.1
)");
    const SceneState& s = result.config.scene;
    EXPECT_DOUBLE_EQ(s.speed, 0.0);
    EXPECT_DOUBLE_EQ(s.dither.strength, 1.0);
    EXPECT_EQ(s.dither.size, 16);
    EXPECT_EQ(s.dither.color_levels, 2);
    EXPECT_EQ(result.config.sequence.fps, 60);
    EXPECT_DOUBLE_EQ(result.config.sequence.duration, 1.0);

    EXPECT_TRUE(has_warning(result, "gradient.speed"));
    EXPECT_TRUE(has_warning(result, "dither.strength"));
    EXPECT_TRUE(has_warning(result, "dither.size"));
    EXPECT_TRUE(has_warning(result, "dither.color_levels"));
    EXPECT_TRUE(has_warning(result, "export.fps"));
    EXPECT_TRUE(has_warning(result, "export.duration"));
}

TEST(SceneConfigTest, OversizedIntegersClampInsteadOfWrapping) {
    // 2^32 + 16 would truncate to 16 as a 32-bit int.
    const SceneConfigResult result = load_scene_config_from_string(R"(
[dither]
size = -4294967295

[canvas]
width = 4294967312
height = 9000000000

[export]
width = 100000
height = 8
)");
    EXPECT_EQ(result.config.scene.dither.size, 1);
    EXPECT_EQ(result.config.scene.width, 7680);
    EXPECT_EQ(result.config.scene.height, 4320);
    EXPECT_EQ(result.config.sequence.width, 7680);
    EXPECT_EQ(result.config.sequence.height, 16);
    EXPECT_TRUE(has_warning(result, "canvas.width = 4294967312"));
    EXPECT_TRUE(has_warning(result, "canvas.height"));
    EXPECT_TRUE(has_warning(result, "dither.size"));
    EXPECT_TRUE(has_warning(result, "export.width"));
    EXPECT_TRUE(has_warning(result, "export.height"));
}

TEST(SceneConfigTest, ClampAppliesFileLimitsToLaterOverrides) {
    SceneConfig config;
    config.sequence.width        = 100000;
    config.sequence.height       = 100000;
    config.scene.density         = 9;
    config.scene.dither.size     = 0;
    config.scene.dither.strength = 1.5;
    config.sequence.fps          = 5;

    const std::vector<std::string> warnings = clamp_scene_config(config);
    EXPECT_EQ(config.sequence.width, 7680);
    EXPECT_EQ(config.sequence.height, 4320);
    EXPECT_EQ(config.scene.density, 4);
    EXPECT_EQ(config.scene.dither.size, 1);
    EXPECT_DOUBLE_EQ(config.scene.dither.strength, 1.0);
    EXPECT_EQ(config.sequence.fps, 24);
    EXPECT_EQ(warnings.size(), 6u);

    SceneConfig defaults;
    EXPECT_TRUE(clamp_scene_config(defaults).empty());
}

TEST(SceneConfigTest, UnknownNamesWarnAndFallBack) {
    const SceneConfigResult result = load_scene_config_from_string(R"(
[gradient]
type = "spiral"

[dither]
algorithm = "halftone"

[background]
color = "teal"
)");
    EXPECT_EQ(result.config.scene.gradient, GradientType::Radial);
    EXPECT_EQ(result.config.scene.dither.algorithm, DitherAlgorithm::None);
    EXPECT_EQ(result.config.scene.background, "#000000");
    EXPECT_TRUE(has_warning(result, "spiral"));
    EXPECT_TRUE(has_warning(result, "halftone"));
    EXPECT_TRUE(has_warning(result, "teal"));
}

TEST(SceneConfigTest, NoneAlgorithmIsNotAWarning) {
    const SceneConfigResult result = load_scene_config_from_string("[dither]\nalgorithm = \"none\"\n");
    EXPECT_EQ(result.config.scene.dither.algorithm, DitherAlgorithm::None);
    EXPECT_TRUE(result.warnings.empty());
}

TEST(SceneConfigTest, SingleColorIsRejected) {
    const SceneConfigResult result =
        load_scene_config_from_string("[gradient]\ncolors = [\"#ffffff\"]\n");
    EXPECT_EQ(result.config.scene.colors, SceneState{}.colors);
    EXPECT_TRUE(has_warning(result, "at least 2"));
}

TEST(SceneConfigTest, PalettePresetKeepsStopCount) {
    const SceneConfigResult result = load_scene_config_from_string("[gradient]\npalette = 2\n");
    EXPECT_EQ(result.config.scene.palette, 2);
    EXPECT_EQ(result.config.scene.colors, palette_colors(2, 3));
}

TEST(SceneConfigTest, ParseErrorYieldsDefaultsAndLocation) {
    const SceneConfigResult result = load_scene_config_from_string("[gradient\ntype = \"conic\"\n");
    EXPECT_EQ(result.config.scene.gradient, GradientType::Radial);
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_TRUE(has_warning(result, "parse error"));
    EXPECT_TRUE(has_warning(result, "(line "));
}

TEST(SceneConfigTest, MissingFileIsNotAnError) {
    const SceneConfigResult result = load_scene_config_from_file("/nonexistent/scene.toml");
    EXPECT_FALSE(result.loaded_file);
    EXPECT_TRUE(result.warnings.empty());
}

TEST(SceneConfigTest, FileResolvesMaskBesideIt) {
    ScratchDir dir;
    const std::string path = dir.file("scene.toml");
    std::ofstream(path) << "[mask]\npath = \"logo.png\"\n[dither]\nalgorithm = \"random\"\n";

    const SceneConfigResult result = load_scene_config_from_file(path);
    EXPECT_TRUE(result.loaded_file);
    EXPECT_TRUE(result.warnings.empty());
    EXPECT_EQ(result.config.scene.mask_path, (dir.path / "logo.png").string());
    EXPECT_EQ(result.config.scene.dither.algorithm, DitherAlgorithm::Random);
}
