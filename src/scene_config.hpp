#pragma once

#include "export.hpp"
#include "scene_state.hpp"

#include <filesystem>
#include <string>
#include <vector>

struct SceneConfig {
    SceneState     scene{};
    SequenceExport sequence{};
};

struct SceneConfigResult {
    SceneConfig              config{};
    bool                     loaded_file{false};
    std::vector<std::string> warnings{};
};

// Reads a TOML scene file. Never throws: a missing file yields defaults
// with loaded_file == false; parse errors and out-of-range values become
// warnings and the affected fields keep (or clamp to) their defaults.
SceneConfigResult load_scene_config_from_file(const std::filesystem::path& path);

// Same as above for in-memory TOML text; relative mask paths resolve
// against base_dir.
SceneConfigResult load_scene_config_from_string(const std::string& text,
                                                const std::filesystem::path& base_dir = {});

// Clamps every ranged field to the limits the file loader enforces, for
// values set after loading (command-line overrides). Returns one warning
// per clamped field.
std::vector<std::string> clamp_scene_config(SceneConfig& config);
