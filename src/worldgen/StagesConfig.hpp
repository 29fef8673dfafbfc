#pragma once

#include <filesystem>
#include <optional>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "worldgen/GeneratorSettings.hpp"
#include "worldgen/StagesTypes.hpp"

namespace islandgen::worldgen {

// Aggregate runtime config loaded from JSON, e.g. assets/config/islandgen.json:
//
//   {
//     "seed": 42,
//     "start_size": [4, 4],
//     "draw_scheme": "sequential",
//     "workers": 1,
//     "output_dir": "out",
//     "stages": [
//       { "kind": "seed", "fill": 0.1 },
//       { "kind": "zoom", "factor": 2 },
//       { "kind": "automaton", "rule": "add_island", "iterations": 3 }
//     ]
//   }
//
// Missing keys keep their defaults. Present keys of the wrong type are errors.
struct PipelineConfig {
    GeneratorSettings         settings{};
    std::optional<std::int64_t> seed;          // settings.seed is only meaningful when set
    std::vector<StageDesc>    stages = reference_stages();
    std::filesystem::path     outputDir = ".";
};

class StagesConfig {
public:
    // Throws std::runtime_error if the file cannot be read, ConfigError if its
    // content is malformed.
    static PipelineConfig load(const std::filesystem::path& path);

    // Throws ConfigError on malformed content.
    static PipelineConfig from_json(const nlohmann::json& root);

    // assets/config/islandgen.json (relative to the working directory)
    static std::filesystem::path default_path();
};

} // namespace islandgen::worldgen
