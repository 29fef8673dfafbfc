#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "worldgen/WorldGenTypes.hpp"

namespace islandgen::worldgen {

// "heightmap_<seed>.txt"
[[nodiscard]] std::string heightmap_filename(std::int64_t seed);

// One row per line, cells separated by a single space, trailing newline.
[[nodiscard]] std::string format_heightmap(const CellGrid& g);

// Strict inverse of format_heightmap. Blank lines are ignored; ragged rows,
// non-numeric tokens or values outside {0,1} throw ConfigError.
[[nodiscard]] CellGrid parse_heightmap_text(std::string_view text);

// Writes to "<path>.tmp" then renames over `path`, creating parent directories.
// Throws std::runtime_error on any I/O failure.
void write_heightmap_text(const CellGrid& g, const std::filesystem::path& path);

} // namespace islandgen::worldgen
