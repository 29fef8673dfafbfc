#pragma once
#include "worldgen/WorldGenTypes.hpp"

namespace islandgen::worldgen {

// Number of cells equal to kLand in the 8-connected (Moore) neighborhood of (x,y).
// Offsets falling outside the grid are skipped: no wraparound and no clamping, so
// corners see at most 3 neighbors and edge cells at most 5.
[[nodiscard]] int count_live_neighbors(const CellGrid& g, int x, int y) noexcept;

} // namespace islandgen::worldgen
