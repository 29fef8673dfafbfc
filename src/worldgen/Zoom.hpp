#pragma once
#include "worldgen/WorldGenTypes.hpp"

namespace islandgen::worldgen {

// Nearest-neighbor magnification: every cell becomes a factor x factor block,
// out[x,y] = in[x / factor, y / factor]. Throws ConfigError for factor < 1.
[[nodiscard]] CellGrid zoom(const CellGrid& in, int factor);

} // namespace islandgen::worldgen
