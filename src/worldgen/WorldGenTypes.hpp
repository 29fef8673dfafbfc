#pragma once
#include <cstdint>
#include <cstddef>
#include <stdexcept>
#include <string>

#include "worldgen/Grid2D.hpp"

namespace islandgen::worldgen {

// Cell payload of every heightmap grid. All rules keep values in {kOcean, kLand}.
using Cell = std::uint8_t;

inline constexpr Cell kOcean = 0;
inline constexpr Cell kLand  = 1;

using CellGrid = Grid2D<Cell>;

// Raised for bad configuration: sizes, zoom factors, iteration counts, missing
// random streams, malformed config documents. Never retried.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

[[nodiscard]] inline std::size_t count_land(const CellGrid& g) noexcept {
    std::size_t n = 0;
    const Cell* p = g.data();
    for (std::size_t i = 0; i < g.size(); ++i)
        n += (p[i] == kLand) ? 1u : 0u;
    return n;
}

} // namespace islandgen::worldgen
