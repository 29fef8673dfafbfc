#include "worldgen/Neighbors.hpp"

namespace islandgen::worldgen {

int count_live_neighbors(const CellGrid& g, int x, int y) noexcept
{
    int c = 0;
    for (int dy = -1; dy <= 1; ++dy)
    for (int dx = -1; dx <= 1; ++dx) {
        if (dx == 0 && dy == 0) continue;
        const int nx = x + dx, ny = y + dy;
        if (!g.inBounds(nx, ny)) continue;
        c += (g.at(nx, ny) == kLand) ? 1 : 0;
    }
    return c;
}

} // namespace islandgen::worldgen
