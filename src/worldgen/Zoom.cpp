#include "worldgen/Zoom.hpp"

#include <limits>
#include <string>

namespace islandgen::worldgen {

CellGrid zoom(const CellGrid& in, int factor)
{
    if (factor < 1)
        throw ConfigError("zoom factor must be >= 1 (got " + std::to_string(factor) + ")");
    if (in.width()  > std::numeric_limits<int>::max() / factor ||
        in.height() > std::numeric_limits<int>::max() / factor)
        throw ConfigError("zoom factor " + std::to_string(factor) + " overflows the grid size");

    const int W = in.width() * factor;
    const int H = in.height() * factor;
    CellGrid out(W, H, kOcean);

    for (int y = 0; y < H; ++y) {
        const Cell* src = in.rowPtr(y / factor);
        Cell*       dst = out.rowPtr(y);
        for (int x = 0; x < W; ++x)
            dst[x] = src[x / factor];
    }
    return out;
}

} // namespace islandgen::worldgen
