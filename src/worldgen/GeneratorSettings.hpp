// src/worldgen/GeneratorSettings.hpp
#pragma once
#include <cstdint>

#include "worldgen/Automaton.hpp"   // DrawScheme

namespace islandgen::worldgen {

// Keep this header tiny and stable: it's included widely.
struct GeneratorSettings {
    std::int64_t seed        = 0;    // any signed 64-bit value; reinterpreted as the PCG seed
    int          startWidth  = 4;    // seed grid, cells
    int          startHeight = 4;
    DrawScheme   drawScheme  = DrawScheme::Sequential;
    unsigned     workers     = 1;    // > 1 enables the Taskflow row loop where allowed
};

} // namespace islandgen::worldgen
