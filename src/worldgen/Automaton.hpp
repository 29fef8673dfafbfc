#pragma once
#include <cstdint>

#include "worldgen/WorldGenTypes.hpp"
#include "worldgen/Random.hpp"
#include "worldgen/Rules.hpp"

namespace islandgen::jobs { class JobSystem; }

namespace islandgen::worldgen {

// How stochastic rules are fed during one pass.
enum class DrawScheme : std::uint8_t {
    // One draw per cell from the shared stream, row-major order. Reference behavior;
    // stochastic passes always run on the calling thread.
    Sequential = 0,
    // The pass snapshots the stream, advances it by one draw, and cell (x,y) draws from
    // sub_rng(snapshot, x, y). Order-independent, so rows may run in parallel.
    PerCell,
};

[[nodiscard]] const char* draw_scheme_name(DrawScheme s) noexcept;

struct StepOptions {
    DrawScheme        scheme = DrawScheme::Sequential;
    jobs::JobSystem*  jobs   = nullptr;   // optional; rows run on its executor when allowed
};

// One automaton generation. Neighbor counts are read from `in` only; the result is a
// freshly allocated grid of identical dimensions. Throws ConfigError when `rule` is
// stochastic and `rng` is null.
[[nodiscard]] CellGrid step(const CellGrid& in, RuleKind rule, Pcg32* rng,
                            const StepOptions& opt = {});

// `iterations` sequential steps, each consuming the previous output.
// Throws ConfigError when iterations < 1.
[[nodiscard]] CellGrid iterate(const CellGrid& in, RuleKind rule, int iterations, Pcg32* rng,
                               const StepOptions& opt = {});

} // namespace islandgen::worldgen
