#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

#include "worldgen/WorldGenTypes.hpp"
#include "worldgen/Random.hpp"

namespace islandgen::worldgen {

// Closed set of cellular-automaton update rules. Dispatch is an explicit switch in
// apply_rule(); adding a rule means adding a case there and in the name tables.
enum class RuleKind : std::uint8_t {
    GameOfLife = 0,   // B3/S23
    BriansBrain,      // two-state simplification: live always dies, born on >= 6
    AddIsland,        // stochastic, neighbor-proportional land stickiness
    RemoveOcean,      // stochastic, fills open ocean surrounded by ocean
};

// True for rules that draw from a random stream (one draw per cell, every cell).
[[nodiscard]] constexpr bool rule_is_stochastic(RuleKind r) noexcept {
    return r == RuleKind::AddIsland || r == RuleKind::RemoveOcean;
}

// Config/log name ("game_of_life", "brians_brain", "add_island", "remove_ocean").
[[nodiscard]] const char* rule_name(RuleKind r) noexcept;
[[nodiscard]] std::optional<RuleKind> parse_rule_name(std::string_view name) noexcept;

// Probability that AddIsland flips a cell with `neighbors` live neighbors:
//   live: 1 - (n+8)/24  (die)      dead: (n+8)/24  (born)
[[nodiscard]] float add_island_flip_probability(Cell cell, int neighbors) noexcept;

// Probability that RemoveOcean turns an ocean cell with no land neighbors into land.
inline constexpr float kRemoveOceanFillChance = 0.5f;

// Next state of one cell. Stochastic rules consume exactly one draw from `rng`
// and throw ConfigError if `rng` is null. Preconditions: cell in {0,1},
// neighbors in [0,8].
[[nodiscard]] Cell apply_rule(RuleKind rule, Cell cell, int neighbors, Pcg32* rng);

} // namespace islandgen::worldgen
