#include "worldgen/Rules.hpp"

#include <cassert>
#include <string>

namespace islandgen::worldgen {

namespace {

Cell game_of_life(Cell cell, int n) noexcept {
    if (cell == kLand)
        return (n == 2 || n == 3) ? kLand : kOcean;
    return (n == 3) ? kLand : kOcean;
}

Cell brians_brain(Cell cell, int n) noexcept {
    // The "dying" state of the three-state automaton is folded into dead.
    if (cell == kLand)
        return kOcean;
    return (n >= 6) ? kLand : kOcean;
}

Cell add_island(Cell cell, int n, Pcg32& rng) noexcept {
    const float draw = rng.next_float01();
    if (draw < add_island_flip_probability(cell, n))
        return cell == kLand ? kOcean : kLand;
    return cell;
}

Cell remove_ocean(Cell cell, int n, Pcg32& rng) noexcept {
    const float draw = rng.next_float01();
    if (cell == kOcean && n == 0 && draw < kRemoveOceanFillChance)
        return kLand;
    return cell;
}

} // namespace

const char* rule_name(RuleKind r) noexcept {
    switch (r) {
        case RuleKind::GameOfLife:  return "game_of_life";
        case RuleKind::BriansBrain: return "brians_brain";
        case RuleKind::AddIsland:   return "add_island";
        case RuleKind::RemoveOcean: return "remove_ocean";
    }
    return "unknown";
}

std::optional<RuleKind> parse_rule_name(std::string_view name) noexcept {
    if (name == "game_of_life") return RuleKind::GameOfLife;
    if (name == "brians_brain") return RuleKind::BriansBrain;
    if (name == "add_island")   return RuleKind::AddIsland;
    if (name == "remove_ocean") return RuleKind::RemoveOcean;
    return std::nullopt;
}

float add_island_flip_probability(Cell cell, int neighbors) noexcept {
    if (cell == kLand)
        return static_cast<float>(16 - neighbors) / 24.0f;
    return static_cast<float>(neighbors + 8) / 24.0f;
}

Cell apply_rule(RuleKind rule, Cell cell, int neighbors, Pcg32* rng) {
    assert(cell == kOcean || cell == kLand);
    assert(neighbors >= 0 && neighbors <= 8);

    if (rule_is_stochastic(rule) && rng == nullptr)
        throw ConfigError(std::string("rule '") + rule_name(rule) + "' requires a random stream");

    switch (rule) {
        case RuleKind::GameOfLife:  return game_of_life(cell, neighbors);
        case RuleKind::BriansBrain: return brians_brain(cell, neighbors);
        case RuleKind::AddIsland:   return add_island(cell, neighbors, *rng);
        case RuleKind::RemoveOcean: return remove_ocean(cell, neighbors, *rng);
    }
    return cell;
}

} // namespace islandgen::worldgen
