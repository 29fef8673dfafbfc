#pragma once
// Stage descriptors of the heightmap pipeline.
// Keep this header tiny and stable: config, pipeline and CLI all include it.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "worldgen/Rules.hpp"

namespace islandgen::worldgen {

enum class StageKind : std::uint8_t {
    Seed = 0,    // allocate start grid, set cells to land with probability `fill`
    Zoom,        // block-replicate by `factor`
    Automaton,   // run `rule` for `iterations` generations
};

[[nodiscard]] const char* stage_kind_name(StageKind k) noexcept;
[[nodiscard]] std::optional<StageKind> parse_stage_kind(std::string_view name) noexcept;

// (kind, params). Only the fields of the given kind are meaningful.
struct StageDesc {
    StageKind kind       = StageKind::Seed;
    float     fill       = 0.1f;                  // Seed
    int       factor     = 2;                     // Zoom
    RuleKind  rule       = RuleKind::AddIsland;   // Automaton
    int       iterations = 1;                     // Automaton

    [[nodiscard]] static StageDesc seed(float fill = 0.1f) noexcept {
        StageDesc d; d.kind = StageKind::Seed; d.fill = fill; return d;
    }
    [[nodiscard]] static StageDesc zoom(int factor) noexcept {
        StageDesc d; d.kind = StageKind::Zoom; d.factor = factor; return d;
    }
    [[nodiscard]] static StageDesc automaton(RuleKind rule, int iterations = 1) noexcept {
        StageDesc d; d.kind = StageKind::Automaton; d.rule = rule; d.iterations = iterations; return d;
    }

    friend bool operator==(const StageDesc& a, const StageDesc& b) noexcept;
    friend bool operator!=(const StageDesc& a, const StageDesc& b) noexcept { return !(a == b); }
};

// Short human-readable form for logs: "seed(fill=0.1)", "zoom(x2)", "add_island(x3)".
[[nodiscard]] std::string describe(const StageDesc& s);

// Seed 4x4 @ 10%, zoom, island, zoom, 3x island, remove ocean, zoom, zoom, island.
[[nodiscard]] std::vector<StageDesc> reference_stages();

// Throws ConfigError unless: non-empty, exactly one Seed and it comes first,
// fill in [0,1], zoom factor >= 1, automaton iterations >= 1.
void validate_stages(const std::vector<StageDesc>& stages);

// Upper bound on width * height of any grid a stage sequence may produce.
inline constexpr std::uint64_t kMaxGridCells = std::uint64_t{1} << 28;

// Walks the zooms from a startWidth x startHeight seed grid and throws ConfigError as
// soon as a grid would exceed int dimensions or kMaxGridCells. Start size must be positive.
void validate_stage_extent(const std::vector<StageDesc>& stages, int startWidth, int startHeight);

} // namespace islandgen::worldgen
