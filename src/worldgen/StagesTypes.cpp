#include "worldgen/StagesTypes.hpp"
#include "worldgen/WorldGenTypes.hpp"

#include <cmath>
#include <limits>
#include <sstream>

namespace islandgen::worldgen {

const char* stage_kind_name(StageKind k) noexcept {
    switch (k) {
        case StageKind::Seed:      return "seed";
        case StageKind::Zoom:      return "zoom";
        case StageKind::Automaton: return "automaton";
    }
    return "unknown";
}

std::optional<StageKind> parse_stage_kind(std::string_view name) noexcept {
    if (name == "seed")      return StageKind::Seed;
    if (name == "zoom")      return StageKind::Zoom;
    if (name == "automaton") return StageKind::Automaton;
    return std::nullopt;
}

bool operator==(const StageDesc& a, const StageDesc& b) noexcept {
    if (a.kind != b.kind) return false;
    switch (a.kind) {
        case StageKind::Seed:      return a.fill == b.fill;
        case StageKind::Zoom:      return a.factor == b.factor;
        case StageKind::Automaton: return a.rule == b.rule && a.iterations == b.iterations;
    }
    return false;
}

std::string describe(const StageDesc& s) {
    std::ostringstream oss;
    switch (s.kind) {
        case StageKind::Seed:      oss << "seed(fill=" << s.fill << ")"; break;
        case StageKind::Zoom:      oss << "zoom(x" << s.factor << ")"; break;
        case StageKind::Automaton: oss << rule_name(s.rule) << "(x" << s.iterations << ")"; break;
    }
    return oss.str();
}

std::vector<StageDesc> reference_stages() {
    return {
        StageDesc::seed(0.1f),
        StageDesc::zoom(2),
        StageDesc::automaton(RuleKind::AddIsland, 1),
        StageDesc::zoom(2),
        StageDesc::automaton(RuleKind::AddIsland, 3),
        StageDesc::automaton(RuleKind::RemoveOcean, 1),
        StageDesc::zoom(2),
        StageDesc::zoom(2),
        StageDesc::automaton(RuleKind::AddIsland, 1),
    };
}

void validate_stages(const std::vector<StageDesc>& stages) {
    if (stages.empty())
        throw ConfigError("stage sequence is empty");
    if (stages.front().kind != StageKind::Seed)
        throw ConfigError("stage sequence must start with a seed stage");

    for (std::size_t i = 0; i < stages.size(); ++i) {
        const StageDesc& s = stages[i];
        const std::string where = "stage " + std::to_string(i) + " (" + stage_kind_name(s.kind) + "): ";
        switch (s.kind) {
            case StageKind::Seed:
                if (i != 0)
                    throw ConfigError(where + "only one seed stage is allowed");
                if (!std::isfinite(s.fill) || s.fill < 0.0f || s.fill > 1.0f)
                    throw ConfigError(where + "fill must be within [0, 1]");
                break;
            case StageKind::Zoom:
                if (s.factor < 1)
                    throw ConfigError(where + "factor must be >= 1 (got " + std::to_string(s.factor) + ")");
                break;
            case StageKind::Automaton:
                if (s.iterations < 1)
                    throw ConfigError(where + "iterations must be >= 1 (got " + std::to_string(s.iterations) + ")");
                break;
        }
    }
}

void validate_stage_extent(const std::vector<StageDesc>& stages, int startWidth, int startHeight) {
    constexpr auto kMaxDim = static_cast<std::uint64_t>(std::numeric_limits<int>::max());
    std::uint64_t w = static_cast<std::uint64_t>(startWidth);
    std::uint64_t h = static_cast<std::uint64_t>(startHeight);

    const auto check = [&](const std::string& where) {
        if (w > kMaxDim || h > kMaxDim || w * h > kMaxGridCells)
            throw ConfigError(where + "grid would grow to " + std::to_string(w) + "x" + std::to_string(h) +
                              ", above the limit of " + std::to_string(kMaxGridCells) + " cells");
    };

    check("start size: ");
    for (std::size_t i = 0; i < stages.size(); ++i) {
        const StageDesc& s = stages[i];
        if (s.kind != StageKind::Zoom || s.factor < 1)
            continue;
        w *= static_cast<std::uint64_t>(s.factor);
        h *= static_cast<std::uint64_t>(s.factor);
        check("stage " + std::to_string(i) + " (zoom x" + std::to_string(s.factor) + "): ");
    }
}

} // namespace islandgen::worldgen
