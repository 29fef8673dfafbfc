#include "worldgen/StagesConfig.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cmath>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace islandgen::worldgen {

namespace {

[[noreturn]] void bad(const std::string& key, const std::string& what) {
    throw ConfigError("config '" + key + "': " + what);
}

std::int64_t get_int64(const json& v, const std::string& key) {
    if (v.is_number_unsigned()) {
        const auto u = v.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
            bad(key, "integer out of range");
        return static_cast<std::int64_t>(u);
    }
    if (!v.is_number_integer())
        bad(key, "expected an integer, got " + std::string(v.type_name()));
    return v.get<std::int64_t>();
}

int get_int(const json& v, const std::string& key) {
    const std::int64_t i = get_int64(v, key);
    if (i < std::numeric_limits<int>::min() || i > std::numeric_limits<int>::max())
        bad(key, "integer out of range");
    return static_cast<int>(i);
}

float get_float(const json& v, const std::string& key) {
    if (!v.is_number())
        bad(key, "expected a number, got " + std::string(v.type_name()));
    const double d = v.get<double>();
    if (!std::isfinite(d) || std::fabs(d) > static_cast<double>(std::numeric_limits<float>::max()))
        bad(key, "number out of range");
    return static_cast<float>(d);
}

std::string get_string(const json& v, const std::string& key) {
    if (!v.is_string())
        bad(key, "expected a string, got " + std::string(v.type_name()));
    return v.get<std::string>();
}

StageDesc parse_stage(const json& j, std::size_t index) {
    const std::string key = "stages[" + std::to_string(index) + "]";
    if (!j.is_object())
        bad(key, "expected an object");

    const auto kindIt = j.find("kind");
    if (kindIt == j.end())
        bad(key, "missing 'kind'");
    const std::string kindName = get_string(*kindIt, key + ".kind");
    const auto kind = parse_stage_kind(kindName);
    if (!kind)
        bad(key + ".kind", "unknown stage kind '" + kindName + "'");

    StageDesc s;
    switch (*kind) {
        case StageKind::Seed:
            s = StageDesc::seed();
            if (auto it = j.find("fill"); it != j.end())
                s.fill = get_float(*it, key + ".fill");
            break;
        case StageKind::Zoom:
            s = StageDesc::zoom(2);
            if (auto it = j.find("factor"); it != j.end())
                s.factor = get_int(*it, key + ".factor");
            break;
        case StageKind::Automaton: {
            const auto ruleIt = j.find("rule");
            if (ruleIt == j.end())
                bad(key, "automaton stage needs a 'rule'");
            const std::string ruleName = get_string(*ruleIt, key + ".rule");
            const auto rule = parse_rule_name(ruleName);
            if (!rule)
                bad(key + ".rule", "unknown rule '" + ruleName + "'");
            s = StageDesc::automaton(*rule, 1);
            if (auto it = j.find("iterations"); it != j.end())
                s.iterations = get_int(*it, key + ".iterations");
            break;
        }
    }
    return s;
}

} // namespace

PipelineConfig StagesConfig::from_json(const json& root)
{
    if (!root.is_object())
        throw ConfigError("config root must be a JSON object");

    PipelineConfig cfg{};

    if (auto it = root.find("seed"); it != root.end()) {
        cfg.seed = get_int64(*it, "seed");
        cfg.settings.seed = *cfg.seed;
    }

    if (auto it = root.find("start_size"); it != root.end()) {
        if (!it->is_array() || it->size() != 2)
            bad("start_size", "expected an array of two integers");
        cfg.settings.startWidth  = get_int((*it)[0], "start_size[0]");
        cfg.settings.startHeight = get_int((*it)[1], "start_size[1]");
        if (cfg.settings.startWidth < 1 || cfg.settings.startHeight < 1)
            bad("start_size", "dimensions must be positive");
    }

    if (auto it = root.find("draw_scheme"); it != root.end()) {
        const std::string name = get_string(*it, "draw_scheme");
        if (name == "sequential")    cfg.settings.drawScheme = DrawScheme::Sequential;
        else if (name == "per_cell") cfg.settings.drawScheme = DrawScheme::PerCell;
        else bad("draw_scheme", "unknown scheme '" + name + "'");
    }

    if (auto it = root.find("workers"); it != root.end()) {
        const int w = get_int(*it, "workers");
        if (w < 1)
            bad("workers", "must be >= 1");
        cfg.settings.workers = static_cast<unsigned>(w);
    }

    if (auto it = root.find("output_dir"); it != root.end())
        cfg.outputDir = get_string(*it, "output_dir");

    if (auto it = root.find("stages"); it != root.end()) {
        if (!it->is_array())
            bad("stages", "expected an array");
        cfg.stages.clear();
        for (std::size_t i = 0; i < it->size(); ++i)
            cfg.stages.push_back(parse_stage((*it)[i], i));
        validate_stages(cfg.stages);
    }
    validate_stage_extent(cfg.stages, cfg.settings.startWidth, cfg.settings.startHeight);

    return cfg;
}

PipelineConfig StagesConfig::load(const fs::path& path)
{
    std::ifstream f(path, std::ios::in | std::ios::binary);
    if (!f)
        throw std::runtime_error("StagesConfig: could not open '" + path.string() + "'");

    json root;
    try {
        f >> root;
    } catch (const json::parse_error& e) {
        throw ConfigError("StagesConfig: parse error in '" + path.string() + "': " + e.what());
    }

    PipelineConfig cfg = from_json(root);
    spdlog::debug("StagesConfig: loaded '{}' ({} stages)", path.string(), cfg.stages.size());
    return cfg;
}

fs::path StagesConfig::default_path()
{
    return fs::path("assets") / "config" / "islandgen.json";
}

} // namespace islandgen::worldgen
