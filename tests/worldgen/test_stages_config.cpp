// tests/worldgen/test_stages_config.cpp
#include <doctest/doctest.h>
#include "worldgen/StagesConfig.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>
#include <system_error>

using json = nlohmann::json;
namespace fs = std::filesystem;
using namespace islandgen::worldgen;

namespace {

fs::path make_unique_temp_dir(const char* tag)
{
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec || base.empty())
        base = fs::path(".");

    const auto stamp = static_cast<long long>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());

    fs::path dir = base / (std::string("islandgen_") + tag + "_" + std::to_string(stamp));
    fs::create_directories(dir, ec);
    return dir;
}

} // namespace

TEST_CASE("StagesConfig: empty object keeps every default") {
    const PipelineConfig cfg = StagesConfig::from_json(json::object());
    CHECK_FALSE(cfg.seed.has_value());
    CHECK(cfg.settings.startWidth == 4);
    CHECK(cfg.settings.startHeight == 4);
    CHECK(cfg.settings.drawScheme == DrawScheme::Sequential);
    CHECK(cfg.settings.workers == 1u);
    CHECK(cfg.stages == reference_stages());
    CHECK(cfg.outputDir == fs::path("."));
}

TEST_CASE("StagesConfig: full document") {
    const json root = json::parse(R"({
        "seed": -12,
        "start_size": [6, 3],
        "draw_scheme": "per_cell",
        "workers": 3,
        "output_dir": "maps",
        "stages": [
            { "kind": "seed", "fill": 0.25 },
            { "kind": "zoom", "factor": 3 },
            { "kind": "automaton", "rule": "game_of_life", "iterations": 2 },
            { "kind": "automaton", "rule": "remove_ocean" }
        ]
    })");

    const PipelineConfig cfg = StagesConfig::from_json(root);
    REQUIRE(cfg.seed.has_value());
    CHECK(*cfg.seed == -12);
    CHECK(cfg.settings.seed == -12);
    CHECK(cfg.settings.startWidth == 6);
    CHECK(cfg.settings.startHeight == 3);
    CHECK(cfg.settings.drawScheme == DrawScheme::PerCell);
    CHECK(cfg.settings.workers == 3u);
    CHECK(cfg.outputDir == fs::path("maps"));
    REQUIRE(cfg.stages.size() == 4);
    CHECK(cfg.stages[0] == StageDesc::seed(0.25f));
    CHECK(cfg.stages[1] == StageDesc::zoom(3));
    CHECK(cfg.stages[2] == StageDesc::automaton(RuleKind::GameOfLife, 2));
    CHECK(cfg.stages[3] == StageDesc::automaton(RuleKind::RemoveOcean, 1));
}

TEST_CASE("StagesConfig: seed must be an integer in int64 range") {
    CHECK_THROWS_AS(StagesConfig::from_json(json::parse(R"({"seed": "42"})")), ConfigError);
    CHECK_THROWS_AS(StagesConfig::from_json(json::parse(R"({"seed": 4.5})")), ConfigError);
    CHECK_THROWS_AS(StagesConfig::from_json(json::parse(R"({"seed": null})")), ConfigError);
    CHECK_THROWS_AS(StagesConfig::from_json(json::parse(R"({"seed": 18446744073709551615})")), ConfigError);
    CHECK(*StagesConfig::from_json(json::parse(R"({"seed": -9223372036854775808})")).seed ==
          std::numeric_limits<std::int64_t>::min());
}

TEST_CASE("StagesConfig: start_size must be a pair of positive integers") {
    CHECK_THROWS_AS(StagesConfig::from_json(json::parse(R"({"start_size": [4]})")), ConfigError);
    CHECK_THROWS_AS(StagesConfig::from_json(json::parse(R"({"start_size": [4, 4, 4]})")), ConfigError);
    CHECK_THROWS_AS(StagesConfig::from_json(json::parse(R"({"start_size": [4, "4"]})")), ConfigError);
    CHECK_THROWS_AS(StagesConfig::from_json(json::parse(R"({"start_size": [0, 4]})")), ConfigError);
    CHECK_THROWS_AS(StagesConfig::from_json(json::parse(R"({"start_size": 4})")), ConfigError);
}

TEST_CASE("StagesConfig: malformed stages") {
    CHECK_THROWS_AS(StagesConfig::from_json(json::parse(R"({"stages": {}})")), ConfigError);
    CHECK_THROWS_AS(StagesConfig::from_json(json::parse(R"({"stages": []})")), ConfigError);
    CHECK_THROWS_AS(StagesConfig::from_json(json::parse(R"({"stages": [{"fill": 0.1}]})")), ConfigError);
    CHECK_THROWS_AS(StagesConfig::from_json(json::parse(R"({"stages": [{"kind": "erode"}]})")), ConfigError);
    CHECK_THROWS_AS(StagesConfig::from_json(json::parse(
        R"({"stages": [{"kind": "seed"}, {"kind": "automaton", "rule": "wireworld"}]})")), ConfigError);
    CHECK_THROWS_AS(StagesConfig::from_json(json::parse(
        R"({"stages": [{"kind": "seed"}, {"kind": "automaton"}]})")), ConfigError);
    CHECK_THROWS_AS(StagesConfig::from_json(json::parse(
        R"({"stages": [{"kind": "seed"}, {"kind": "zoom", "factor": 0}]})")), ConfigError);
    CHECK_THROWS_AS(StagesConfig::from_json(json::parse(
        R"({"stages": [{"kind": "seed"}, {"kind": "zoom", "factor": 1.5}]})")), ConfigError);
}

TEST_CASE("StagesConfig: fill values outside the float range are rejected") {
    CHECK_THROWS_AS(StagesConfig::from_json(json::parse(
        R"({"stages": [{"kind": "seed", "fill": 1e300}]})")), ConfigError);
    CHECK_THROWS_AS(StagesConfig::from_json(json::parse(
        R"({"stages": [{"kind": "seed", "fill": -1e300}]})")), ConfigError);
    CHECK_THROWS_AS(StagesConfig::from_json(json::parse(
        R"({"stages": [{"kind": "seed", "fill": 1.5}]})")), ConfigError);
    CHECK(StagesConfig::from_json(json::parse(
        R"({"stages": [{"kind": "seed", "fill": 0.5}]})")).stages[0] == StageDesc::seed(0.5f));
}

TEST_CASE("StagesConfig: sizes reached through zooms are bounded") {
    CHECK_THROWS_AS(StagesConfig::from_json(json::parse(R"({"stages": [
        {"kind": "seed"}, {"kind": "zoom", "factor": 65536}, {"kind": "zoom", "factor": 65536}
    ]})")), ConfigError);
    // The default sequence multiplies the start size by 16.
    CHECK_THROWS_AS(StagesConfig::from_json(json::parse(R"({"start_size": [4096, 4096]})")), ConfigError);
    CHECK_NOTHROW(StagesConfig::from_json(json::parse(R"({"start_size": [1024, 1024]})")));
}

TEST_CASE("StagesConfig: other bad values") {
    CHECK_THROWS_AS(StagesConfig::from_json(json::parse(R"([1, 2])")), ConfigError);
    CHECK_THROWS_AS(StagesConfig::from_json(json::parse(R"({"draw_scheme": "random"})")), ConfigError);
    CHECK_THROWS_AS(StagesConfig::from_json(json::parse(R"({"workers": 0})")), ConfigError);
    CHECK_THROWS_AS(StagesConfig::from_json(json::parse(R"({"output_dir": 5})")), ConfigError);
}

TEST_CASE("StagesConfig::load reads a file, reports missing and corrupt files") {
    const fs::path dir = make_unique_temp_dir("config");

    const fs::path good = dir / "islandgen.json";
    {
        std::ofstream f(good, std::ios::binary | std::ios::trunc);
        REQUIRE(f.good());
        f << R"({ "seed": 7, "stages": [ { "kind": "seed" }, { "kind": "zoom", "factor": 4 } ] })";
    }
    const PipelineConfig cfg = StagesConfig::load(good);
    CHECK(*cfg.seed == 7);
    REQUIRE(cfg.stages.size() == 2);
    CHECK(cfg.stages[1] == StageDesc::zoom(4));

    CHECK_THROWS_AS(StagesConfig::load(dir / "missing.json"), std::runtime_error);

    const fs::path corrupt = dir / "corrupt.json";
    {
        std::ofstream f(corrupt, std::ios::binary | std::ios::trunc);
        f << "{ \"seed\": 7, ";
    }
    CHECK_THROWS_AS(StagesConfig::load(corrupt), ConfigError);

    std::error_code ec;
    fs::remove_all(dir, ec);
}

TEST_CASE("StagesConfig::default_path") {
    CHECK(StagesConfig::default_path() == fs::path("assets") / "config" / "islandgen.json");
}
