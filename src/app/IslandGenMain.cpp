// src/app/IslandGenMain.cpp
//
// islandgen command-line entry point.
//   1. parse args, set up logging
//   2. load the JSON config if given (CLI values win)
//   3. run the pipeline, reporting stage events
//   4. write <out_dir>/heightmap_<seed>.txt
//
// Exit codes: 0 ok, 1 runtime/I-O failure, 2 configuration or usage error.

#include "app/CommandLineArgs.h"
#include "logging/Log.h"
#include "worldgen/HeightmapIO.hpp"
#include "worldgen/StagesConfig.hpp"
#include "worldgen/TerrainPipeline.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <exception>
#include <filesystem>

namespace fs = std::filesystem;
using namespace islandgen;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

worldgen::PipelineConfig resolve_config(const app::CommandLineArgs& args)
{
    worldgen::PipelineConfig cfg = args.configPath
        ? worldgen::StagesConfig::load(*args.configPath)
        : worldgen::PipelineConfig{};

    if (args.seed) {
        cfg.seed = *args.seed;
        cfg.settings.seed = *args.seed;
    }
    if (args.startWidth && args.startHeight) {
        cfg.settings.startWidth  = *args.startWidth;
        cfg.settings.startHeight = *args.startHeight;
    }
    if (args.drawScheme) cfg.settings.drawScheme = *args.drawScheme;
    if (args.workers)    cfg.settings.workers = static_cast<unsigned>(*args.workers);
    if (args.outDir)     cfg.outputDir = *args.outDir;

    if (!cfg.seed)
        throw worldgen::ConfigError("a seed is required (--seed <N> or \"seed\" in the config)");
    return cfg;
}

} // namespace

int main(int argc, char** argv)
{
    const app::CommandLineArgs args = app::ParseCommandLineArgs(argc, argv);
    if (args.showHelp) {
        std::fputs(app::BuildCommandLineHelpText().c_str(), stdout);
        return kExitOk;
    }

    auto level = spdlog::level::info;
    if (args.logLevel) {
        const auto parsed = logsys::parse_level(*args.logLevel);
        if (!parsed) {
            std::fprintf(stderr, "islandgen: unknown log level '%s'\n", args.logLevel->c_str());
            return kExitUsage;
        }
        level = *parsed;
    }

    try {
        logsys::init_console_logs(level, args.logFile
            ? std::optional<fs::path>(*args.logFile) : std::nullopt);
    } catch (const spdlog::spdlog_ex& e) {
        std::fprintf(stderr, "islandgen: cannot initialize logging: %s\n", e.what());
        return kExitFailure;
    }

    if (!args.unknown.empty() || !args.invalid.empty()) {
        for (const auto& u : args.unknown) spdlog::error("unknown option '{}'", u);
        for (const auto& e : args.invalid) spdlog::error("{}", e);
        spdlog::info("run with --help for usage");
        return kExitUsage;
    }

    try {
        const worldgen::PipelineConfig cfg = resolve_config(args);

        worldgen::TerrainPipeline pipeline(cfg.settings, cfg.stages);
        pipeline.set_observer([](const worldgen::StageEvent& ev) {
            spdlog::info("stage {:>2} {:<22} {:>4}x{:<4} res x{:<3} land {}",
                         ev.index, worldgen::describe(ev.stage),
                         ev.width, ev.height, ev.resolution, ev.landCells);
        });

        spdlog::info("generating heightmap: seed={} start={}x{} stages={} scheme={} workers={}",
                     cfg.settings.seed, cfg.settings.startWidth, cfg.settings.startHeight,
                     cfg.stages.size(), worldgen::draw_scheme_name(cfg.settings.drawScheme),
                     cfg.settings.workers);

        const worldgen::CellGrid& grid = pipeline.run();

        const fs::path out = cfg.outputDir / worldgen::heightmap_filename(cfg.settings.seed);
        worldgen::write_heightmap_text(grid, out);
        spdlog::info("wrote {} ({}x{}, {} land cells)", out.string(),
                     grid.width(), grid.height(), worldgen::count_land(grid));
        return kExitOk;
    } catch (const worldgen::ConfigError& e) {
        spdlog::error("configuration error: {}", e.what());
        return kExitUsage;
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return kExitFailure;
    }
}
