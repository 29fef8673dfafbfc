// src/worldgen/TerrainPipeline.cpp
#include "worldgen/TerrainPipeline.hpp"
#include "worldgen/Automaton.hpp"
#include "worldgen/Zoom.hpp"
#include "jobs/JobSystem.h"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace islandgen::worldgen {

namespace {

void validate_settings(const GeneratorSettings& s) {
    if (s.startWidth < 1 || s.startHeight < 1)
        throw ConfigError("start grid size must be positive (got " + std::to_string(s.startWidth) +
                          "x" + std::to_string(s.startHeight) + ")");
    if (s.workers < 1)
        throw ConfigError("workers must be >= 1");
}

} // namespace

const char* pipeline_state_name(TerrainPipeline::State s) noexcept {
    switch (s) {
        case TerrainPipeline::State::Uninitialized: return "uninitialized";
        case TerrainPipeline::State::Seeded:        return "seeded";
        case TerrainPipeline::State::Zoomed:        return "zoomed";
        case TerrainPipeline::State::Automated:     return "automated";
        case TerrainPipeline::State::Finalized:     return "finalized";
    }
    return "unknown";
}

TerrainPipeline::TerrainPipeline(GeneratorSettings settings)
    : TerrainPipeline(settings, reference_stages()) {}

TerrainPipeline::TerrainPipeline(GeneratorSettings settings, std::vector<StageDesc> stages)
    : settings_(settings), stages_(std::move(stages))
{
    validate_settings(settings_);
    validate_stages(stages_);
    validate_stage_extent(stages_, settings_.startWidth, settings_.startHeight);
    if (settings_.workers > 1)
        jobs_ = std::make_unique<jobs::JobSystem>(settings_.workers);
}

TerrainPipeline::~TerrainPipeline() = default;
TerrainPipeline::TerrainPipeline(TerrainPipeline&&) noexcept = default;
TerrainPipeline& TerrainPipeline::operator=(TerrainPipeline&&) noexcept = default;

const CellGrid& TerrainPipeline::run()
{
    rng_ = Pcg32(static_cast<std::uint64_t>(settings_.seed), kPipelineStream);
    grid_ = CellGrid{};
    resolution_ = 1;
    state_ = State::Uninitialized;

    spdlog::debug("TerrainPipeline: seed={} stages={} scheme={}",
                  settings_.seed, stages_.size(), draw_scheme_name(settings_.drawScheme));

    for (std::size_t i = 0; i < stages_.size(); ++i) {
        const StageDesc& s = stages_[i];
        switch (s.kind) {
            case StageKind::Seed:      seed_(s);      break;
            case StageKind::Zoom:      zoom_(s);      break;
            case StageKind::Automaton: automaton_(s); break;
        }

        StageEvent ev;
        ev.index      = i;
        ev.stage      = s;
        ev.width      = grid_.width();
        ev.height     = grid_.height();
        ev.resolution = resolution_;
        ev.landCells  = count_land(grid_);

        spdlog::debug("TerrainPipeline: [{}] {} -> {}x{} land={}",
                      i, describe(s), ev.width, ev.height, ev.landCells);
        if (observer_)
            observer_(ev);
    }

    state_ = State::Finalized;
    return grid_;
}

const CellGrid& TerrainPipeline::result() const
{
    if (state_ != State::Finalized)
        throw std::logic_error(std::string("TerrainPipeline::result() called in state '") +
                               pipeline_state_name(state_) + "'");
    return grid_;
}

void TerrainPipeline::seed_(const StageDesc& s)
{
    grid_ = CellGrid(settings_.startWidth, settings_.startHeight, kOcean);
    for (int y = 0; y < grid_.height(); ++y)
        for (int x = 0; x < grid_.width(); ++x)
            if (rng_.next_float01() < s.fill)
                grid_.at(x, y) = kLand;
    state_ = State::Seeded;
}

void TerrainPipeline::zoom_(const StageDesc& s)
{
    grid_ = zoom(grid_, s.factor);
    resolution_ *= s.factor;
    state_ = State::Zoomed;
}

void TerrainPipeline::automaton_(const StageDesc& s)
{
    StepOptions opt;
    opt.scheme = settings_.drawScheme;
    opt.jobs   = jobs_.get();
    grid_ = iterate(grid_, s.rule, s.iterations, &rng_, opt);
    state_ = State::Automated;
}

} // namespace islandgen::worldgen
