#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include "worldgen/GeneratorSettings.hpp"
#include "worldgen/StagesTypes.hpp"
#include "worldgen/WorldGenTypes.hpp"
#include "worldgen/Random.hpp"

namespace islandgen::jobs { class JobSystem; }

namespace islandgen::worldgen {

// Emitted after every stage. The pipeline itself only logs at debug level; user-facing
// progress reporting belongs to whoever installs the observer.
struct StageEvent {
    std::size_t index = 0;        // position in stages()
    StageDesc   stage{};
    int         width = 0;
    int         height = 0;
    int         resolution = 1;   // cumulative zoom factor so far
    std::size_t landCells = 0;
};

using StageObserver = std::function<void(const StageEvent&)>;

// Grows a heightmap from a seed: Seed -> {Zoom, Automaton}* -> final grid.
// Owns the evolving grid and the single random stream; nothing is shared.
class TerrainPipeline {
public:
    enum class State : std::uint8_t { Uninitialized, Seeded, Zoomed, Automated, Finalized };

    // Reference stage sequence.
    explicit TerrainPipeline(GeneratorSettings settings);

    // Custom sequence. Both constructors validate eagerly and throw ConfigError.
    TerrainPipeline(GeneratorSettings settings, std::vector<StageDesc> stages);

    ~TerrainPipeline();
    TerrainPipeline(TerrainPipeline&&) noexcept;
    TerrainPipeline& operator=(TerrainPipeline&&) noexcept;

    void set_observer(StageObserver observer) { observer_ = std::move(observer); }

    // Runs every stage from a freshly seeded stream. Calling it again repeats the
    // whole run and yields the identical grid.
    const CellGrid& run();

    // Final grid. Throws std::logic_error unless state() == Finalized.
    [[nodiscard]] const CellGrid& result() const;

    [[nodiscard]] State state() const noexcept { return state_; }
    [[nodiscard]] int resolution() const noexcept { return resolution_; }
    [[nodiscard]] const std::vector<StageDesc>& stages() const noexcept { return stages_; }
    [[nodiscard]] const GeneratorSettings& settings() const noexcept { return settings_; }

private:
    void seed_(const StageDesc& s);
    void zoom_(const StageDesc& s);
    void automaton_(const StageDesc& s);

private:
    GeneratorSettings                 settings_;
    std::vector<StageDesc>            stages_;
    std::unique_ptr<jobs::JobSystem>  jobs_;
    StageObserver                     observer_;

    Pcg32    rng_;
    CellGrid grid_;
    int      resolution_ = 1;
    State    state_ = State::Uninitialized;
};

[[nodiscard]] const char* pipeline_state_name(TerrainPipeline::State s) noexcept;

} // namespace islandgen::worldgen
