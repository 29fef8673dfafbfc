// tests/worldgen/test_automaton.cpp
#include <doctest/doctest.h>
#include "worldgen/Automaton.hpp"
#include "worldgen/Neighbors.hpp"
#include "jobs/JobSystem.h"

using namespace islandgen;
using namespace islandgen::worldgen;

namespace {

CellGrid random_grid(int w, int h, std::uint64_t seed) {
    Pcg32 rng(seed, kPipelineStream);
    CellGrid g(w, h, kOcean);
    for (int y = 0; y < h; ++y)
        for (int x = 0; x < w; ++x)
            g.at(x, y) = rng.next_float01() < 0.4f ? kLand : kOcean;
    return g;
}

bool all_binary(const CellGrid& g) {
    for (int y = 0; y < g.height(); ++y)
        for (int x = 0; x < g.width(); ++x)
            if (g.at(x, y) != kOcean && g.at(x, y) != kLand) return false;
    return true;
}

} // namespace

TEST_CASE("GameOfLife: 2x2 block still life is unchanged") {
    CellGrid g(6, 6, kOcean);
    g.at(2, 2) = g.at(3, 2) = g.at(2, 3) = g.at(3, 3) = kLand;
    const CellGrid next = step(g, RuleKind::GameOfLife, nullptr);
    CHECK(next == g);
}

TEST_CASE("GameOfLife: blinker needs snapshot semantics") {
    // An in-place sweep would corrupt this oscillator on the first pass.
    CellGrid h(5, 5, kOcean);
    h.at(1, 2) = h.at(2, 2) = h.at(3, 2) = kLand;
    CellGrid v(5, 5, kOcean);
    v.at(2, 1) = v.at(2, 2) = v.at(2, 3) = kLand;

    CHECK(step(h, RuleKind::GameOfLife, nullptr) == v);
    CHECK(step(v, RuleKind::GameOfLife, nullptr) == h);
    CHECK(iterate(h, RuleKind::GameOfLife, 2, nullptr) == h);
}

TEST_CASE("BriansBrain: every live cell dies after one step") {
    const CellGrid g = random_grid(9, 7, 3u);
    const CellGrid next = step(g, RuleKind::BriansBrain, nullptr);
    for (int y = 0; y < g.height(); ++y)
        for (int x = 0; x < g.width(); ++x)
            if (g.at(x, y) == kLand) CHECK(next.at(x, y) == kOcean);
}

TEST_CASE("BriansBrain: dead cell in a full ring is born") {
    CellGrid g(3, 3, kLand);
    g.at(1, 1) = kOcean;
    const CellGrid next = step(g, RuleKind::BriansBrain, nullptr);
    CHECK(next.at(1, 1) == kLand);
    CHECK(count_land(next) == 1);
}

TEST_CASE("step preserves dimensions and the cell domain") {
    const CellGrid g = random_grid(13, 5, 17u);
    Pcg32 rng(1u, kPipelineStream);
    for (RuleKind r : {RuleKind::GameOfLife, RuleKind::BriansBrain, RuleKind::AddIsland, RuleKind::RemoveOcean}) {
        const CellGrid next = step(g, r, &rng);
        CHECK(next.width() == 13);
        CHECK(next.height() == 5);
        CHECK(all_binary(next));
    }
}

TEST_CASE("step with a stochastic rule and no stream fails before any work") {
    const CellGrid g(4, 4, kOcean);
    CHECK_THROWS_AS((void)step(g, RuleKind::AddIsland, nullptr), ConfigError);
    CHECK_THROWS_AS((void)step(g, RuleKind::RemoveOcean, nullptr), ConfigError);
}

TEST_CASE("iterate rejects fewer than one iteration") {
    const CellGrid g(4, 4, kOcean);
    CHECK_THROWS_AS((void)iterate(g, RuleKind::GameOfLife, 0, nullptr), ConfigError);
    CHECK_THROWS_AS((void)iterate(g, RuleKind::GameOfLife, -3, nullptr), ConfigError);
}

TEST_CASE("Sequential scheme draws once per cell in row-major order") {
    const CellGrid g = random_grid(6, 4, 9u);
    Pcg32 rng(77u, kPipelineStream);
    Pcg32 manual = rng;

    const CellGrid next = step(g, RuleKind::AddIsland, &rng);

    CellGrid expected(6, 4, kOcean);
    for (int y = 0; y < 4; ++y)
        for (int x = 0; x < 6; ++x)
            expected.at(x, y) = apply_rule(RuleKind::AddIsland, g.at(x, y),
                                           count_live_neighbors(g, x, y), &manual);
    CHECK(next == expected);
    CHECK(rng == manual);
}

TEST_CASE("iterate(n) equals n chained steps sharing one stream") {
    const CellGrid g = random_grid(10, 10, 21u);
    Pcg32 a(5u, kPipelineStream), b(5u, kPipelineStream);

    const CellGrid viaIterate = iterate(g, RuleKind::AddIsland, 3, &a);
    CellGrid chained = step(g, RuleKind::AddIsland, &b);
    chained = step(chained, RuleKind::AddIsland, &b);
    chained = step(chained, RuleKind::AddIsland, &b);

    CHECK(viaIterate == chained);
    CHECK(a == b);
}

TEST_CASE("PerCell scheme advances the shared stream by exactly one draw") {
    const CellGrid g = random_grid(8, 8, 4u);
    Pcg32 rng(8u, kPipelineStream);
    Pcg32 expected = rng;
    (void)expected.next();

    StepOptions opt;
    opt.scheme = DrawScheme::PerCell;
    (void)step(g, RuleKind::AddIsland, &rng, opt);
    CHECK(rng == expected);
}

TEST_CASE("PerCell scheme: parallel rows match a serial pass bit for bit") {
    const CellGrid g = random_grid(64, 48, 12u);
    jobs::JobSystem js(4);

    StepOptions serial;
    serial.scheme = DrawScheme::PerCell;
    StepOptions parallel = serial;
    parallel.jobs = &js;

    for (RuleKind r : {RuleKind::AddIsland, RuleKind::RemoveOcean}) {
        Pcg32 a(99u, kPipelineStream), b(99u, kPipelineStream);
        const CellGrid s = iterate(g, r, 3, &a, serial);
        const CellGrid p = iterate(g, r, 3, &b, parallel);
        CHECK(s == p);
        CHECK(a == b);
    }
}

TEST_CASE("Deterministic rules give the same result with or without workers") {
    const CellGrid g = random_grid(40, 40, 33u);
    jobs::JobSystem js(4);
    StepOptions parallel;
    parallel.jobs = &js;

    CHECK(iterate(g, RuleKind::GameOfLife, 4, nullptr) == iterate(g, RuleKind::GameOfLife, 4, nullptr, parallel));
    CHECK(step(g, RuleKind::BriansBrain, nullptr) == step(g, RuleKind::BriansBrain, nullptr, parallel));
}

TEST_CASE("Sequential scheme ignores workers for stochastic rules") {
    const CellGrid g = random_grid(32, 32, 45u);
    jobs::JobSystem js(4);
    StepOptions withJobs;
    withJobs.jobs = &js;

    Pcg32 a(3u, kPipelineStream), b(3u, kPipelineStream);
    CHECK(step(g, RuleKind::AddIsland, &a) == step(g, RuleKind::AddIsland, &b, withJobs));
    CHECK(a == b);
}
