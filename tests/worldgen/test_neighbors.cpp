// tests/worldgen/test_neighbors.cpp
#include <doctest/doctest.h>
#include "worldgen/Neighbors.hpp"

using namespace islandgen::worldgen;

TEST_CASE("Moore count on an all-land grid: interior 8, edge 5, corner 3") {
    const CellGrid g(5, 5, kLand);
    for (int y = 1; y < 4; ++y)
        for (int x = 1; x < 4; ++x)
            CHECK(count_live_neighbors(g, x, y) == 8);

    const CellGrid t(3, 3, kLand);
    CHECK(count_live_neighbors(t, 1, 1) == 8);
    CHECK(count_live_neighbors(t, 1, 0) == 5);
    CHECK(count_live_neighbors(t, 0, 1) == 5);
    CHECK(count_live_neighbors(t, 2, 1) == 5);
    CHECK(count_live_neighbors(t, 1, 2) == 5);
    CHECK(count_live_neighbors(t, 0, 0) == 3);
    CHECK(count_live_neighbors(t, 2, 0) == 3);
    CHECK(count_live_neighbors(t, 0, 2) == 3);
    CHECK(count_live_neighbors(t, 2, 2) == 3);
}

TEST_CASE("Moore count excludes the cell itself and does not wrap") {
    CellGrid g(4, 4, kOcean);
    g.at(0, 0) = kLand;
    CHECK(count_live_neighbors(g, 0, 0) == 0);
    CHECK(count_live_neighbors(g, 1, 1) == 1);
    // Opposite corner would see (0,0) only with wraparound.
    CHECK(count_live_neighbors(g, 3, 3) == 0);
    CHECK(count_live_neighbors(g, 3, 0) == 0);
    CHECK(count_live_neighbors(g, 0, 3) == 0);
}

TEST_CASE("Moore count only counts cells equal to 1") {
    CellGrid g(3, 3, kOcean);
    g.at(0, 0) = 2;
    g.at(2, 2) = kLand;
    CHECK(count_live_neighbors(g, 1, 1) == 1);
}

TEST_CASE("Moore count on a 1x1 grid is 0") {
    const CellGrid g(1, 1, kLand);
    CHECK(count_live_neighbors(g, 0, 0) == 0);
}
