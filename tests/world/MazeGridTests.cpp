/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE MazeGridTests
#include <boost/test/unit_test.hpp>

#include "world/MazeGrid.hpp"
#include "world/MazeRandom.hpp"
#include <array>
#include <stdexcept>

using namespace NightCage;

BOOST_AUTO_TEST_SUITE(MazeGridTestSuite)

BOOST_AUTO_TEST_CASE(TestNewGridIsAllWall) {
    MazeGrid grid(7, 5, 0.5f);

    BOOST_CHECK_EQUAL(grid.getWidth(), 7);
    BOOST_CHECK_EQUAL(grid.getHeight(), 5);
    BOOST_CHECK_EQUAL(grid.countCells(CellType::Wall), 35u);
    BOOST_CHECK_EQUAL(grid.countCells(CellType::Path), 0u);
}

BOOST_AUTO_TEST_CASE(TestInvalidDimensionsThrow) {
    BOOST_CHECK_THROW(MazeGrid(0, 5, 0.5f), std::invalid_argument);
    BOOST_CHECK_THROW(MazeGrid(5, -1, 0.5f), std::invalid_argument);
    BOOST_CHECK_THROW(MazeGrid(5, 5, 0.0f), std::invalid_argument);
    BOOST_CHECK_THROW(MazeGrid::fromRows({}, 1.0f), std::invalid_argument);
    BOOST_CHECK_THROW(MazeGrid::fromRows({"###", "##"}, 1.0f), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(TestFromRows) {
    const auto grid = MazeGrid::fromRows({
        "#####",
        "#..##",
        "#####",
    }, 1.0f);

    BOOST_CHECK(grid.isWallCell(0, 0));
    BOOST_CHECK(grid.isPathCell(1, 1));
    BOOST_CHECK(grid.isPathCell(2, 1));
    BOOST_CHECK(grid.isWallCell(3, 1));
    BOOST_CHECK_EQUAL(grid.countCells(CellType::Path), 2u);
}

BOOST_AUTO_TEST_CASE(TestOutOfBoundsReadsAsWall) {
    const auto grid = MazeGrid::fromRows({"...", "...", "..."}, 1.0f);

    BOOST_CHECK(grid.isPathCell(0, 0));
    BOOST_CHECK(grid.isWallCell(-1, 0));
    BOOST_CHECK(grid.isWallCell(0, -1));
    BOOST_CHECK(grid.isWallCell(3, 0));
    BOOST_CHECK(grid.isWallCell(0, 3));
    BOOST_CHECK(grid.isWallWorld(-0.01f, 1.0f));
    BOOST_CHECK(grid.isWallWorld(1.0f, 3.5f));
}

BOOST_AUTO_TEST_CASE(TestWorldGridConversion) {
    MazeGrid grid(11, 11, 0.5f);

    const GridPoint cell = grid.worldToGrid(1.26f, 0.74f);
    BOOST_CHECK_EQUAL(cell.x, 2);
    BOOST_CHECK_EQUAL(cell.y, 1);

    // Negative coordinates floor rather than truncate
    const GridPoint outside = grid.worldToGrid(-0.1f, -0.6f);
    BOOST_CHECK_EQUAL(outside.x, -1);
    BOOST_CHECK_EQUAL(outside.y, -2);

    const Vector2D corner = grid.gridToWorld(GridPoint{3, 4});
    BOOST_CHECK_CLOSE(corner.getX(), 1.5f, 0.001f);
    BOOST_CHECK_CLOSE(corner.getY(), 2.0f, 0.001f);

    const Vector2D center = grid.cellCenter(GridPoint{1, 1});
    BOOST_CHECK_CLOSE(center.getX(), 0.75f, 0.001f);
    BOOST_CHECK_CLOSE(center.getY(), 0.75f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestInteriorExcludesBorder) {
    MazeGrid grid(5, 5, 1.0f);

    BOOST_CHECK(grid.isInterior(1, 1));
    BOOST_CHECK(grid.isInterior(3, 3));
    BOOST_CHECK(!grid.isInterior(0, 2));
    BOOST_CHECK(!grid.isInterior(4, 2));
    BOOST_CHECK(!grid.isInterior(2, 4));
    BOOST_CHECK(grid.inBounds(4, 4));
    BOOST_CHECK(!grid.inBounds(5, 4));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(MazeRandomTestSuite)

BOOST_AUTO_TEST_CASE(TestLinearCongruentialSequence) {
    MazeRandom rng(1);

    // (1 * 9301 + 49297) % 233280 = 58598
    BOOST_CHECK_CLOSE(rng.next(), 58598.0 / 233280.0, 0.0001);
    BOOST_CHECK_EQUAL(rng.getState(), 58598u);

    MazeRandom zero(0);
    BOOST_CHECK_CLOSE(zero.next(), 49297.0 / 233280.0, 0.0001);
}

BOOST_AUTO_TEST_CASE(TestSamplesStayInUnitInterval) {
    MazeRandom rng(123456789);
    for (int i = 0; i < 5000; ++i) {
        const double sample = rng.next();
        BOOST_REQUIRE(sample >= 0.0);
        BOOST_REQUIRE(sample < 1.0);
    }
}

BOOST_AUTO_TEST_CASE(TestShuffleIsSeededPermutation) {
    std::array<int, 4> first{0, 1, 2, 3};
    std::array<int, 4> second{0, 1, 2, 3};
    MazeRandom a(42);
    MazeRandom b(42);
    a.shuffle(first);
    b.shuffle(second);

    BOOST_CHECK(first == second);
    // Three samples per four-element shuffle
    BOOST_CHECK_EQUAL(a.getState(), b.getState());

    int sum = 0;
    for (int value : first) {
        sum += value;
    }
    BOOST_CHECK_EQUAL(sum, 6);
}

BOOST_AUTO_TEST_SUITE_END()
