/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE LevelTests
#include <boost/test/unit_test.hpp>

#include "world/Level.hpp"
#include "world/MazeEffects.hpp"
#include <algorithm>

using namespace NightCage;

namespace {

LevelConfig makeConfig(int levelNumber, uint32_t variation) {
    LevelConfig config;
    config.levelNumber = levelNumber;
    config.seed = Level::seedForLevel(levelNumber, variation);
    config.difficulty = levelNumber;
    return config;
}

// Just the maze, the player and whatever the test turns back on
LevelConfig bareConfig(uint32_t variation) {
    LevelConfig config = makeConfig(1, variation);
    config.spawnItems = false;
    config.spawnHazards = false;
    config.spawnDoors = false;
    return config;
}

} // namespace

BOOST_AUTO_TEST_SUITE(LevelLayoutTests)

BOOST_AUTO_TEST_CASE(TestMazeSizeGrowsPerLevel) {
    BOOST_CHECK_EQUAL(Level::mazeSizeForLevel(1), 21);
    BOOST_CHECK_EQUAL(Level::mazeSizeForLevel(2), 23);
    BOOST_CHECK_EQUAL(Level::mazeSizeForLevel(5), 29);
    BOOST_CHECK_EQUAL(Level::mazeSizeForLevel(0), 21);
}

BOOST_AUTO_TEST_CASE(TestSeedForLevel) {
    BOOST_CHECK_EQUAL(Level::seedForLevel(1, 42), 1000042u);
    BOOST_CHECK_EQUAL(Level::seedForLevel(3, 1234567), 3234567u);
    BOOST_CHECK_EQUAL(Level::seedForLevel(-2, 7), 1000007u);
}

BOOST_AUTO_TEST_CASE(TestConstruction) {
    Level level(makeConfig(2, 99));

    BOOST_CHECK_EQUAL(level.getLevelNumber(), 2);
    BOOST_CHECK_EQUAL(level.getMaze().getWidth(), 23);
    BOOST_CHECK_EQUAL(level.getMaze().getHeight(), 23);
    BOOST_CHECK(level.getMaze().isGenerated());
    BOOST_CHECK(level.getOutcome() == LevelOutcome::Running);
    BOOST_CHECK(!level.getDeathCause().has_value());
    BOOST_CHECK_EQUAL(level.getItemsCollected(), 0);

    BOOST_CHECK(!level.getItems().getItems().empty());
    BOOST_CHECK(!level.getHazards().getCreatures().empty());
    BOOST_REQUIRE(level.getPuzzles().getExitDoor() != nullptr);
    BOOST_CHECK(!level.getPuzzles().isExitUnlocked());

    // The player starts on a walkable cell in a lit candle
    const Vector2D spawn = level.getPlayer().getPosition();
    BOOST_CHECK(!level.getMaze().isWallWorld(spawn.getX(), spawn.getY()));
    BOOST_CHECK(!level.getCandle().isBurntOut());
    BOOST_CHECK(!level.collectSprites().empty());
}

BOOST_AUTO_TEST_CASE(TestSameSeedSameLevel) {
    Level first(makeConfig(3, 5150));
    Level second(makeConfig(3, 5150));

    BOOST_CHECK_EQUAL(first.getPlayer().getAngle(), second.getPlayer().getAngle());
    BOOST_REQUIRE_EQUAL(first.getItems().getItems().size(), second.getItems().getItems().size());
    for (size_t i = 0; i < first.getItems().getItems().size(); ++i) {
        BOOST_CHECK(first.getItems().getItems()[i].position == second.getItems().getItems()[i].position);
    }
    BOOST_REQUIRE_EQUAL(first.getHazards().getCreatures().size(), second.getHazards().getCreatures().size());
    BOOST_REQUIRE_EQUAL(first.getPuzzles().getDoors().size(), second.getPuzzles().getDoors().size());
    for (size_t i = 0; i < first.getPuzzles().getDoors().size(); ++i) {
        BOOST_CHECK(first.getPuzzles().getDoors()[i].position == second.getPuzzles().getDoors()[i].position);
    }
}

BOOST_AUTO_TEST_CASE(TestSpawnHooks) {
    Level level(bareConfig(7));
    BOOST_CHECK(level.getItems().getItems().empty());
    BOOST_CHECK(level.getHazards().getCreatures().empty());
    BOOST_CHECK(level.getPuzzles().getDoors().empty());
    BOOST_CHECK(level.getPuzzles().isExitUnlocked());
    BOOST_CHECK(level.collectSprites().empty());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(LevelUpdateTests)

BOOST_AUTO_TEST_CASE(TestTimeAdvancesWhileRunning) {
    Level level(bareConfig(11));
    const float fuel = level.getCandle().getFuel();

    for (int i = 0; i < 10; ++i) {
        BOOST_CHECK(level.update(0.1f) == LevelOutcome::Running);
    }
    BOOST_CHECK_CLOSE(level.getElapsedTime(), 1.0f, 0.01f);
    BOOST_CHECK_CLOSE(level.getDisplayEffects().elapsedTime, 1.0f, 0.01f);
    BOOST_CHECK(level.getCandle().getFuel() < fuel);

    // Negative steps do not rewind
    level.update(-5.0f);
    BOOST_CHECK_CLOSE(level.getElapsedTime(), 1.0f, 0.01f);
}

BOOST_AUTO_TEST_CASE(TestDarkWallsBreathe) {
    Level level(bareConfig(11));
    const int far = level.getMaze().getWidth() - 1;

    // No time elapsed, nothing moves yet
    const Vector2D still = level.wallDisplayOffset(GridPoint{far, far});
    BOOST_CHECK_EQUAL(still.getX(), 0.0f);
    BOOST_CHECK_EQUAL(still.getY(), 0.0f);

    for (int i = 0; i < 10; ++i) {
        level.update(0.1f);
    }

    const Vector2D distant = level.wallDisplayOffset(GridPoint{far, far});
    BOOST_CHECK_GT(distant.getX(), 0.0f);
    BOOST_CHECK_CLOSE(distant.getX(), distant.getY(), 0.01f);
    BOOST_CHECK_LE(distant.getX(), static_cast<float>(far) * Level::CELL_SIZE * MazeEffects::BREATH_AMPLITUDE);

    // The corner beside the player sits in candle light
    const Vector2D lit = level.wallDisplayOffset(GridPoint{1, 1});
    BOOST_CHECK_EQUAL(lit.getX(), 0.0f);
    BOOST_CHECK_EQUAL(lit.getY(), 0.0f);
}

BOOST_AUTO_TEST_CASE(TestWalkingForward) {
    Level level(bareConfig(12));

    MovementIntent intent;
    intent.forward = 1.0f;
    level.setIntent(intent);
    for (int i = 0; i < 30; ++i) {
        level.update(0.016f);
    }

    const Vector2D end = level.getPlayer().getPosition();
    BOOST_CHECK(!level.getMaze().isWallWorld(end.getX(), end.getY()));
    BOOST_CHECK(level.getView().position == end);
}

BOOST_AUTO_TEST_CASE(TestEscapeWithoutDoors) {
    Level level(bareConfig(13));
    const auto exitPosition = level.getMaze().getExitPosition();
    BOOST_REQUIRE(exitPosition.has_value());

    level.getPlayer().setPosition(*exitPosition);
    BOOST_CHECK(level.update(0.0f) == LevelOutcome::Escaped);

    // Finished levels stay finished
    level.update(1.0f);
    BOOST_CHECK(level.getOutcome() == LevelOutcome::Escaped);
    BOOST_CHECK_EQUAL(level.getElapsedTime(), 0.0f);
}

BOOST_AUTO_TEST_CASE(TestLockedExitHoldsThePlayer) {
    LevelConfig config = bareConfig(14);
    config.spawnDoors = true;
    Level level(config);

    const auto exitPosition = level.getMaze().getExitPosition();
    BOOST_REQUIRE(exitPosition.has_value());
    level.getPlayer().setPosition(*exitPosition);

    BOOST_CHECK(level.update(0.0f) == LevelOutcome::Running);
    BOOST_CHECK(!level.getPuzzles().isExitUnlocked());
}

BOOST_AUTO_TEST_CASE(TestCarriedKeysOpenTheExit) {
    LevelConfig config = bareConfig(14);
    config.spawnDoors = true;
    {
        Level scout(config);
        BOOST_REQUIRE(scout.getPuzzles().getExitDoor() != nullptr);
        config.inventory.keys = scout.getPuzzles().getExitDoor()->requiredKeys;
    }
    Level level(config);
    BOOST_CHECK_EQUAL(level.getInventory().keys, config.inventory.keys);

    const auto exitPosition = level.getMaze().getExitPosition();
    BOOST_REQUIRE(exitPosition.has_value());
    level.getPlayer().setPosition(*exitPosition);

    BOOST_CHECK(level.update(0.0f) == LevelOutcome::Escaped);
    BOOST_CHECK(level.getPuzzles().isExitUnlocked());
    // Keys are kept after opening a door
    BOOST_CHECK_EQUAL(level.getInventory().keys, config.inventory.keys);
}

BOOST_AUTO_TEST_CASE(TestPickups) {
    LevelConfig config = bareConfig(15);
    config.spawnItems = true;
    Level level(config);
    BOOST_REQUIRE(!level.getItems().getItems().empty());

    const Item target = level.getItems().getItems().front();
    level.getPlayer().setPosition(target.position);
    level.update(0.0f);

    BOOST_CHECK_EQUAL(level.getItemsCollected(), 1);
    const std::vector<Item> pickups = level.takePickups();
    BOOST_REQUIRE_EQUAL(pickups.size(), 1u);
    BOOST_CHECK_EQUAL(pickups.front().id, target.id);
    BOOST_CHECK(pickups.front().collected);
    BOOST_CHECK(level.takePickups().empty());

    // Standing on the same spot collects nothing more
    level.update(0.0f);
    BOOST_CHECK_EQUAL(level.getItemsCollected(), 1);
}

BOOST_AUTO_TEST_CASE(TestExplorationAroundThePlayer) {
    Level level(bareConfig(16));
    const Vector2D spawn = level.getPlayer().getPosition();
    const GridPoint cell = level.getMaze().getGrid().worldToGrid(spawn.getX(), spawn.getY());

    BOOST_CHECK(level.isExplored(cell.x, cell.y));
    BOOST_CHECK(!level.isExplored(-1, 0));
    BOOST_CHECK(!level.isExplored(level.getMaze().getWidth(), 0));

    const size_t explored = level.countExplored();
    BOOST_CHECK(explored > 0u);
    BOOST_CHECK(explored <= 21u);

    const int far = level.getMaze().getWidth() - 1;
    BOOST_CHECK(!level.isExplored(far, far));
}

BOOST_AUTO_TEST_SUITE_END()
