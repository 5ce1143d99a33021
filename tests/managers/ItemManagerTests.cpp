/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE ItemManagerTests
#include <boost/test/unit_test.hpp>

#include "managers/ItemManager.hpp"
#include "world/MazeGenerator.hpp"
#include "world/MazeGrid.hpp"
#include <algorithm>
#include <string>

using namespace NightCage;

struct ItemFixture {
    MazeLayout layout;
    Vector2D spawn;
    ItemManager items{1234};

    ItemFixture() : layout(makeLayout()), spawn(layout.grid.cellCenter(layout.spawnCell)) {}

    static MazeLayout makeLayout() {
        MazeGenerationConfig config;
        config.width = 31;
        config.height = 31;
        config.cellSize = 0.5f;
        config.seed = 31337;
        return MazeGenerator::generate(config);
    }
};

BOOST_FIXTURE_TEST_SUITE(ItemManagerTestSuite, ItemFixture)

BOOST_AUTO_TEST_CASE(TestSpawnPlacementRules) {
    ItemSpawnConfig config;
    items.spawnItems(layout.grid, spawn, config);

    const auto& placed = items.getItems();
    BOOST_REQUIRE(!placed.empty());
    BOOST_CHECK_LE(items.countItems(ItemType::Key), static_cast<size_t>(config.keys));
    BOOST_CHECK_LE(items.countItems(ItemType::Artifact), static_cast<size_t>(config.artifacts));
    BOOST_CHECK_LE(items.countItems(ItemType::Note), static_cast<size_t>(config.notes));
    BOOST_CHECK_LE(items.countItems(ItemType::LightSource), static_cast<size_t>(config.lightSources));
    BOOST_CHECK_GT(items.countItems(ItemType::Key), 0u);

    for (size_t i = 0; i < placed.size(); ++i) {
        const Item& item = placed[i];
        BOOST_CHECK_EQUAL(item.id, static_cast<int>(i));
        const GridPoint cell = layout.grid.worldToGrid(item.position.getX(), item.position.getY());
        BOOST_CHECK(layout.grid.isInterior(cell.x, cell.y));
        BOOST_CHECK(layout.grid.isPathCell(cell.x, cell.y));
        BOOST_CHECK_GE(Vector2D::distance(item.position, spawn), config.minSpawnDistance);

        for (size_t j = i + 1; j < placed.size(); ++j) {
            BOOST_CHECK_GE(Vector2D::distance(item.position, placed[j].position), config.minItemSpacing);
        }
    }
}

BOOST_AUTO_TEST_CASE(TestSpawnIsSeeded) {
    ItemManager other(1234);
    items.spawnItems(layout.grid, spawn);
    other.spawnItems(layout.grid, spawn);

    BOOST_REQUIRE_EQUAL(items.getItems().size(), other.getItems().size());
    for (size_t i = 0; i < items.getItems().size(); ++i) {
        BOOST_CHECK_EQUAL(items.getItems()[i].position.getX(), other.getItems()[i].position.getX());
        BOOST_CHECK_EQUAL(items.getItems()[i].position.getY(), other.getItems()[i].position.getY());
        BOOST_CHECK(items.getItems()[i].type == other.getItems()[i].type);
    }
}

BOOST_AUTO_TEST_CASE(TestNotesAndArtifactsCarryText) {
    items.spawnItems(layout.grid, spawn);
    const auto texts = ItemManager::getNoteTexts();

    for (const Item& item : items.getItems()) {
        if (item.type == ItemType::Note) {
            BOOST_CHECK(std::find(texts.begin(), texts.end(), item.text) != texts.end());
        } else if (item.type == ItemType::Artifact) {
            BOOST_CHECK(item.name.rfind("Artifact ", 0) == 0);
            BOOST_CHECK(!item.text.empty());
        }
    }
}

BOOST_AUTO_TEST_CASE(TestCollectionUpdatesInventory) {
    items.createItem(ItemType::Key, Vector2D(2.0f, 2.0f));
    items.createItem(ItemType::Artifact, Vector2D(5.0f, 5.0f));
    items.createItem(ItemType::LightSource, Vector2D(8.0f, 8.0f));

    BOOST_CHECK(!items.checkCollection(Vector2D(2.6f, 2.0f)).has_value());

    const auto key = items.checkCollection(Vector2D(2.3f, 2.0f));
    BOOST_REQUIRE(key.has_value());
    BOOST_CHECK(key->type == ItemType::Key);
    BOOST_CHECK(key->collected);
    BOOST_CHECK_EQUAL(items.getInventory().keys, 1);

    // Already collected
    BOOST_CHECK(!items.checkCollection(Vector2D(2.0f, 2.0f)).has_value());

    BOOST_REQUIRE(items.checkCollection(Vector2D(5.0f, 5.1f)).has_value());
    BOOST_REQUIRE_EQUAL(items.getInventory().artifacts.size(), 1u);
    BOOST_CHECK_EQUAL(items.getInventory().artifacts.front(), 1);

    BOOST_REQUIRE(items.checkCollection(Vector2D(8.0f, 8.0f)).has_value());
    BOOST_CHECK_EQUAL(items.getInventory().lightSources, Inventory::STARTING_LIGHT_SOURCES + 1);
    BOOST_CHECK_EQUAL(items.getInventory().totalCollected(), 3);
}

BOOST_AUTO_TEST_CASE(TestCollectItemById) {
    items.createItem(ItemType::Note, Vector2D(1.0f, 1.0f));

    BOOST_CHECK(items.collectItem(0));
    BOOST_CHECK(!items.collectItem(0));
    BOOST_CHECK(!items.collectItem(-1));
    BOOST_CHECK(!items.collectItem(42));
    BOOST_CHECK_EQUAL(items.getInventory().notes.size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestCountsAndSprites) {
    items.createItem(ItemType::Key, Vector2D(1.0f, 1.0f));
    items.createItem(ItemType::Key, Vector2D(3.0f, 1.0f));
    items.createItem(ItemType::Note, Vector2D(5.0f, 1.0f));
    items.collectItem(0);

    BOOST_CHECK_EQUAL(items.countItems(ItemType::Key), 1u);
    BOOST_CHECK_EQUAL(items.countItems(ItemType::Key, false), 2u);

    std::vector<Sprite> sprites;
    items.appendSprites(sprites);
    BOOST_REQUIRE_EQUAL(sprites.size(), 2u);
    BOOST_CHECK(sprites[0].type == SpriteType::Key);
    BOOST_CHECK(sprites[1].type == SpriteType::Note);
    BOOST_CHECK_EQUAL(sprites[0].position.getX(), 3.0f);
}

BOOST_AUTO_TEST_CASE(TestInventoryCarryAndReset) {
    Inventory carried;
    carried.keys = 4;
    carried.lightSources = 2;
    items.setInventory(carried);
    items.spawnItems(layout.grid, spawn);

    // Respawning a maze keeps the run inventory
    BOOST_CHECK_EQUAL(items.getInventory().keys, 4);

    items.reset();
    BOOST_CHECK(items.getItems().empty());
    BOOST_CHECK_EQUAL(items.getInventory().keys, 0);
    BOOST_CHECK_EQUAL(items.getInventory().lightSources, Inventory::STARTING_LIGHT_SOURCES);
}

BOOST_AUTO_TEST_CASE(TestSpriteTypeMapping) {
    BOOST_CHECK(ItemManager::spriteTypeFor(ItemType::Key) == SpriteType::Key);
    BOOST_CHECK(ItemManager::spriteTypeFor(ItemType::Artifact) == SpriteType::Artifact);
    BOOST_CHECK(ItemManager::spriteTypeFor(ItemType::Note) == SpriteType::Note);
    BOOST_CHECK(ItemManager::spriteTypeFor(ItemType::LightSource) == SpriteType::LightSource);
}

BOOST_AUTO_TEST_SUITE_END()
