/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LEVEL_HPP
#define LEVEL_HPP

#include "entities/Candle.hpp"
#include "entities/Inventory.hpp"
#include "entities/Player.hpp"
#include "managers/HazardManager.hpp"
#include "managers/ItemManager.hpp"
#include "managers/ProgressionManager.hpp"
#include "managers/PuzzleManager.hpp"
#include "rendering/RaycastRenderer.hpp"
#include "world/Maze.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace NightCage {

enum class LevelOutcome : uint8_t {
  Running,
  Escaped,
  Died
};

struct LevelConfig {
  int levelNumber{1};
  uint64_t seed{1000000};
  int difficulty{1};
  Upgrades upgrades;
  Inventory inventory;  // carried over from the previous maze
  // Test hooks: a level without these is just a maze and a player
  bool spawnItems{true};
  bool spawnHazards{true};
  bool spawnDoors{true};
};

/**
 * One maze of a run and everything living in it.
 *
 * update() advances a fixed order: player movement, door blocking and
 * unlocking, item pickup, candle fuel and flicker, hazards, then the exit
 * check. Once the outcome leaves Running, further updates do nothing.
 */
class Level {
public:
  static constexpr int BASE_MAZE_SIZE = 21;
  static constexpr int MAZE_SIZE_STEP = 2;
  static constexpr float CELL_SIZE = 0.5f;
  static constexpr float EXIT_RADIUS = 1.0f;
  static constexpr int EXPLORE_RADIUS_CELLS = 2;
  static constexpr int MAX_DIFFICULTY = 5;
  static constexpr uint64_t LEVEL_SEED_STRIDE = 1000000;

  // Odd side length of the square maze for a 1-based level number
  static int mazeSizeForLevel(int levelNumber);
  static uint64_t seedForLevel(int levelNumber, uint32_t variation);

  explicit Level(const LevelConfig& config);

  void setIntent(const MovementIntent& intent) { m_player.setIntent(intent); }
  LevelOutcome update(float deltaTime);

  LevelOutcome getOutcome() const { return m_outcome; }
  std::optional<DeathCause> getDeathCause() const { return m_deathCause; }

  int getLevelNumber() const { return m_config.levelNumber; }
  uint64_t getSeed() const { return m_config.seed; }
  float getElapsedTime() const { return m_elapsedTime; }
  int getItemsCollected() const { return m_itemsCollected; }

  const Maze& getMaze() const { return m_maze; }
  Player& getPlayer() { return m_player; }
  const Player& getPlayer() const { return m_player; }
  Candle& getCandle() { return m_candle; }
  const Candle& getCandle() const { return m_candle; }
  ItemManager& getItems() { return m_items; }
  const ItemManager& getItems() const { return m_items; }
  HazardManager& getHazards() { return m_hazards; }
  const HazardManager& getHazards() const { return m_hazards; }
  PuzzleManager& getPuzzles() { return m_puzzles; }
  const PuzzleManager& getPuzzles() const { return m_puzzles; }
  const Inventory& getInventory() const { return m_items.getInventory(); }

  // Renderer inputs for the current state
  std::vector<Sprite> collectSprites() const;
  ViewState getView() const;
  LightState getLight() const { return m_candle.getLightState(); }
  DisplayEffects getDisplayEffects() const;
  // Breathing offset for a wall corner as seen from the player, world units
  Vector2D wallDisplayOffset(const GridPoint& cell) const;

  // Items picked up since the last call, oldest first
  std::vector<Item> takePickups();

  bool isExplored(int col, int row) const;
  size_t countExplored() const;

private:
  void markExplored();
  bool reachedExit() const;

  LevelConfig m_config;
  Maze m_maze;
  Player m_player;
  Candle m_candle;
  ItemManager m_items;
  HazardManager m_hazards;
  PuzzleManager m_puzzles;

  std::vector<uint8_t> m_explored;
  std::vector<Item> m_pickups;
  LevelOutcome m_outcome{LevelOutcome::Running};
  std::optional<DeathCause> m_deathCause;
  float m_elapsedTime{0.0f};
  float m_warpPhase{0.0f};
  int m_itemsCollected{0};
};

} // namespace NightCage

#endif // LEVEL_HPP
