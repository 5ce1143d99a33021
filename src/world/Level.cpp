/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/Level.hpp"
#include "core/Logger.hpp"
#include "utils/MathUtils.hpp"
#include "world/MazeEffects.hpp"
#include <algorithm>
#include <format>
#include <random>
#include <utility>

namespace NightCage {

namespace {

// Independent streams for each system, all derived from the level seed
enum class SeedStream : uint32_t {
  Items = 1,
  Hazards = 2,
  Doors = 3,
  Flicker = 4,
  Facing = 5
};

uint32_t streamSeed(uint64_t levelSeed, SeedStream stream) {
  return static_cast<uint32_t>(levelSeed * 2654435761ULL + static_cast<uint32_t>(stream) * 40503U);
}

Maze buildMaze(const LevelConfig& config) {
  MazeGenerationConfig mazeConfig;
  mazeConfig.width = Level::mazeSizeForLevel(config.levelNumber);
  mazeConfig.height = mazeConfig.width;
  mazeConfig.cellSize = Level::CELL_SIZE;
  mazeConfig.seed = config.seed;

  Maze maze(mazeConfig);
  maze.generate();
  return maze;
}

float initialFacing(uint64_t levelSeed) {
  std::mt19937 rng(streamSeed(levelSeed, SeedStream::Facing));
  std::uniform_real_distribution<float> angle(0.0f, TWO_PI);
  return angle(rng);
}

} // namespace

int Level::mazeSizeForLevel(int levelNumber) {
  return BASE_MAZE_SIZE + MAZE_SIZE_STEP * (std::max(1, levelNumber) - 1);
}

uint64_t Level::seedForLevel(int levelNumber, uint32_t variation) {
  return static_cast<uint64_t>(std::max(1, levelNumber)) * LEVEL_SEED_STRIDE + variation % LEVEL_SEED_STRIDE;
}

Level::Level(const LevelConfig& config)
    : m_config(config),
      m_maze(buildMaze(config)),
      m_player(m_maze.getSpawnPosition(), initialFacing(config.seed), config.upgrades.movementSpeed),
      m_candle(config.upgrades.candleDuration, config.upgrades.perception,
               streamSeed(config.seed, SeedStream::Flicker)),
      m_items(streamSeed(config.seed, SeedStream::Items)),
      m_hazards(streamSeed(config.seed, SeedStream::Hazards)),
      m_puzzles(streamSeed(config.seed, SeedStream::Doors)),
      m_explored(static_cast<size_t>(m_maze.getWidth()) * static_cast<size_t>(m_maze.getHeight()), 0),
      m_warpPhase(m_maze.getWarpPhase()) {
  m_config.difficulty = std::clamp(m_config.difficulty, 0, MAX_DIFFICULTY);
  m_items.setInventory(config.inventory);

  const Vector2D spawn = m_player.getPosition();
  if (m_config.spawnItems) {
    m_items.spawnItems(m_maze.getGrid(), spawn);
  }
  if (m_config.spawnHazards) {
    m_hazards.spawnHazards(m_maze.getGrid(), spawn, m_config.difficulty,
                           m_config.upgrades.shadowEvasion);
  }
  if (m_config.spawnDoors) {
    m_puzzles.spawnDoors(m_maze.getGrid(), m_maze.getExitCell(), spawn);
  }
  markExplored();

  LEVEL_INFO(std::format("Level {} ready: {}x{} maze, seed {}, difficulty {}", m_config.levelNumber,
                         m_maze.getWidth(), m_maze.getHeight(), m_config.seed, m_config.difficulty));
}

LevelOutcome Level::update(float deltaTime) {
  if (m_outcome != LevelOutcome::Running) {
    return m_outcome;
  }
  deltaTime = std::max(0.0f, deltaTime);
  m_elapsedTime += deltaTime;
  m_warpPhase += deltaTime * MazeEffects::WARP_DRIFT_RATE;

  const MazeGrid& grid = m_maze.getGrid();
  m_player.update(deltaTime, grid);

  Inventory& inventory = m_items.getInventory();
  if (m_puzzles.isBlocked(m_player.getPosition(), inventory)) {
    m_player.revertMovement();
  }
  m_puzzles.tryUnlock(m_player.getPosition(), inventory);

  if (auto item = m_items.checkCollection(m_player.getPosition())) {
    ++m_itemsCollected;
    m_pickups.push_back(std::move(*item));
  }

  m_candle.update(deltaTime, inventory);
  m_player.setJitterTarget(m_candle.getFlicker().getAmount());

  if (auto event = m_hazards.update(deltaTime, m_player.getPosition(), grid)) {
    m_outcome = LevelOutcome::Died;
    m_deathCause = event->cause;
    LEVEL_INFO(std::format("Level {} lost to {} after {:.1f}s", m_config.levelNumber,
                           deathCauseName(event->cause), m_elapsedTime));
    return m_outcome;
  }

  if (reachedExit()) {
    m_outcome = LevelOutcome::Escaped;
    LEVEL_INFO(std::format("Level {} escaped after {:.1f}s with {} items", m_config.levelNumber,
                           m_elapsedTime, m_itemsCollected));
    return m_outcome;
  }

  markExplored();
  return m_outcome;
}

bool Level::reachedExit() const {
  const auto exitPosition = m_maze.getExitPosition();
  if (!exitPosition || !m_puzzles.isExitUnlocked()) {
    return false;
  }
  return Vector2D::distance(m_player.getPosition(), *exitPosition) < EXIT_RADIUS;
}

std::vector<Sprite> Level::collectSprites() const {
  std::vector<Sprite> sprites;
  sprites.reserve(m_items.getItems().size() + m_hazards.getCreatures().size() +
                  m_hazards.getFloors().size() + m_puzzles.getDoors().size());
  m_items.appendSprites(sprites);
  m_hazards.appendSprites(sprites);
  m_puzzles.appendSprites(sprites);
  return sprites;
}

std::vector<Item> Level::takePickups() {
  std::vector<Item> pickups;
  pickups.swap(m_pickups);
  return pickups;
}

ViewState Level::getView() const {
  return ViewState{m_player.getPosition(), m_player.getCameraAngle()};
}

DisplayEffects Level::getDisplayEffects() const {
  DisplayEffects effects;
  effects.elapsedTime = m_elapsedTime;
  effects.warpPhase = m_warpPhase;
  return effects;
}

Vector2D Level::wallDisplayOffset(const GridPoint& cell) const {
  return MazeEffects::breathingOffset(cell, m_maze.getGrid().getCellSize(), m_elapsedTime,
                                      m_player.getPosition(), getLight().radius);
}

void Level::markExplored() {
  const GridPoint centre = m_maze.getGrid().worldToGrid(m_player.getPosition().getX(),
                                                        m_player.getPosition().getY());
  const int radiusSq = EXPLORE_RADIUS_CELLS * EXPLORE_RADIUS_CELLS;
  for (int dy = -EXPLORE_RADIUS_CELLS; dy <= EXPLORE_RADIUS_CELLS; ++dy) {
    for (int dx = -EXPLORE_RADIUS_CELLS; dx <= EXPLORE_RADIUS_CELLS; ++dx) {
      const int col = centre.x + dx;
      const int row = centre.y + dy;
      if (dx * dx + dy * dy > radiusSq || !m_maze.getGrid().inBounds(col, row)) {
        continue;
      }
      m_explored[static_cast<size_t>(row) * static_cast<size_t>(m_maze.getWidth()) +
                 static_cast<size_t>(col)] = 1;
    }
  }
}

bool Level::isExplored(int col, int row) const {
  if (!m_maze.getGrid().inBounds(col, row)) {
    return false;
  }
  return m_explored[static_cast<size_t>(row) * static_cast<size_t>(m_maze.getWidth()) +
                    static_cast<size_t>(col)] != 0;
}

size_t Level::countExplored() const {
  return static_cast<size_t>(std::count(m_explored.begin(), m_explored.end(), uint8_t{1}));
}

} // namespace NightCage
