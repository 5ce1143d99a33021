/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MAZE_HPP
#define MAZE_HPP

#include "world/MazeGenerator.hpp"
#include "world/MazeGrid.hpp"
#include "utils/Vector2D.hpp"
#include <cstdint>
#include <optional>

namespace NightCage {

/**
 * A maze instance: the authoritative grid plus its generation metadata.
 *
 * Constructed with dimensions and seed, populated once by generate(), then
 * read-only for the rest of its life. Visual breathing/warping lives in
 * MazeEffects and never touches this grid.
 */
class Maze {
public:
  static constexpr int DEFAULT_EXIT_RETRIES = 8;
  static constexpr uint64_t RETRY_SEED_STRIDE = 7919;

  explicit Maze(const MazeGenerationConfig& config, int exitRetries = DEFAULT_EXIT_RETRIES);
  // Wraps an already built grid, for hand-made layouts; counts as generated
  Maze(MazeGrid grid, GridPoint spawnCell, std::optional<GridPoint> exitCell);

  // Runs the generator, retrying with derived seeds until an exit is carved;
  // forces an exit if every attempt fails
  void generate();

  bool isGenerated() const { return m_generated; }

  const MazeGrid& getGrid() const { return m_grid; }
  CellType cellAt(int col, int row) const { return m_grid.cellAt(col, row); }
  bool isWallWorld(float x, float y) const { return m_grid.isWallWorld(x, y); }
  float getCellSize() const { return m_grid.getCellSize(); }
  int getWidth() const { return m_grid.getWidth(); }
  int getHeight() const { return m_grid.getHeight(); }

  uint64_t getSeed() const { return m_config.seed; }
  // Seed of the attempt that produced the current grid
  uint64_t getLayoutSeed() const { return m_layoutSeed; }
  int getGenerationAttempts() const { return m_attempts; }
  bool isExitForced() const { return m_exitForced; }

  GridPoint getSpawnCell() const { return m_spawnCell; }
  std::optional<GridPoint> getExitCell() const { return m_exitCell; }

  // World-space centre of the spawn cell; re-opens the cell if it is a wall
  Vector2D getSpawnPosition();
  std::optional<Vector2D> getExitPosition() const;

  float getWarpPhase() const { return m_warpPhase; }

private:
  MazeGenerationConfig m_config;
  int m_exitRetries;

  MazeGrid m_grid;
  GridPoint m_spawnCell{MazeGenerator::SPAWN_CELL};
  std::optional<GridPoint> m_exitCell;
  float m_warpPhase{0.0f};
  uint64_t m_layoutSeed{0};
  int m_attempts{0};
  bool m_exitForced{false};
  bool m_generated{false};
};

} // namespace NightCage

#endif // MAZE_HPP
