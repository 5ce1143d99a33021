/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/Maze.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>
#include <utility>

namespace NightCage {

Maze::Maze(const MazeGenerationConfig& config, int exitRetries)
    : m_config(config),
      m_exitRetries(std::max(1, exitRetries)),
      m_grid(config.width, config.height, config.cellSize),
      m_layoutSeed(config.seed) {
  MazeGenerator::validateConfig(config);
}

Maze::Maze(MazeGrid grid, GridPoint spawnCell, std::optional<GridPoint> exitCell)
    : m_exitRetries(DEFAULT_EXIT_RETRIES),
      m_grid(std::move(grid)),
      m_spawnCell(spawnCell),
      m_exitCell(exitCell),
      m_generated(true) {
  m_config.width = m_grid.getWidth();
  m_config.height = m_grid.getHeight();
  m_config.cellSize = m_grid.getCellSize();
  m_config.seed = 0;
}

void Maze::generate() {
  MazeGenerationConfig attemptConfig = m_config;

  for (int attempt = 0; attempt < m_exitRetries; ++attempt) {
    attemptConfig.seed = m_config.seed + static_cast<uint64_t>(attempt) * RETRY_SEED_STRIDE;
    MazeLayout layout = MazeGenerator::generate(attemptConfig);
    m_attempts = attempt + 1;

    // Keep the latest layout so a forced exit still has a carved maze around it
    m_grid = std::move(layout.grid);
    m_spawnCell = layout.spawnCell;
    m_exitCell = layout.exitCell;
    m_warpPhase = layout.warpPhase;
    m_layoutSeed = attemptConfig.seed;

    if (m_exitCell) {
      break;
    }
    MAZE_WARN(std::format("Seed {} produced no exit (attempt {}/{})", attemptConfig.seed,
                          attempt + 1, m_exitRetries));
  }

  m_exitForced = !m_exitCell.has_value();
  if (m_exitForced) {
    m_exitCell = MazeGenerator::forceExit(m_grid, m_spawnCell, m_config.spawnHallwayLength);
    MAZE_WARN(std::format("Forced exit at ({}, {}) after {} attempts", m_exitCell->x,
                          m_exitCell->y, m_attempts));
  }

  m_generated = true;
  MAZE_INFO(std::format("Generated {}x{} maze, seed {} (layout seed {}), exit ({}, {})",
                        m_grid.getWidth(), m_grid.getHeight(), m_config.seed, m_layoutSeed,
                        m_exitCell->x, m_exitCell->y));
}

Vector2D Maze::getSpawnPosition() {
  if (m_grid.isWallCell(m_spawnCell.x, m_spawnCell.y)) {
    MAZE_ERROR(std::format("Spawn cell ({}, {}) is a wall, reopening it", m_spawnCell.x,
                           m_spawnCell.y));
    m_grid.setCell(m_spawnCell.x, m_spawnCell.y, CellType::Path);
  }
  return m_grid.cellCenter(m_spawnCell);
}

std::optional<Vector2D> Maze::getExitPosition() const {
  if (!m_exitCell) {
    return std::nullopt;
  }
  return m_grid.cellCenter(*m_exitCell);
}

} // namespace NightCage
