/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/MazeGrid.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <stdexcept>

namespace NightCage {

MazeGrid::MazeGrid(int width, int height, float cellSize)
    : m_width(width), m_height(height), m_cellSize(cellSize) {
  if (width <= 0 || height <= 0) {
    throw std::invalid_argument(
        std::format("Maze grid dimensions must be positive, got {}x{}", width, height));
  }
  if (!(cellSize > 0.0f)) {
    throw std::invalid_argument("Maze grid cell size must be positive");
  }
  m_cells.assign(static_cast<size_t>(width) * static_cast<size_t>(height), CellType::Wall);
}

MazeGrid MazeGrid::fromRows(const std::vector<std::string>& rows, float cellSize) {
  if (rows.empty()) {
    throw std::invalid_argument("Maze grid needs at least one row");
  }
  const size_t width = rows.front().size();
  MazeGrid grid(static_cast<int>(width), static_cast<int>(rows.size()), cellSize);
  for (size_t y = 0; y < rows.size(); ++y) {
    if (rows[y].size() != width) {
      throw std::invalid_argument(std::format("Row {} has {} cells, expected {}", y, rows[y].size(), width));
    }
    for (size_t x = 0; x < width; ++x) {
      grid.setCell(static_cast<int>(x), static_cast<int>(y),
                   rows[y][x] == '#' ? CellType::Wall : CellType::Path);
    }
  }
  return grid;
}

bool MazeGrid::isWallWorld(float x, float y) const {
  const GridPoint cell = worldToGrid(x, y);
  return isWallCell(cell.x, cell.y);
}

GridPoint MazeGrid::worldToGrid(float x, float y) const {
  return GridPoint{static_cast<int>(std::floor(x / m_cellSize)),
                   static_cast<int>(std::floor(y / m_cellSize))};
}

Vector2D MazeGrid::gridToWorld(const GridPoint& cell) const {
  return Vector2D(static_cast<float>(cell.x) * m_cellSize,
                  static_cast<float>(cell.y) * m_cellSize);
}

Vector2D MazeGrid::cellCenter(const GridPoint& cell) const {
  return gridToWorld(cell) + Vector2D(m_cellSize * 0.5f, m_cellSize * 0.5f);
}

size_t MazeGrid::countCells(CellType type) const {
  return static_cast<size_t>(std::count(m_cells.begin(), m_cells.end(), type));
}

} // namespace NightCage
