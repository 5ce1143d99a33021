/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MAZE_GRID_HPP
#define MAZE_GRID_HPP

#include "utils/Vector2D.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace NightCage {

enum class CellType : uint8_t {
  Path = 0,
  Wall = 1
};

struct GridPoint {
  int x{0};
  int y{0};

  bool operator==(const GridPoint& other) const = default;
};

/**
 * Rectangular WALL/PATH cell array shared read-only by collision and
 * rendering. Anything outside the array reads as WALL, so ray and collision
 * code never needs its own bounds checks.
 *
 * Only MazeGenerator and Maze write cells; everyone else sees a const grid.
 */
class MazeGrid {
public:
  // All cells start as WALL. Throws std::invalid_argument for non-positive
  // dimensions or cell size.
  MazeGrid(int width, int height, float cellSize);

  // Builds a grid from rows of '#' (wall) and '.' (path); used by tools and tests
  static MazeGrid fromRows(const std::vector<std::string>& rows, float cellSize);

  CellType cellAt(int col, int row) const {
    if (!inBounds(col, row)) {
      return CellType::Wall;
    }
    return m_cells[index(col, row)];
  }

  bool isWallCell(int col, int row) const { return cellAt(col, row) == CellType::Wall; }
  bool isPathCell(int col, int row) const { return cellAt(col, row) == CellType::Path; }
  bool isWallWorld(float x, float y) const;

  bool inBounds(int col, int row) const {
    return col >= 0 && row >= 0 && col < m_width && row < m_height;
  }
  // Interior cells exclude the border ring
  bool isInterior(int col, int row) const {
    return col > 0 && row > 0 && col < m_width - 1 && row < m_height - 1;
  }

  GridPoint worldToGrid(float x, float y) const;
  Vector2D gridToWorld(const GridPoint& cell) const;
  Vector2D cellCenter(const GridPoint& cell) const;

  int getWidth() const { return m_width; }
  int getHeight() const { return m_height; }
  float getCellSize() const { return m_cellSize; }
  size_t countCells(CellType type) const;

  bool operator==(const MazeGrid& other) const {
    return m_width == other.m_width && m_height == other.m_height &&
           m_cellSize == other.m_cellSize && m_cells == other.m_cells;
  }

private:
  friend class MazeGenerator;
  friend class Maze;

  void setCell(int col, int row, CellType type) {
    if (inBounds(col, row)) {
      m_cells[index(col, row)] = type;
    }
  }

  size_t index(int col, int row) const {
    return static_cast<size_t>(row) * static_cast<size_t>(m_width) + static_cast<size_t>(col);
  }

  int m_width;
  int m_height;
  float m_cellSize;
  std::vector<CellType> m_cells;
};

} // namespace NightCage

#endif // MAZE_GRID_HPP
