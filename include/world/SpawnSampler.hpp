/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SPAWN_SAMPLER_HPP
#define SPAWN_SAMPLER_HPP

#include "utils/Vector2D.hpp"
#include "world/MazeGrid.hpp"
#include <optional>
#include <random>

namespace NightCage {

/**
 * Rejection sampling of interior PATH cell centres.
 *
 * Draws up to `attempts` random interior cells and returns the centre of
 * the first one that is PATH and passes `accept`. Returns nullopt when the
 * attempts run out; callers treat that as "place nothing".
 */
template <typename Predicate>
std::optional<Vector2D> sampleInteriorPathCell(const MazeGrid& grid, std::mt19937& rng,
                                               int attempts, Predicate&& accept) {
  if (grid.getWidth() < 3 || grid.getHeight() < 3) {
    return std::nullopt;
  }
  std::uniform_int_distribution<int> colDist(1, grid.getWidth() - 2);
  std::uniform_int_distribution<int> rowDist(1, grid.getHeight() - 2);

  for (int i = 0; i < attempts; ++i) {
    const GridPoint cell{colDist(rng), rowDist(rng)};
    if (!grid.isPathCell(cell.x, cell.y)) {
      continue;
    }
    const Vector2D centre = grid.cellCenter(cell);
    if (accept(centre)) {
      return centre;
    }
  }
  return std::nullopt;
}

} // namespace NightCage

#endif // SPAWN_SAMPLER_HPP
