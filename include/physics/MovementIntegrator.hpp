/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MOVEMENT_INTEGRATOR_HPP
#define MOVEMENT_INTEGRATOR_HPP

#include "physics/AABB.hpp"
#include "utils/Vector2D.hpp"

namespace NightCage {

class MazeGrid;

struct MovementResult {
  Vector2D position;
  bool movedX{false};
  bool movedY{false};
  // True when any part of the requested displacement was rejected
  bool blocked{false};
};

/**
 * Resolves a requested displacement against the maze walls.
 *
 * The mover is a square box sampled on an n x n lattice that includes its
 * corners. Each axis is tried on its own, then the combined move, so a
 * mover pressed against a wall slides along it instead of stopping dead.
 * Results are only ever positions whose box samples are all on PATH cells,
 * provided the starting position was one.
 */
class MovementIntegrator {
public:
  static constexpr int DEFAULT_SAMPLES = 4;

  // True when every sample point of box is on a PATH cell
  static bool isAreaClear(const MazeGrid& grid, const AABB& box, int samples = DEFAULT_SAMPLES);
  static bool isAreaClear(const MazeGrid& grid, const Vector2D& center, float radius,
                          int samples = DEFAULT_SAMPLES) {
    return isAreaClear(grid, AABB(center, radius), samples);
  }

  static MovementResult resolve(const MazeGrid& grid, const Vector2D& position,
                                const Vector2D& displacement, float radius,
                                int samples = DEFAULT_SAMPLES);

private:
  MovementIntegrator() = delete;
};

} // namespace NightCage

#endif // MOVEMENT_INTEGRATOR_HPP
