/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RAY_CASTER_HPP
#define RAY_CASTER_HPP

#include "utils/Vector2D.hpp"

namespace NightCage {

class MazeGrid;

// Which kind of grid line the ray crossed into the wall cell
enum class WallSide : int {
  Vertical = 0,   // x boundary: east/west face
  Horizontal = 1  // y boundary: north/south face
};

struct RayHit {
  bool hit{false};        // false: ran past maxDepth without meeting a wall
  float distance{0.0f};   // world units along the ray (maxDepth on a miss)
  Vector2D hitPoint;
  WallSide side{WallSide::Vertical};
  int mapX{0};
  int mapY{0};
  int steps{0};           // DDA iterations taken
};

/**
 * Amanatides-Woo grid traversal over a MazeGrid.
 *
 * Every iteration advances at least one grid line, and the boundary
 * distances grow by at least cellSize every two iterations, so a cast
 * finishes within maxSteps(maxDepth, cellSize) iterations.
 */
class RayCaster {
public:
  static constexpr float DEFAULT_MAX_DEPTH = 20.0f;

  static RayHit castRay(const MazeGrid& grid, const Vector2D& origin, float angle,
                        float maxDepth = DEFAULT_MAX_DEPTH);

  // Perpendicular distance to the camera plane
  static float correctFisheye(float distance, float rayAngle, float viewAngle);

  static int maxSteps(float maxDepth, float cellSize);

private:
  RayCaster() = delete;
};

} // namespace NightCage

#endif // RAY_CASTER_HPP
