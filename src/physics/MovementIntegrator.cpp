/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "physics/MovementIntegrator.hpp"
#include "world/MazeGrid.hpp"
#include <algorithm>
#include <cmath>

namespace NightCage {

bool MovementIntegrator::isAreaClear(const MazeGrid& grid, const AABB& box, int samples) {
  samples = std::max(2, samples);
  const float width = box.right() - box.left();
  const float height = box.bottom() - box.top();
  const float divisor = static_cast<float>(samples - 1);

  for (int row = 0; row < samples; ++row) {
    const float y = box.top() + height * static_cast<float>(row) / divisor;
    for (int col = 0; col < samples; ++col) {
      const float x = box.left() + width * static_cast<float>(col) / divisor;
      if (grid.isWallWorld(x, y)) {
        return false;
      }
    }
  }
  return true;
}

MovementResult MovementIntegrator::resolve(const MazeGrid& grid, const Vector2D& position,
                                           const Vector2D& displacement, float radius,
                                           int samples) {
  MovementResult result;
  result.position = position;

  const float dx = displacement.getX();
  const float dy = displacement.getY();
  if (dx == 0.0f && dy == 0.0f) {
    return result;
  }

  const AABB box(position, radius);
  const bool canMoveX = dx != 0.0f && isAreaClear(grid, box.translated(Vector2D(dx, 0.0f)), samples);
  const bool canMoveY = dy != 0.0f && isAreaClear(grid, box.translated(Vector2D(0.0f, dy)), samples);

  if (canMoveX && canMoveY) {
    if (isAreaClear(grid, box.translated(displacement), samples)) {
      result.position = position + displacement;
      result.movedX = true;
      result.movedY = true;
      return result;
    }
    // Both axes fine alone but the corner between them is solid:
    // keep the larger component
    if (std::abs(dx) >= std::abs(dy)) {
      result.position.setX(position.getX() + dx);
      result.movedX = true;
    } else {
      result.position.setY(position.getY() + dy);
      result.movedY = true;
    }
    result.blocked = true;
    return result;
  }

  if (canMoveX) {
    result.position.setX(position.getX() + dx);
    result.movedX = true;
  } else if (canMoveY) {
    result.position.setY(position.getY() + dy);
    result.movedY = true;
  }

  // A zero component never counts as blocked
  result.blocked = (dx != 0.0f && !result.movedX) || (dy != 0.0f && !result.movedY);
  return result;
}

} // namespace NightCage
