/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/MazeEffects.hpp"
#include <algorithm>
#include <cmath>

namespace NightCage::MazeEffects {

float darknessFactor(float distance, float lightRadius) {
  if (lightRadius <= 0.0f || distance <= lightRadius) {
    return 0.0f;
  }
  return std::min(1.0f, (distance - lightRadius) / lightRadius);
}

float breathingAmount(float distance, float elapsedTime, float lightRadius) {
  return std::sin(elapsedTime * BREATH_FREQUENCY) * BREATH_AMPLITUDE *
         darknessFactor(distance, lightRadius);
}

Vector2D breathingOffset(const GridPoint& cell, float cellSize, float elapsedTime,
                         const Vector2D& viewer, float lightRadius) {
  const Vector2D base(static_cast<float>(cell.x) * cellSize, static_cast<float>(cell.y) * cellSize);
  const float amount = breathingAmount(Vector2D::distance(base, viewer), elapsedTime, lightRadius);
  return base * amount;
}

Vector2D warpOffset(const Vector2D& worldPos, float warpPhase, const Vector2D& viewer,
                    float lightRadius) {
  const float amount =
      darknessFactor(Vector2D::distance(worldPos, viewer), lightRadius) * WARP_AMPLITUDE;
  return Vector2D(std::sin(worldPos.getY() * WARP_SPATIAL_FREQUENCY + warpPhase) * amount,
                  std::cos(worldPos.getX() * WARP_SPATIAL_FREQUENCY + warpPhase) * amount);
}

} // namespace NightCage::MazeEffects
