/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "rendering/RayCaster.hpp"
#include "world/MazeGrid.hpp"
#include <cmath>

namespace NightCage {

namespace {
// Stands in for 1/0 on an axis the ray never crosses; finite so that
// 0 * NO_CROSSING stays 0 instead of NaN
constexpr float NO_CROSSING = 1e30f;
} // namespace

int RayCaster::maxSteps(float maxDepth, float cellSize) {
  return 2 * static_cast<int>(std::ceil(maxDepth / cellSize)) + 4;
}

float RayCaster::correctFisheye(float distance, float rayAngle, float viewAngle) {
  return distance * std::cos(rayAngle - viewAngle);
}

RayHit RayCaster::castRay(const MazeGrid& grid, const Vector2D& origin, float angle,
                          float maxDepth) {
  const float cellSize = grid.getCellSize();
  const float dirX = std::cos(angle);
  const float dirY = std::sin(angle);

  // Grid-space origin
  const float gridX = origin.getX() / cellSize;
  const float gridY = origin.getY() / cellSize;
  int mapX = static_cast<int>(std::floor(gridX));
  int mapY = static_cast<int>(std::floor(gridY));

  // World distance along the ray between successive x (resp. y) grid lines
  const float deltaX = dirX == 0.0f ? NO_CROSSING : std::abs(cellSize / dirX);
  const float deltaY = dirY == 0.0f ? NO_CROSSING : std::abs(cellSize / dirY);

  int stepX;
  int stepY;
  float sideDistX;
  float sideDistY;
  if (dirX < 0.0f) {
    stepX = -1;
    sideDistX = (gridX - static_cast<float>(mapX)) * deltaX;
  } else {
    stepX = 1;
    sideDistX = (static_cast<float>(mapX) + 1.0f - gridX) * deltaX;
  }
  if (dirY < 0.0f) {
    stepY = -1;
    sideDistY = (gridY - static_cast<float>(mapY)) * deltaY;
  } else {
    stepY = 1;
    sideDistY = (static_cast<float>(mapY) + 1.0f - gridY) * deltaY;
  }

  RayHit result;
  const int stepLimit = maxSteps(maxDepth, cellSize);

  while (result.steps < stepLimit) {
    float boundary;
    if (sideDistX < sideDistY) {
      boundary = sideDistX;
      sideDistX += deltaX;
      mapX += stepX;
      result.side = WallSide::Vertical;
    } else {
      boundary = sideDistY;
      sideDistY += deltaY;
      mapY += stepY;
      result.side = WallSide::Horizontal;
    }
    ++result.steps;

    if (boundary > maxDepth) {
      break;
    }
    if (grid.isWallCell(mapX, mapY)) {
      result.hit = true;
      result.distance = boundary;
      result.hitPoint = origin + Vector2D(dirX, dirY) * boundary;
      result.mapX = mapX;
      result.mapY = mapY;
      return result;
    }
  }

  result.hit = false;
  result.distance = maxDepth;
  result.hitPoint = origin + Vector2D(dirX, dirY) * maxDepth;
  result.mapX = mapX;
  result.mapY = mapY;
  return result;
}

} // namespace NightCage
