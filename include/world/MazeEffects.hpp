/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MAZE_EFFECTS_HPP
#define MAZE_EFFECTS_HPP

#include "utils/Vector2D.hpp"
#include "world/MazeGrid.hpp"

namespace NightCage {

// Display-only distortions for walls outside the candle light. These are
// pure functions of their inputs; nothing here reads or writes a MazeGrid
// cell, so collision and ray queries stay on the undistorted geometry.
namespace MazeEffects {

constexpr float BREATH_FREQUENCY = 0.3f;
constexpr float BREATH_AMPLITUDE = 0.01f;
constexpr float WARP_AMPLITUDE = 0.15f;
constexpr float WARP_SPATIAL_FREQUENCY = 0.1f;
// Phase advance per second of game time
constexpr float WARP_DRIFT_RATE = 0.01f;

// 0 inside the light radius, ramping to 1 at twice the radius
float darknessFactor(float distance, float lightRadius);

// Signed scale factor for the breathing effect at a given distance
float breathingAmount(float distance, float elapsedTime, float lightRadius);

// Offset applied to the world position of a grid corner when drawn
Vector2D breathingOffset(const GridPoint& cell, float cellSize, float elapsedTime,
                         const Vector2D& viewer, float lightRadius);

// Sideways wobble of a world point, phase taken from the maze seed
Vector2D warpOffset(const Vector2D& worldPos, float warpPhase, const Vector2D& viewer,
                    float lightRadius);

} // namespace MazeEffects
} // namespace NightCage

#endif // MAZE_EFFECTS_HPP
