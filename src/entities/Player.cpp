/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/Player.hpp"
#include "utils/MathUtils.hpp"
#include "world/MazeGrid.hpp"
#include <algorithm>
#include <cmath>

namespace NightCage {

Player::Player(const Vector2D& position, float angle, float speedMultiplier)
    : m_position(position),
      m_previousPosition(position),
      m_angle(normalizeAngle(angle)),
      m_moveSpeed(BASE_MOVE_SPEED * std::max(0.1f, speedMultiplier)) {}

void Player::setPosition(const Vector2D& position) {
  m_position = position;
  m_previousPosition = position;
}

void Player::setAngle(float angle) {
  m_angle = normalizeAngle(angle);
}

Vector2D Player::computeDisplacement(float deltaTime) const {
  float forward = std::clamp(m_intent.forward, -1.0f, 1.0f);
  float strafe = std::clamp(m_intent.strafe, -1.0f, 1.0f);

  // Diagonal input is no faster than straight input
  const float magnitude = std::sqrt(forward * forward + strafe * strafe);
  if (magnitude > 1.0f) {
    forward /= magnitude;
    strafe /= magnitude;
  }

  const Vector2D facing = Vector2D::fromAngle(m_angle);
  const Vector2D right = Vector2D::fromAngle(m_angle + PI * 0.5f);
  return (facing * forward + right * strafe) * (m_moveSpeed * deltaTime);
}

MovementResult Player::update(float deltaTime, const MazeGrid& grid) {
  m_previousPosition = m_position;

  const float turn = std::clamp(m_intent.turn, -1.0f, 1.0f);
  m_angle = normalizeAngle(m_angle + turn * ROTATION_SPEED * deltaTime + m_intent.mouseYaw);
  // Mouse motion is a one-shot delta
  m_intent.mouseYaw = 0.0f;

  const MovementResult result =
      MovementIntegrator::resolve(grid, m_position, computeDisplacement(deltaTime), COLLISION_RADIUS);
  m_position = result.position;
  m_moving = m_intent.hasTranslation();

  m_jitter = lerp(m_jitter, m_jitterTarget, JITTER_APPROACH);
  return result;
}

} // namespace NightCage
