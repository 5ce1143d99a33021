/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PLAYER_HPP
#define PLAYER_HPP

#include "physics/MovementIntegrator.hpp"
#include "utils/Vector2D.hpp"

namespace NightCage {

class MazeGrid;

// Per-frame movement request, built by InputManager
struct MovementIntent {
  float forward{0.0f};  // +1 forward, -1 back
  float strafe{0.0f};   // +1 right, -1 left
  float turn{0.0f};     // +1 clockwise, -1 counter-clockwise, scaled by rotation speed
  float mouseYaw{0.0f}; // radians, applied as is

  bool hasTranslation() const { return forward != 0.0f || strafe != 0.0f; }
};

class Player {
public:
  static constexpr float BASE_MOVE_SPEED = 2.0f;     // world units per second
  static constexpr float ROTATION_SPEED = 2.0f;      // radians per second
  static constexpr float COLLISION_RADIUS = 0.15f;
  static constexpr float JITTER_APPROACH = 0.1f;     // per update
  static constexpr float JITTER_ANGLE_SCALE = 0.05f; // radians per unit of flicker

  Player(const Vector2D& position, float angle, float speedMultiplier = 1.0f);

  void setIntent(const MovementIntent& intent) { m_intent = intent; }
  const MovementIntent& getIntent() const { return m_intent; }

  // Applies rotation, then resolves the translation against the grid
  MovementResult update(float deltaTime, const MazeGrid& grid);

  // Displacement the current intent asks for over deltaTime, before collision
  Vector2D computeDisplacement(float deltaTime) const;

  // Puts the player back where the last update started
  void revertMovement() { m_position = m_previousPosition; }

  void setJitterTarget(float target) { m_jitterTarget = target; }
  float getJitter() const { return m_jitter; }
  // Facing plus flicker jitter, used only for rendering
  float getCameraAngle() const { return m_angle + m_jitter * JITTER_ANGLE_SCALE; }

  const Vector2D& getPosition() const { return m_position; }
  const Vector2D& getPreviousPosition() const { return m_previousPosition; }
  void setPosition(const Vector2D& position);
  float getAngle() const { return m_angle; }
  void setAngle(float angle);
  float getRadius() const { return COLLISION_RADIUS; }
  float getMoveSpeed() const { return m_moveSpeed; }
  bool isMoving() const { return m_moving; }

private:
  Vector2D m_position;
  Vector2D m_previousPosition;
  float m_angle{0.0f};
  float m_moveSpeed{BASE_MOVE_SPEED};
  MovementIntent m_intent;
  float m_jitter{0.0f};
  float m_jitterTarget{0.0f};
  bool m_moving{false};
};

} // namespace NightCage

#endif // PLAYER_HPP
