/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef HAZARD_MANAGER_HPP
#define HAZARD_MANAGER_HPP

#include "physics/AABB.hpp"
#include "rendering/Sprite.hpp"
#include "utils/Vector2D.hpp"
#include <cstdint>
#include <optional>
#include <random>
#include <string_view>
#include <vector>

namespace NightCage {

class MazeGrid;

enum class CreatureState : uint8_t {
  Idle,
  Chasing,
  Attacking
};

enum class DeathCause : uint8_t {
  ShadowCreature,
  CollapsingFloor
};

std::string_view deathCauseName(DeathCause cause);

struct ShadowCreature {
  int id{0};
  Vector2D position;
  Vector2D wanderTarget;
  float speed{0.0f};
  float wanderTimer{0.0f};
  CreatureState state{CreatureState::Idle};
  bool hasWanderTarget{false};
};

struct CollapsingFloor {
  int id{0};
  AABB area;
  bool triggered{false};
  float collapseTime{0.0f}; // seconds since triggering
};

struct HazardEvent {
  DeathCause cause{DeathCause::ShadowCreature};
  int hazardId{0};
};

/**
 * @brief Shadow creatures and collapsing floors of one maze
 *
 * Creatures run a three-state machine each update: attacking when the
 * player is inside the attack radius (the run ends), chasing inside the
 * chase radius, otherwise idling toward a short random wander target.
 * All creature movement goes through MovementIntegrator with a small box,
 * so creatures never pass through walls.
 */
class HazardManager {
public:
  static constexpr float CHASE_RADIUS = 8.0f;
  static constexpr float ATTACK_RADIUS = 0.5f;
  static constexpr float CREATURE_RADIUS = 0.1f;
  static constexpr float BASE_CREATURE_SPEED = 0.6f;   // world units per second
  static constexpr float SPEED_PER_DIFFICULTY = 0.3f;
  static constexpr float IDLE_SPEED_FACTOR = 0.5f;
  static constexpr float WANDER_DISTANCE = 2.0f;
  static constexpr float WANDER_INTERVAL = 2.0f;       // seconds
  static constexpr float WANDER_ARRIVAL = 0.1f;
  static constexpr float FLOOR_SIZE = 1.0f;
  static constexpr float FLOOR_TRIGGER_RADIUS = 1.5f;
  static constexpr float COLLAPSE_DELAY = 1.0f;        // seconds
  static constexpr float MIN_SPAWN_DISTANCE = 3.0f;
  static constexpr int SPAWN_ATTEMPTS = 20;

  explicit HazardManager(uint32_t seed = 0);

  // Replaces all hazards: 2 + difficulty creatures, 1 + difficulty / 2 floors
  void spawnHazards(const MazeGrid& grid, const Vector2D& playerSpawn, int difficulty,
                    float shadowEvasion = 1.0f);

  static float creatureSpeed(int difficulty, float shadowEvasion);

  ShadowCreature& addCreature(const Vector2D& position, float speed);
  CollapsingFloor& addFloor(const Vector2D& center);

  // Advances every hazard; returns the first fatal event, if any
  std::optional<HazardEvent> update(float deltaTime, const Vector2D& playerPosition,
                                    const MazeGrid& grid);

  const std::vector<ShadowCreature>& getCreatures() const { return m_creatures; }
  const std::vector<CollapsingFloor>& getFloors() const { return m_floors; }
  void appendSprites(std::vector<Sprite>& sprites) const;

  void reset();

private:
  void updateCreature(ShadowCreature& creature, float deltaTime, const Vector2D& playerPosition,
                      const MazeGrid& grid);
  void moveCreature(ShadowCreature& creature, const Vector2D& direction, float distance,
                    const MazeGrid& grid);

  std::vector<ShadowCreature> m_creatures;
  std::vector<CollapsingFloor> m_floors;
  std::mt19937 m_rng;
};

} // namespace NightCage

#endif // HAZARD_MANAGER_HPP
