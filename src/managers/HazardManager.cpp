/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/HazardManager.hpp"
#include "core/Logger.hpp"
#include "physics/MovementIntegrator.hpp"
#include "utils/MathUtils.hpp"
#include "world/MazeGrid.hpp"
#include "world/SpawnSampler.hpp"
#include <algorithm>
#include <format>

namespace NightCage {

std::string_view deathCauseName(DeathCause cause) {
  switch (cause) {
  case DeathCause::ShadowCreature:
    return "shadow_creature";
  case DeathCause::CollapsingFloor:
    return "collapsing_floor";
  }
  return "unknown";
}

HazardManager::HazardManager(uint32_t seed) : m_rng(seed) {}

float HazardManager::creatureSpeed(int difficulty, float shadowEvasion) {
  const float speed = BASE_CREATURE_SPEED + SPEED_PER_DIFFICULTY * static_cast<float>(std::max(0, difficulty));
  return speed / std::max(0.1f, shadowEvasion);
}

ShadowCreature& HazardManager::addCreature(const Vector2D& position, float speed) {
  ShadowCreature creature;
  creature.id = static_cast<int>(m_creatures.size());
  creature.position = position;
  creature.wanderTarget = position;
  creature.speed = speed;
  m_creatures.push_back(creature);
  return m_creatures.back();
}

CollapsingFloor& HazardManager::addFloor(const Vector2D& center) {
  CollapsingFloor floor;
  floor.id = static_cast<int>(m_floors.size());
  floor.area = AABB(center, FLOOR_SIZE * 0.5f);
  m_floors.push_back(floor);
  return m_floors.back();
}

void HazardManager::spawnHazards(const MazeGrid& grid, const Vector2D& playerSpawn, int difficulty,
                                 float shadowEvasion) {
  reset();
  difficulty = std::max(0, difficulty);

  auto farFromSpawn = [&](const Vector2D& candidate) {
    return Vector2D::distance(candidate, playerSpawn) >= MIN_SPAWN_DISTANCE;
  };

  const float speed = creatureSpeed(difficulty, shadowEvasion);
  const int creatureCount = 2 + difficulty;
  for (int i = 0; i < creatureCount; ++i) {
    if (auto pos = sampleInteriorPathCell(grid, m_rng, SPAWN_ATTEMPTS, farFromSpawn)) {
      addCreature(*pos, speed);
    }
  }

  const int floorCount = 1 + difficulty / 2;
  for (int i = 0; i < floorCount; ++i) {
    if (auto pos = sampleInteriorPathCell(grid, m_rng, SPAWN_ATTEMPTS, farFromSpawn)) {
      addFloor(*pos);
    }
  }

  HAZARD_INFO(std::format("Spawned {} shadow creatures (speed {:.2f}) and {} collapsing floors at difficulty {}",
                          m_creatures.size(), speed, m_floors.size(), difficulty));
}

void HazardManager::moveCreature(ShadowCreature& creature, const Vector2D& direction, float distance,
                                 const MazeGrid& grid) {
  const MovementResult result =
      MovementIntegrator::resolve(grid, creature.position, direction * distance, CREATURE_RADIUS);
  creature.position = result.position;
}

void HazardManager::updateCreature(ShadowCreature& creature, float deltaTime,
                                   const Vector2D& playerPosition, const MazeGrid& grid) {
  const float distToPlayer = Vector2D::distance(creature.position, playerPosition);

  if (distToPlayer < ATTACK_RADIUS) {
    creature.state = CreatureState::Attacking;
    return;
  }

  if (distToPlayer < CHASE_RADIUS) {
    if (creature.state != CreatureState::Chasing) {
      HAZARD_DEBUG(std::format("Creature {} started chasing", creature.id));
    }
    creature.state = CreatureState::Chasing;
    moveCreature(creature, (playerPosition - creature.position).normalized(),
                 creature.speed * deltaTime, grid);
    return;
  }

  creature.state = CreatureState::Idle;
  creature.wanderTimer += deltaTime;
  if (!creature.hasWanderTarget || creature.wanderTimer > WANDER_INTERVAL) {
    std::uniform_real_distribution<float> angleDist(0.0f, TWO_PI);
    creature.wanderTarget = creature.position + Vector2D::fromAngle(angleDist(m_rng)) * WANDER_DISTANCE;
    creature.wanderTimer = 0.0f;
    creature.hasWanderTarget = true;
  }

  const Vector2D toTarget = creature.wanderTarget - creature.position;
  if (toTarget.length() > WANDER_ARRIVAL) {
    moveCreature(creature, toTarget.normalized(), creature.speed * deltaTime * IDLE_SPEED_FACTOR, grid);
  }
}

std::optional<HazardEvent> HazardManager::update(float deltaTime, const Vector2D& playerPosition,
                                                 const MazeGrid& grid) {
  for (ShadowCreature& creature : m_creatures) {
    updateCreature(creature, deltaTime, playerPosition, grid);
    if (creature.state == CreatureState::Attacking) {
      HAZARD_INFO(std::format("Player caught by creature {}", creature.id));
      return HazardEvent{DeathCause::ShadowCreature, creature.id};
    }
  }

  for (CollapsingFloor& floor : m_floors) {
    if (floor.triggered) {
      floor.collapseTime += deltaTime;
      if (floor.collapseTime > COLLAPSE_DELAY && floor.area.contains(playerPosition)) {
        HAZARD_INFO(std::format("Player fell through floor {}", floor.id));
        return HazardEvent{DeathCause::CollapsingFloor, floor.id};
      }
    } else if (Vector2D::distance(playerPosition, floor.area.center) < FLOOR_TRIGGER_RADIUS) {
      floor.triggered = true;
      HAZARD_DEBUG(std::format("Floor {} triggered", floor.id));
    }
  }

  return std::nullopt;
}

void HazardManager::appendSprites(std::vector<Sprite>& sprites) const {
  for (const ShadowCreature& creature : m_creatures) {
    Sprite sprite;
    sprite.position = creature.position;
    sprite.type = SpriteType::Hazard;
    sprites.push_back(sprite);
  }
  // Floors only show once they start to give way
  for (const CollapsingFloor& floor : m_floors) {
    if (!floor.triggered) {
      continue;
    }
    Sprite sprite;
    sprite.position = floor.area.center;
    sprite.type = SpriteType::Hazard;
    sprite.colorOverride = Color::fromHex(0xff0000);
    sprites.push_back(sprite);
  }
}

void HazardManager::reset() {
  m_creatures.clear();
  m_floors.clear();
}

} // namespace NightCage
