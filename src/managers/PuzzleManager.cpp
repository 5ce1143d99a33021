/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/PuzzleManager.hpp"
#include "core/Logger.hpp"
#include "entities/Inventory.hpp"
#include "world/SpawnSampler.hpp"
#include <algorithm>
#include <format>

namespace NightCage {

PuzzleManager::PuzzleManager(uint32_t seed) : m_rng(seed) {}

std::optional<GridPoint> PuzzleManager::exitApproachCell(const MazeGrid& grid,
                                                         const GridPoint& exitCell) {
  if (exitCell.x == 0) {
    return GridPoint{1, exitCell.y};
  }
  if (exitCell.x == grid.getWidth() - 1) {
    return GridPoint{grid.getWidth() - 2, exitCell.y};
  }
  if (exitCell.y == 0) {
    return GridPoint{exitCell.x, 1};
  }
  if (exitCell.y == grid.getHeight() - 1) {
    return GridPoint{exitCell.x, grid.getHeight() - 2};
  }
  return std::nullopt;
}

Door& PuzzleManager::addDoor(const Vector2D& position, int requiredKeys, bool exitDoor) {
  Door door;
  door.id = static_cast<int>(m_doors.size());
  door.position = position;
  door.requiredKeys = std::max(0, requiredKeys);
  door.exitDoor = exitDoor;
  m_doors.push_back(door);
  return m_doors.back();
}

void PuzzleManager::spawnDoors(const MazeGrid& grid, const std::optional<GridPoint>& exitCell,
                               const Vector2D& spawnPosition) {
  reset();

  if (exitCell) {
    const auto approach = exitApproachCell(grid, *exitCell);
    if (approach && grid.isPathCell(approach->x, approach->y)) {
      addDoor(grid.cellCenter(*approach), EXIT_DOOR_KEYS, true);
    } else {
      PUZZLE_WARN(std::format("No open cell beside exit ({}, {}), exit left unguarded", exitCell->x,
                              exitCell->y));
    }
  }

  std::uniform_int_distribution<int> keyDist(MIN_EXTRA_KEYS, MAX_EXTRA_KEYS);
  for (int i = 0; i < EXTRA_DOORS; ++i) {
    auto pos = sampleInteriorPathCell(grid, m_rng, SPAWN_ATTEMPTS, [&](const Vector2D& candidate) {
      if (Vector2D::distance(candidate, spawnPosition) < MIN_SPAWN_DISTANCE) {
        return false;
      }
      return std::none_of(m_doors.begin(), m_doors.end(), [&](const Door& door) {
        return door.position == candidate;
      });
    });
    if (pos) {
      addDoor(*pos, keyDist(m_rng));
    }
  }

  PUZZLE_INFO(std::format("Placed {} doors", m_doors.size()));
}

bool PuzzleManager::unlockIfPossible(Door& door, const Inventory& inventory) {
  if (door.unlocked) {
    return true;
  }
  if (inventory.keys < door.requiredKeys) {
    return false;
  }
  door.unlocked = true;
  PUZZLE_INFO(std::format("Door {} unlocked with {} keys{}", door.id, door.requiredKeys,
                          door.exitDoor ? " (exit)" : ""));
  return true;
}

int PuzzleManager::tryUnlock(const Vector2D& position, const Inventory& inventory) {
  int opened = 0;
  for (Door& door : m_doors) {
    if (door.unlocked || Vector2D::distance(position, door.position) > UNLOCK_RADIUS) {
      continue;
    }
    if (unlockIfPossible(door, inventory)) {
      ++opened;
    }
  }
  return opened;
}

bool PuzzleManager::isBlocked(const Vector2D& position, const Inventory& inventory) {
  for (Door& door : m_doors) {
    if (door.unlocked || Vector2D::distance(position, door.position) >= BLOCK_RADIUS) {
      continue;
    }
    if (!unlockIfPossible(door, inventory)) {
      return true;
    }
  }
  return false;
}

bool PuzzleManager::isExitUnlocked() const {
  const Door* exitDoor = getExitDoor();
  return exitDoor == nullptr || exitDoor->unlocked;
}

const Door* PuzzleManager::getExitDoor() const {
  auto it = std::find_if(m_doors.begin(), m_doors.end(), [](const Door& door) { return door.exitDoor; });
  return it != m_doors.end() ? &*it : nullptr;
}

size_t PuzzleManager::countLocked() const {
  return static_cast<size_t>(
      std::count_if(m_doors.begin(), m_doors.end(), [](const Door& door) { return !door.unlocked; }));
}

void PuzzleManager::appendSprites(std::vector<Sprite>& sprites) const {
  for (const Door& door : m_doors) {
    Sprite sprite;
    sprite.position = door.position;
    sprite.type = SpriteType::Door;
    sprite.collected = door.unlocked;
    // Opened doors swing out of the way
    sprite.visible = !door.unlocked;
    sprites.push_back(sprite);
  }
}

} // namespace NightCage
