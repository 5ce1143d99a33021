/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PUZZLE_MANAGER_HPP
#define PUZZLE_MANAGER_HPP

#include "rendering/Sprite.hpp"
#include "utils/Vector2D.hpp"
#include "world/MazeGrid.hpp"
#include <cstdint>
#include <optional>
#include <random>
#include <vector>

namespace NightCage {

struct Inventory;

struct Door {
  int id{0};
  Vector2D position;
  int requiredKeys{1};
  bool unlocked{false};
  bool exitDoor{false};
};

/**
 * @brief Key-locked doors of one maze
 *
 * One door guards the exit from the interior cell next to it; a few more
 * sit on random corridor cells. Keys are checked, never spent.
 */
class PuzzleManager {
public:
  static constexpr int EXIT_DOOR_KEYS = 3;
  static constexpr int EXTRA_DOORS = 2;
  static constexpr int MIN_EXTRA_KEYS = 1;
  static constexpr int MAX_EXTRA_KEYS = 2;
  static constexpr float UNLOCK_RADIUS = 0.8f;
  static constexpr float BLOCK_RADIUS = 0.5f;
  static constexpr float MIN_SPAWN_DISTANCE = 1.0f;
  static constexpr int SPAWN_ATTEMPTS = 20;

  explicit PuzzleManager(uint32_t seed = 0);

  void spawnDoors(const MazeGrid& grid, const std::optional<GridPoint>& exitCell,
                  const Vector2D& spawnPosition);

  // Interior neighbour of a border exit cell
  static std::optional<GridPoint> exitApproachCell(const MazeGrid& grid, const GridPoint& exitCell);

  Door& addDoor(const Vector2D& position, int requiredKeys, bool exitDoor = false);

  // Unlocks every locked door within UNLOCK_RADIUS that the keys allow;
  // returns how many opened
  int tryUnlock(const Vector2D& position, const Inventory& inventory);

  // True if position is inside a locked door's BLOCK_RADIUS. Tries to
  // unlock the door first.
  bool isBlocked(const Vector2D& position, const Inventory& inventory);

  // True when there is no exit door or it has been opened
  bool isExitUnlocked() const;
  const Door* getExitDoor() const;

  const std::vector<Door>& getDoors() const { return m_doors; }
  size_t countLocked() const;
  void appendSprites(std::vector<Sprite>& sprites) const;

  void reset() { m_doors.clear(); }

private:
  bool unlockIfPossible(Door& door, const Inventory& inventory);

  std::vector<Door> m_doors;
  std::mt19937 m_rng;
};

} // namespace NightCage

#endif // PUZZLE_MANAGER_HPP
