/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MAZE_GENERATOR_HPP
#define MAZE_GENERATOR_HPP

#include "world/MazeGrid.hpp"
#include <cstdint>
#include <optional>

namespace NightCage {

class MazeRandom;

struct MazeGenerationConfig {
  int width{21};
  int height{21};
  float cellSize{0.5f};
  uint64_t seed{0};

  // Carving: a branch stops once it is this many cells deep
  int maxCarveDepth{15};
  // Junction bias, compared against the seeded stream in a fixed order
  double junctionProbability{0.65};
  double junctionStopProbability{0.4};
  double corridorProbability{0.5};

  // Straight corridors cleared around the spawn before and after carving
  int spawnCorridorLength{10};
  int spawnHallwayLength{8};
};

struct MazeLayout {
  MazeGrid grid;
  GridPoint spawnCell;
  std::optional<GridPoint> exitCell;
  // First sample of the stream; phase for the display-only warp effect
  float warpPhase{0.0f};
};

/**
 * Seeded recursive-backtracking carver.
 *
 * One call to generate() is a single deterministic attempt: the same config
 * always yields the same layout. Retrying on a missing exit is the caller's
 * policy (see Maze::generate).
 */
class MazeGenerator {
public:
  static constexpr GridPoint SPAWN_CELL{1, 1};

  // Throws std::invalid_argument for dimensions below 5 or even
  static void validateConfig(const MazeGenerationConfig& config);

  static MazeLayout generate(const MazeGenerationConfig& config);

  // Explicit-stack carve from start; returns the number of cells entered
  static int carvePassages(MazeGrid& grid, MazeRandom& rng,
                           const MazeGenerationConfig& config, const GridPoint& start);

  // Cross around spawn plus single-width corridors, interior cells only
  static void clearSpawnArea(MazeGrid& grid, const GridPoint& spawn, int corridorLength);

  // Mid-edge candidates in order east, south, west, north
  static std::optional<GridPoint> carveExit(MazeGrid& grid);

  // Exit on the north border above the far end of the eastward spawn hallway
  static GridPoint forceExit(MazeGrid& grid, const GridPoint& spawn, int hallwayLength);

private:
  MazeGenerator() = delete;
};

} // namespace NightCage

#endif // MAZE_GENERATOR_HPP
