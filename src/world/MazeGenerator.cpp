/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/MazeGenerator.hpp"
#include "core/Logger.hpp"
#include "world/MazeRandom.hpp"
#include <algorithm>
#include <array>
#include <boost/container/small_vector.hpp>
#include <format>
#include <stdexcept>
#include <vector>

namespace NightCage {

namespace {

// What a frame does once the branch it descended into has finished
enum class Continuation : uint8_t {
  None,
  AfterJunction, // may carve another branch
  AfterCorridor  // corridor branches never fork again
};

struct CarveOption {
  GridPoint wall;
  GridPoint cell;
};

struct CarveFrame {
  GridPoint cell;
  int depth{0};
  boost::container::small_vector<CarveOption, 4> options;
  size_t next{0};
  int carved{0};
  Continuation pending{Continuation::None};
};

constexpr std::array<GridPoint, 4> CARVE_STEPS{{{0, -2}, {2, 0}, {0, 2}, {-2, 0}}};
constexpr std::array<GridPoint, 4> CARDINALS{{{1, 0}, {0, 1}, {-1, 0}, {0, -1}}};

} // namespace

void MazeGenerator::validateConfig(const MazeGenerationConfig& config) {
  if (config.width < 5 || config.height < 5) {
    throw std::invalid_argument(std::format(
        "Maze must be at least 5x5, got {}x{}", config.width, config.height));
  }
  if (config.width % 2 == 0 || config.height % 2 == 0) {
    throw std::invalid_argument(std::format(
        "Maze dimensions must be odd, got {}x{}", config.width, config.height));
  }
  if (config.maxCarveDepth < 0) {
    throw std::invalid_argument("Maze carve depth cannot be negative");
  }
}

MazeLayout MazeGenerator::generate(const MazeGenerationConfig& config) {
  validateConfig(config);

  MazeRandom rng(config.seed);
  MazeLayout layout{MazeGrid(config.width, config.height, config.cellSize), SPAWN_CELL,
                    std::nullopt, 0.0f};
  layout.warpPhase = static_cast<float>(rng.next() * 1000.0);

  clearSpawnArea(layout.grid, SPAWN_CELL, config.spawnCorridorLength);
  [[maybe_unused]] const int entered = carvePassages(layout.grid, rng, config, SPAWN_CELL);
  clearSpawnArea(layout.grid, SPAWN_CELL, config.spawnHallwayLength);
  layout.exitCell = carveExit(layout.grid);

  MAZE_DEBUG(std::format("Seed {} carved {} cells, {} path cells, exit {}", config.seed, entered,
                         layout.grid.countCells(CellType::Path),
                         layout.exitCell ? std::format("({}, {})", layout.exitCell->x, layout.exitCell->y)
                                         : std::string("none")));
  return layout;
}

int MazeGenerator::carvePassages(MazeGrid& grid, MazeRandom& rng,
                                 const MazeGenerationConfig& config, const GridPoint& start) {
  std::vector<uint8_t> visited(static_cast<size_t>(grid.getWidth()) *
                               static_cast<size_t>(grid.getHeight()), 0);
  std::vector<CarveFrame> stack;
  stack.reserve(static_cast<size_t>(config.maxCarveDepth) + 2);
  int entered = 0;

  auto enterCell = [&](const GridPoint& cell, int depth) {
    grid.setCell(cell.x, cell.y, CellType::Path);
    visited[grid.index(cell.x, cell.y)] = 1;
    ++entered;

    std::array<GridPoint, 4> steps = CARVE_STEPS;
    rng.shuffle(steps);
    if (depth > config.maxCarveDepth) {
      return;
    }

    CarveFrame frame;
    frame.cell = cell;
    frame.depth = depth;
    for (const GridPoint& step : steps) {
      const GridPoint next{cell.x + step.x, cell.y + step.y};
      if (grid.isInterior(next.x, next.y) && !visited[grid.index(next.x, next.y)]) {
        frame.options.push_back({GridPoint{cell.x + step.x / 2, cell.y + step.y / 2}, next});
      }
    }
    stack.push_back(std::move(frame));
  };

  if (!grid.isInterior(start.x, start.y)) {
    MAZE_ERROR(std::format("Carve start ({}, {}) is not an interior cell", start.x, start.y));
    return 0;
  }
  enterCell(start, 0);

  while (!stack.empty()) {
    CarveFrame& frame = stack.back();

    if (frame.pending == Continuation::AfterCorridor) {
      stack.pop_back();
      continue;
    }
    if (frame.pending == Continuation::AfterJunction) {
      frame.pending = Continuation::None;
      if (frame.carved >= 2 && rng.next() < config.junctionStopProbability) {
        stack.pop_back();
        continue;
      }
    }
    if (frame.next >= frame.options.size()) {
      stack.pop_back();
      continue;
    }

    const CarveOption option = frame.options[frame.next++];
    const bool forks = frame.options.size() > 1;
    grid.setCell(option.wall.x, option.wall.y, CellType::Path);

    Continuation continuation = Continuation::None;
    if (forks && rng.next() < config.junctionProbability) {
      continuation = Continuation::AfterJunction;
    } else if (!forks || rng.next() < config.corridorProbability) {
      continuation = Continuation::AfterCorridor;
    }
    if (continuation == Continuation::None) {
      continue;
    }

    frame.carved++;
    frame.pending = continuation;
    const int childDepth = frame.depth + 1;
    // A sibling branch may have reached this cell already; the opened wall
    // stays as a loop but the cell is not carved twice
    if (!visited[grid.index(option.cell.x, option.cell.y)]) {
      enterCell(option.cell, childDepth); // may reallocate: frame is dead past here
    }
  }

  return entered;
}

void MazeGenerator::clearSpawnArea(MazeGrid& grid, const GridPoint& spawn, int corridorLength) {
  if (grid.isInterior(spawn.x, spawn.y)) {
    grid.setCell(spawn.x, spawn.y, CellType::Path);
  }

  for (const GridPoint& dir : CARDINALS) {
    for (int i = 1; i <= corridorLength; ++i) {
      const int x = spawn.x + dir.x * i;
      const int y = spawn.y + dir.y * i;
      if (!grid.isInterior(x, y)) {
        break;
      }
      grid.setCell(x, y, CellType::Path);
    }
  }
}

std::optional<GridPoint> MazeGenerator::carveExit(MazeGrid& grid) {
  const int w = grid.getWidth();
  const int h = grid.getHeight();

  struct ExitCandidate {
    GridPoint inner;
    GridPoint outward;
  };
  const std::array<ExitCandidate, 4> candidates{{
      {{w - 2, h / 2}, {1, 0}},
      {{w / 2, h - 2}, {0, 1}},
      {{1, h / 2}, {-1, 0}},
      {{w / 2, 1}, {0, -1}},
  }};

  for (const auto& candidate : candidates) {
    if (!grid.isPathCell(candidate.inner.x, candidate.inner.y)) {
      continue;
    }
    const GridPoint exit{candidate.inner.x + candidate.outward.x,
                         candidate.inner.y + candidate.outward.y};
    if (grid.inBounds(exit.x, exit.y)) {
      grid.setCell(exit.x, exit.y, CellType::Path);
      return exit;
    }
  }
  return std::nullopt;
}

GridPoint MazeGenerator::forceExit(MazeGrid& grid, const GridPoint& spawn, int hallwayLength) {
  const int x = std::clamp(spawn.x + hallwayLength, 1, grid.getWidth() - 2);
  // The hallway row must be open all the way to x for the exit to be reachable
  for (int cx = spawn.x; cx <= x; ++cx) {
    grid.setCell(cx, spawn.y, CellType::Path);
  }
  const GridPoint exit{x, spawn.y - 1};
  grid.setCell(exit.x, exit.y, CellType::Path);
  return exit;
}

} // namespace NightCage
