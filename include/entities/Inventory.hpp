/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef INVENTORY_HPP
#define INVENTORY_HPP

#include <vector>

namespace NightCage {

/**
 * @brief What the player carries through a run
 *
 * Keys are never spent; doors only check the count. lightSources includes
 * the candle currently burning, so a fresh run starts with 1.
 */
struct Inventory {
  static constexpr int STARTING_LIGHT_SOURCES = 1;

  int keys{0};
  std::vector<int> artifacts; // item ids
  std::vector<int> notes;     // item ids
  int lightSources{STARTING_LIGHT_SOURCES};

  int totalCollected() const {
    return keys + static_cast<int>(artifacts.size()) + static_cast<int>(notes.size()) +
           (lightSources - STARTING_LIGHT_SOURCES);
  }

  void clear() {
    keys = 0;
    artifacts.clear();
    notes.clear();
    lightSources = STARTING_LIGHT_SOURCES;
  }
};

} // namespace NightCage

#endif // INVENTORY_HPP
