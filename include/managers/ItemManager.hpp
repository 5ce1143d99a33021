/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ITEM_MANAGER_HPP
#define ITEM_MANAGER_HPP

#include "entities/Inventory.hpp"
#include "rendering/Sprite.hpp"
#include "utils/Vector2D.hpp"
#include <cstdint>
#include <optional>
#include <random>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace NightCage {

class MazeGrid;

enum class ItemType : uint8_t {
  Key,
  Artifact,
  Note,
  LightSource
};

struct Item {
  int id{0};
  ItemType type{ItemType::Key};
  Vector2D position;
  bool collected{false};
  bool visible{true};
  std::string name;
  std::string text; // notes only
};

struct ItemSpawnConfig {
  int keys{15};
  int keyAttemptMultiplier{3}; // key placement gets keys * this many tries
  int artifacts{8};
  int notes{10};
  int lightSources{6};
  int positionAttempts{20};
  float minItemSpacing{2.0f};
  float minSpawnDistance{1.0f};
};

/**
 * @brief Collectibles of one maze and the run inventory they feed
 *
 * Owned by the Level. The inventory outlives individual mazes; the Level
 * carries it across with setInventory() when a new maze starts.
 */
class ItemManager {
public:
  static constexpr float COLLECTION_RADIUS = 0.5f;

  explicit ItemManager(uint32_t seed = 0);

  // Replaces all items with a fresh random placement
  void spawnItems(const MazeGrid& grid, const Vector2D& spawnPosition,
                  const ItemSpawnConfig& config = ItemSpawnConfig{});

  Item& createItem(ItemType type, const Vector2D& position);

  // Collects the first uncollected item within radius, if any
  std::optional<Item> checkCollection(const Vector2D& position, float radius = COLLECTION_RADIUS);
  bool collectItem(int id);

  const std::vector<Item>& getItems() const { return m_items; }
  size_t countItems(ItemType type, bool visibleOnly = true) const;
  void appendSprites(std::vector<Sprite>& sprites) const;

  Inventory& getInventory() { return m_inventory; }
  const Inventory& getInventory() const { return m_inventory; }
  void setInventory(const Inventory& inventory) { m_inventory = inventory; }

  void clearItems() { m_items.clear(); }
  // Clears items and resets the inventory to a fresh run
  void reset();

  static std::span<const std::string_view> getNoteTexts();
  static SpriteType spriteTypeFor(ItemType type);

private:
  std::optional<Vector2D> findSpawnPosition(const MazeGrid& grid, const Vector2D& spawnPosition,
                                            const ItemSpawnConfig& config);

  std::vector<Item> m_items;
  Inventory m_inventory;
  std::mt19937 m_rng;
};

} // namespace NightCage

#endif // ITEM_MANAGER_HPP
