/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/ItemManager.hpp"
#include "core/Logger.hpp"
#include "world/MazeGrid.hpp"
#include "world/SpawnSampler.hpp"
#include <algorithm>
#include <array>
#include <format>

namespace NightCage {

namespace {
constexpr std::array<std::string_view, 8> NOTE_TEXTS = {
    "The walls shift when I'm not looking...",
    "I've been here before. I'm sure of it.",
    "The shadows move. They're watching me.",
    "Time doesn't work here. Or maybe I don't.",
    "The key mocks me from the darkness.",
    "I can hear them laughing. Or is it me?",
    "Reality bends. The maze breathes.",
    "Each step takes me further from myself."};
} // namespace

ItemManager::ItemManager(uint32_t seed) : m_rng(seed) {
  m_items.reserve(64);
}

std::span<const std::string_view> ItemManager::getNoteTexts() {
  return NOTE_TEXTS;
}

SpriteType ItemManager::spriteTypeFor(ItemType type) {
  switch (type) {
  case ItemType::Key:
    return SpriteType::Key;
  case ItemType::Artifact:
    return SpriteType::Artifact;
  case ItemType::Note:
    return SpriteType::Note;
  case ItemType::LightSource:
    return SpriteType::LightSource;
  }
  return SpriteType::Key;
}

Item& ItemManager::createItem(ItemType type, const Vector2D& position) {
  Item item;
  item.id = static_cast<int>(m_items.size());
  item.type = type;
  item.position = position;
  m_items.push_back(std::move(item));
  return m_items.back();
}

std::optional<Vector2D> ItemManager::findSpawnPosition(const MazeGrid& grid,
                                                       const Vector2D& spawnPosition,
                                                       const ItemSpawnConfig& config) {
  return sampleInteriorPathCell(grid, m_rng, config.positionAttempts, [&](const Vector2D& candidate) {
    if (Vector2D::distance(candidate, spawnPosition) < config.minSpawnDistance) {
      return false;
    }
    return std::none_of(m_items.begin(), m_items.end(), [&](const Item& other) {
      return Vector2D::distance(candidate, other.position) < config.minItemSpacing;
    });
  });
}

void ItemManager::spawnItems(const MazeGrid& grid, const Vector2D& spawnPosition,
                             const ItemSpawnConfig& config) {
  m_items.clear();

  int keysPlaced = 0;
  const int keyAttempts = config.keys * std::max(1, config.keyAttemptMultiplier);
  for (int i = 0; i < keyAttempts && keysPlaced < config.keys; ++i) {
    if (auto pos = findSpawnPosition(grid, spawnPosition, config)) {
      createItem(ItemType::Key, *pos);
      ++keysPlaced;
    }
  }
  if (keysPlaced < config.keys) {
    ITEM_WARN(std::format("Placed {} of {} keys", keysPlaced, config.keys));
  }

  for (int i = 0; i < config.artifacts; ++i) {
    if (auto pos = findSpawnPosition(grid, spawnPosition, config)) {
      Item& artifact = createItem(ItemType::Artifact, *pos);
      artifact.name = std::format("Artifact {}", i + 1);
      artifact.text = "A mysterious object pulsating with dark energy.";
    }
  }

  std::uniform_int_distribution<size_t> noteDist(0, NOTE_TEXTS.size() - 1);
  for (int i = 0; i < config.notes; ++i) {
    if (auto pos = findSpawnPosition(grid, spawnPosition, config)) {
      Item& note = createItem(ItemType::Note, *pos);
      note.text = std::string(NOTE_TEXTS[noteDist(m_rng)]);
    }
  }

  for (int i = 0; i < config.lightSources; ++i) {
    if (auto pos = findSpawnPosition(grid, spawnPosition, config)) {
      createItem(ItemType::LightSource, *pos);
    }
  }

  ITEM_INFO(std::format("Spawned {} items ({} keys, {} artifacts, {} notes, {} candles)",
                        m_items.size(), countItems(ItemType::Key), countItems(ItemType::Artifact),
                        countItems(ItemType::Note), countItems(ItemType::LightSource)));
}

std::optional<Item> ItemManager::checkCollection(const Vector2D& position, float radius) {
  for (Item& item : m_items) {
    if (item.collected || !item.visible) {
      continue;
    }
    if (Vector2D::distance(position, item.position) < radius) {
      collectItem(item.id);
      return item;
    }
  }
  return std::nullopt;
}

bool ItemManager::collectItem(int id) {
  if (id < 0 || id >= static_cast<int>(m_items.size())) {
    ITEM_ERROR(std::format("No item with id {}", id));
    return false;
  }
  Item& item = m_items[static_cast<size_t>(id)];
  if (item.collected) {
    return false;
  }

  item.collected = true;
  item.visible = false;

  switch (item.type) {
  case ItemType::Key:
    ++m_inventory.keys;
    break;
  case ItemType::Artifact:
    m_inventory.artifacts.push_back(item.id);
    break;
  case ItemType::Note:
    m_inventory.notes.push_back(item.id);
    break;
  case ItemType::LightSource:
    ++m_inventory.lightSources;
    break;
  }

  ITEM_DEBUG(std::format("Collected {} #{}", spriteTypeName(spriteTypeFor(item.type)), item.id));
  return true;
}

size_t ItemManager::countItems(ItemType type, bool visibleOnly) const {
  return static_cast<size_t>(std::count_if(m_items.begin(), m_items.end(), [&](const Item& item) {
    return item.type == type && (!visibleOnly || (item.visible && !item.collected));
  }));
}

void ItemManager::appendSprites(std::vector<Sprite>& sprites) const {
  for (const Item& item : m_items) {
    if (item.collected || !item.visible) {
      continue;
    }
    Sprite sprite;
    sprite.position = item.position;
    sprite.type = spriteTypeFor(item.type);
    sprites.push_back(sprite);
  }
}

void ItemManager::reset() {
  m_items.clear();
  m_inventory.clear();
}

} // namespace NightCage
