/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SPRITE_HPP
#define SPRITE_HPP

#include "rendering/FrameBuffer.hpp"
#include "utils/Vector2D.hpp"
#include <optional>
#include <string_view>

namespace NightCage {

enum class SpriteType : uint8_t {
  Key,
  Artifact,
  Note,
  LightSource,
  Hazard,
  Door
};

inline constexpr Color defaultSpriteColor(SpriteType type) {
  switch (type) {
  case SpriteType::Key:
    return Color::fromHex(0xffaa00);
  case SpriteType::Artifact:
    return Color::fromHex(0xff00ff);
  case SpriteType::Note:
    return Color::fromHex(0xffffff);
  case SpriteType::LightSource:
    return Color::fromHex(0xff6600);
  case SpriteType::Hazard:
    return Color::fromHex(0x2a0a3a);
  case SpriteType::Door:
    return Color::fromHex(0x6b4a2b);
  }
  return Color::fromHex(0xff6600);
}

inline constexpr std::string_view spriteTypeName(SpriteType type) {
  switch (type) {
  case SpriteType::Key:
    return "key";
  case SpriteType::Artifact:
    return "artifact";
  case SpriteType::Note:
    return "note";
  case SpriteType::LightSource:
    return "light_source";
  case SpriteType::Hazard:
    return "hazard";
  case SpriteType::Door:
    return "door";
  }
  return "unknown";
}

// Billboard drawn by RaycastRenderer. Items, hazards and doors each expose
// their world objects as a list of these.
struct Sprite {
  Vector2D position;
  SpriteType type{SpriteType::Key};
  bool visible{true};
  // Collected for items, unlocked for doors
  bool collected{false};
  std::optional<Color> colorOverride;

  Color color() const { return colorOverride.value_or(defaultSpriteColor(type)); }
};

} // namespace NightCage

#endif // SPRITE_HPP
