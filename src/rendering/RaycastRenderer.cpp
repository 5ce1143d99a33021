/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "rendering/RaycastRenderer.hpp"
#include "core/Logger.hpp"
#include "world/MazeEffects.hpp"
#include "world/MazeGrid.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <optional>
#include <random>

namespace NightCage {

namespace {

// Wall hues per face orientation
constexpr Color VERTICAL_FACE_HUE{110, 95, 85, 255};
constexpr Color HORIZONTAL_FACE_HUE{85, 85, 95, 255};

constexpr Color SKY_TOP = Color::fromHex(0x0a0a1a);
constexpr Color SKY_MID = Color::fromHex(0x050510);
constexpr Color SKY_HORIZON = Color::fromHex(0x000005);
constexpr Color FLOOR_HORIZON = Color::fromHex(0x0d0d0d);
constexpr Color FLOOR_NEAR = Color::fromHex(0x1a1a1a);
constexpr Color MOON_GLOW = Color::fromHex(0x1c1c16);
constexpr Color MOON_BODY = Color::fromHex(0xe8e8d8);
constexpr Color MOON_CRATER = Color::fromHex(0xc8c8b8);
constexpr Color WHITE = Color::fromHex(0xffffff);

// Ellipse test in sprite-local coordinates
bool inEllipse(float u, float v, float cu, float cv, float ru, float rv) {
  const float du = (u - cu) / ru;
  const float dv = (v - cv) / rv;
  return du * du + dv * dv <= 1.0f;
}

// Billboard silhouettes. u runs left to right and v top to bottom, both
// in [-0.5, 0.5] across the sprite rectangle.
std::optional<Color> spritePixel(const Sprite& sprite, float u, float v) {
  const Color body = sprite.color();

  switch (sprite.type) {
  case SpriteType::Key: {
    if (inEllipse(u, v, 0.0f, -0.18f, 0.12f, 0.12f)) {
      return inEllipse(u, v, 0.0f, -0.18f, 0.05f, 0.05f) ? std::nullopt
                                                         : std::optional<Color>(body);
    }
    if (std::abs(u) < 0.05f && v >= -0.18f && v <= 0.22f) {
      return body;
    }
    if (v >= 0.08f && v <= 0.2f && u >= 0.05f && u <= 0.15f && std::fmod(v + 1.0f, 0.08f) < 0.05f) {
      return body;
    }
    return std::nullopt;
  }
  case SpriteType::Artifact: {
    const float diamond = std::abs(u) / 0.25f + std::abs(v) / 0.3f;
    if (diamond > 1.0f) {
      return std::nullopt;
    }
    return diamond < 0.5f ? body.blended(WHITE, 0.4f) : body;
  }
  case SpriteType::Note: {
    if (std::abs(u) > 0.3f || std::abs(v) > 0.35f) {
      return std::nullopt;
    }
    const int line = static_cast<int>((v + 0.35f) * 20.0f);
    if (line > 1 && line < 13 && line % 3 == 0 && std::abs(u) < 0.22f) {
      return Color::fromHex(0x555555);
    }
    return body;
  }
  case SpriteType::LightSource: {
    if (inEllipse(u, v, 0.0f, -0.2f, 0.08f, 0.15f)) {
      return inEllipse(u, v, 0.0f, -0.17f, 0.035f, 0.08f) ? Color::fromHex(0xffee88) : body;
    }
    if (std::abs(u) < 0.1f && v >= -0.05f && v <= 0.4f) {
      return Color::fromHex(0xf0e0c0);
    }
    return std::nullopt;
  }
  case SpriteType::Hazard: {
    if (inEllipse(u, v, -0.12f, -0.15f, 0.05f, 0.05f) || inEllipse(u, v, 0.12f, -0.15f, 0.05f, 0.05f)) {
      return Color::fromHex(0xff2020);
    }
    if (inEllipse(u, v, 0.0f, 0.0f, 0.4f, 0.5f)) {
      return body;
    }
    return std::nullopt;
  }
  case SpriteType::Door: {
    if (std::abs(u) > 0.45f || std::abs(v) > 0.5f) {
      return std::nullopt;
    }
    if (inEllipse(u, v, 0.3f, 0.0f, 0.05f, 0.04f)) {
      return Color::fromHex(0xd4af37);
    }
    // Plank seams
    if (std::abs(std::fmod(u + 0.45f, 0.3f)) < 0.02f) {
      return body.scaled(0.7f);
    }
    return body;
  }
  }
  return std::nullopt;
}

} // namespace

RaycastRenderer::RaycastRenderer(const RenderConfig& config) : m_config(config) {
  setConfig(config);
}

void RaycastRenderer::setConfig(const RenderConfig& config) {
  m_config = config;
  m_config.width = std::max(1, m_config.width);
  m_config.height = std::max(1, m_config.height);
  m_config.rayCount = std::max(0, m_config.rayCount);
  if (!std::isfinite(m_config.fov)) {
    RENDER_WARN("Non-finite field of view, using the default");
    m_config.fov = RenderConfig{}.fov;
  }
  m_config.fov = std::clamp(m_config.fov, MIN_FOV, MAX_FOV);
  generateStars();
  m_columns.clear();
  RENDER_DEBUG(std::format("Renderer configured {}x{}, {} rays, fov {:.3f}", m_config.width,
                           m_config.height, getRayCount(), m_config.fov));
}

int RaycastRenderer::getRayCount() const {
  return m_config.rayCount > 0 ? m_config.rayCount : m_config.width;
}

float RaycastRenderer::getRayAngle(int column, float viewAngle) const {
  return viewAngle - m_config.fov * 0.5f +
         static_cast<float>(column) * m_config.fov / static_cast<float>(getRayCount());
}

int RaycastRenderer::columnForAngle(float relativeAngle) const {
  return static_cast<int>(std::floor((relativeAngle + m_config.fov * 0.5f) / m_config.fov *
                                     static_cast<float>(getRayCount())));
}

const std::vector<ColumnHit>& RaycastRenderer::castColumns(const MazeGrid& grid,
                                                           const ViewState& view) {
  const int rayCount = getRayCount();
  const int64_t width = m_config.width;
  m_columns.resize(static_cast<size_t>(rayCount));

  for (int i = 0; i < rayCount; ++i) {
    ColumnHit& column = m_columns[static_cast<size_t>(i)];
    column.rayAngle = getRayAngle(i, view.angle);
    column.ray = RayCaster::castRay(grid, view.position, column.rayAngle, m_config.maxDepth);
    column.rawDistance = column.ray.distance;
    column.correctedDistance =
        RayCaster::correctFisheye(column.rawDistance, column.rayAngle, view.angle);
    column.screenX0 = static_cast<int>(i * width / rayCount);
    column.screenX1 = static_cast<int>((i + 1) * width / rayCount);
  }
  return m_columns;
}

std::vector<VisibleSprite> RaycastRenderer::projectSprites(const MazeGrid& grid,
                                                           const ViewState& view,
                                                           std::span<const Sprite> sprites) const {
  std::vector<VisibleSprite> visible;
  visible.reserve(sprites.size());

  const float halfFov = m_config.fov * 0.5f;
  for (size_t i = 0; i < sprites.size(); ++i) {
    const Sprite& sprite = sprites[i];
    if (!sprite.visible) {
      continue;
    }

    const Vector2D delta = sprite.position - view.position;
    const float distance = delta.length();
    if (distance <= m_config.spriteNearClip) {
      continue;
    }

    const float worldAngle = delta.angle();
    const float relativeAngle = normalizeAngle(worldAngle - view.angle);
    if (std::abs(relativeAngle) >= halfFov) {
      continue;
    }

    // Cheap test against this frame's column buffer first
    const int column = columnForAngle(relativeAngle);
    if (column >= 0 && column < static_cast<int>(m_columns.size()) &&
        m_columns[static_cast<size_t>(column)].rawDistance < distance - m_config.occlusionBias) {
      continue;
    }

    // Exact ray straight at the sprite
    const RayHit direct = RayCaster::castRay(grid, view.position, worldAngle, m_config.maxDepth);
    if (direct.distance < distance - m_config.occlusionBias) {
      continue;
    }

    VisibleSprite entry;
    entry.index = i;
    entry.distance = distance;
    entry.relativeAngle = relativeAngle;
    entry.column = column;
    entry.screenX = relativeAngle / m_config.fov * static_cast<float>(m_config.width) +
                    static_cast<float>(m_config.width) * 0.5f;
    visible.push_back(entry);
  }

  std::stable_sort(visible.begin(), visible.end(),
                   [](const VisibleSprite& a, const VisibleSprite& b) {
                     return a.distance > b.distance;
                   });
  return visible;
}

void RaycastRenderer::render(FrameBuffer& target, const MazeGrid& grid, const ViewState& view,
                             const LightState& light, std::span<const Sprite> sprites,
                             const DisplayEffects& effects) {
  if (target.getWidth() != m_config.width || target.getHeight() != m_config.height) {
    target.resize(m_config.width, m_config.height);
  }

  drawBackground(target, effects.elapsedTime);
  castColumns(grid, view);
  drawWalls(target, view, light, effects);

  for (const VisibleSprite& entry : projectSprites(grid, view, sprites)) {
    drawSprite(target, entry, sprites[entry.index]);
  }
}

float RaycastRenderer::computeLighting(float distance, const LightState& light) {
  if (light.radius <= 0.0f) {
    return MIN_BRIGHTNESS;
  }
  const float lightDist = std::min(distance, light.radius);
  const float falloff = 1.0f - lightDist / light.radius;
  const float flickerMod = 1.0f - light.flicker * FLICKER_DIMMING;
  return std::max(MIN_BRIGHTNESS, std::min(1.0f, falloff * flickerMod * light.intensity));
}

Color RaycastRenderer::shadeWall(float distance, WallSide side, float lightFactor,
                                 float maxDepth) {
  const float fog = maxDepth > 0.0f ? std::min(1.0f, distance / maxDepth) : 1.0f;
  const float base = side == WallSide::Vertical ? 0.3f : 0.2f;
  const float brightness = base + (1.0f - base) * (1.0f - fog) * lightFactor;
  const Color& hue = side == WallSide::Vertical ? VERTICAL_FACE_HUE : HORIZONTAL_FACE_HUE;

  return Color{static_cast<uint8_t>(std::floor(brightness * hue.r)),
               static_cast<uint8_t>(std::floor(brightness * hue.g)),
               static_cast<uint8_t>(std::floor(brightness * hue.b)), 255};
}

void RaycastRenderer::generateStars() {
  std::mt19937 rng(m_config.starSeed);
  std::uniform_real_distribution<float> unit(0.0f, 1.0f);

  m_stars.clear();
  m_stars.reserve(static_cast<size_t>(std::max(0, m_config.starCount)));
  for (int i = 0; i < m_config.starCount; ++i) {
    Star star;
    star.x = unit(rng);
    star.y = unit(rng) * 0.5f;
    star.brightness = unit(rng) * 0.8f + 0.2f;
    star.size = unit(rng) < 0.3f ? 2 : 1;
    m_stars.push_back(star);
  }
}

void RaycastRenderer::drawBackground(FrameBuffer& target, float elapsedTime) const {
  const int width = target.getWidth();
  const int height = target.getHeight();
  const int horizon = height / 2;

  for (int y = 0; y < horizon; ++y) {
    const float t = static_cast<float>(y) / static_cast<float>(std::max(1, horizon));
    const Color row = t < 0.5f ? SKY_TOP.blended(SKY_MID, t * 2.0f)
                               : SKY_MID.blended(SKY_HORIZON, (t - 0.5f) * 2.0f);
    target.fillRect(0, y, width, 1, row);
  }
  for (int y = horizon; y < height; ++y) {
    const float t = static_cast<float>(y - horizon) / static_cast<float>(std::max(1, height - horizon));
    target.fillRect(0, y, width, 1, FLOOR_HORIZON.blended(FLOOR_NEAR, t));
  }

  for (size_t i = 0; i < m_stars.size(); ++i) {
    const Star& star = m_stars[i];
    const float twinkle = 0.85f + 0.15f * std::sin(elapsedTime * 2.0f + static_cast<float>(i));
    const int sx = static_cast<int>(star.x * static_cast<float>(width));
    const int sy = static_cast<int>(star.y * static_cast<float>(horizon));
    target.fillCircle(sx, sy, star.size - 1, WHITE.scaled(star.brightness * twinkle));
  }

  const int moonX = static_cast<int>(0.7f * static_cast<float>(width));
  const int moonY = static_cast<int>(0.3f * static_cast<float>(horizon));
  const int moonRadius = static_cast<int>(0.15f * static_cast<float>(std::min(width, horizon)));
  if (moonRadius > 0) {
    target.fillCircle(moonX, moonY, moonRadius * 7 / 5, MOON_GLOW);
    target.fillCircle(moonX, moonY, moonRadius, MOON_BODY);
    target.fillCircle(moonX - moonRadius / 3, moonY - moonRadius / 4, moonRadius / 5, MOON_CRATER);
    target.fillCircle(moonX + moonRadius / 4, moonY + moonRadius / 3, moonRadius / 6, MOON_CRATER);
  }
}

void RaycastRenderer::drawWalls(FrameBuffer& target, const ViewState& view, const LightState& light,
                                const DisplayEffects& effects) const {
  const float screenHeight = static_cast<float>(target.getHeight());

  for (const ColumnHit& column : m_columns) {
    if (!column.ray.hit) {
      continue;
    }

    const float corrected = std::max(column.correctedDistance, 1e-4f);
    float stripHeight = screenHeight / corrected * m_config.wallScale;
    float centreY = screenHeight * 0.5f;
    if (effects.enabled) {
      stripHeight *= 1.0f + MazeEffects::breathingAmount(column.rawDistance, effects.elapsedTime,
                                                         light.radius);
      const Vector2D warp = MazeEffects::warpOffset(column.ray.hitPoint, effects.warpPhase,
                                                    view.position, light.radius);
      centreY += warp.getY() * screenHeight / corrected;
    }

    const float lightFactor = computeLighting(column.rawDistance, light);
    const Color base = shadeWall(corrected, column.ray.side, lightFactor, m_config.maxDepth);

    const float top = centreY - stripHeight * 0.5f;
    const float bottom = top + stripHeight;

    // Static per-column grain keyed on screen position
    const int grainKey = (column.screenX0 * 73 + static_cast<int>(std::floor(top / 8.0f)) * 137) % 1000;
    const float grain = static_cast<float>((grainKey + 1000) % 1000) / 1000.0f * 0.12f;
    const Color textured{
        static_cast<uint8_t>(std::min(255.0f, base.r * (1.0f + grain))),
        static_cast<uint8_t>(std::min(255.0f, base.g * (1.0f + grain * 0.8f))),
        static_cast<uint8_t>(std::min(255.0f, base.b * (1.0f + grain * 0.6f))), 255};

    const int y0 = std::max(0, static_cast<int>(std::floor(top)));
    const int y1 = std::min(target.getHeight(), static_cast<int>(std::ceil(bottom)));
    for (int y = y0; y < y1; ++y) {
      // Slightly lighter at the top of the strip than at the bottom
      const float t = (static_cast<float>(y) - top) / stripHeight;
      const Color shaded = textured.scaled(1.08f - 0.16f * t);
      for (int x = column.screenX0; x < column.screenX1; ++x) {
        target.setPixel(x, y, shaded);
      }
    }
  }
}

void RaycastRenderer::drawSprite(FrameBuffer& target, const VisibleSprite& visible,
                                 const Sprite& sprite) const {
  const float screenHeight = static_cast<float>(target.getHeight());
  const float spriteHeight = screenHeight / visible.distance * m_config.spriteScale;
  const float spriteWidth = spriteHeight * m_config.spriteAspect;
  if (spriteHeight < 1.0f || spriteWidth < 1.0f) {
    return;
  }

  const float left = visible.screenX - spriteWidth * 0.5f;
  const float top = (screenHeight - spriteHeight) * 0.5f;
  const int x0 = std::max(0, static_cast<int>(std::floor(left)));
  const int x1 = std::min(target.getWidth(), static_cast<int>(std::ceil(left + spriteWidth)));
  const int y0 = std::max(0, static_cast<int>(std::floor(top)));
  const int y1 = std::min(target.getHeight(), static_cast<int>(std::ceil(top + spriteHeight)));

  const int rayCount = static_cast<int>(m_columns.size());
  const int64_t width = target.getWidth();

  for (int x = x0; x < x1; ++x) {
    const int columnIndex = static_cast<int>(x * static_cast<int64_t>(rayCount) / width);
    if (columnIndex >= 0 && columnIndex < rayCount &&
        m_columns[static_cast<size_t>(columnIndex)].rawDistance <
            visible.distance - m_config.occlusionBias) {
      continue;
    }

    const float u = (static_cast<float>(x) + 0.5f - left) / spriteWidth - 0.5f;
    for (int y = y0; y < y1; ++y) {
      const float v = (static_cast<float>(y) + 0.5f - top) / spriteHeight - 0.5f;
      if (auto color = spritePixel(sprite, u, v)) {
        target.setPixel(x, y, *color);
      }
    }
  }
}

} // namespace NightCage
