/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RAYCAST_RENDERER_HPP
#define RAYCAST_RENDERER_HPP

#include "rendering/FrameBuffer.hpp"
#include "rendering/RayCaster.hpp"
#include "rendering/Sprite.hpp"
#include "utils/MathUtils.hpp"
#include "utils/Vector2D.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace NightCage {

class MazeGrid;

struct RenderConfig {
  int width{640};
  int height{360};
  int rayCount{0};  // 0 casts one ray per pixel column
  float fov{PI / 3.0f};
  float maxDepth{RayCaster::DEFAULT_MAX_DEPTH};
  float wallScale{0.5f};
  float spriteScale{0.3f};
  float spriteAspect{0.6f};
  float spriteNearClip{0.3f};
  float occlusionBias{0.1f};
  int starCount{150};
  uint32_t starSeed{12345};
};

// Eye position and camera angle (facing plus jitter)
struct ViewState {
  Vector2D position;
  float angle{0.0f};
};

struct LightState {
  float radius{2.5f};
  float intensity{1.0f};
  float flicker{0.0f};
};

// Inputs for the display-only wall distortions in MazeEffects
struct DisplayEffects {
  float elapsedTime{0.0f};
  float warpPhase{0.0f};
  bool enabled{true};
};

struct ColumnHit {
  RayHit ray;
  float rayAngle{0.0f};
  float rawDistance{0.0f};        // Euclidean, used for occlusion and lighting
  float correctedDistance{0.0f};  // Perpendicular, used for projection and fog
  int screenX0{0};
  int screenX1{0};                // exclusive
};

struct VisibleSprite {
  size_t index{0};  // into the sprite span passed to projectSprites
  float distance{0.0f};
  float relativeAngle{0.0f};
  int column{0};
  float screenX{0.0f};
};

/**
 * Software first-person renderer. Casts one ray per column against the
 * maze grid, projects and shades wall strips with candle falloff and fog,
 * then draws billboard sprites far to near with per-column clipping.
 *
 * The renderer is stateless between frames apart from its column buffer
 * and the star field. Flicker comes in through LightState so the candle
 * owns its own randomness.
 */
class RaycastRenderer {
public:
  static constexpr float MIN_BRIGHTNESS = 0.1f;
  static constexpr float FLICKER_DIMMING = 0.3f;
  // Field of view limits, 10 and 170 degrees
  static constexpr float MIN_FOV = PI * 10.0f / 180.0f;
  static constexpr float MAX_FOV = PI * 170.0f / 180.0f;

  explicit RaycastRenderer(const RenderConfig& config = RenderConfig{});

  void setConfig(const RenderConfig& config);
  const RenderConfig& getConfig() const { return m_config; }

  // Resolved ray count (rayCount, or width when rayCount is 0)
  int getRayCount() const;
  float getRayAngle(int column, float viewAngle) const;
  // Ray column a relative angle falls in, may be outside [0, rayCount)
  int columnForAngle(float relativeAngle) const;

  // Fills the column buffer; must run before projectSprites for a frame
  const std::vector<ColumnHit>& castColumns(const MazeGrid& grid, const ViewState& view);
  const std::vector<ColumnHit>& getColumns() const { return m_columns; }

  // Sprites that survive the visibility, near-clip, FOV and occlusion
  // tests, sorted far to near
  std::vector<VisibleSprite> projectSprites(const MazeGrid& grid, const ViewState& view,
                                            std::span<const Sprite> sprites) const;

  void render(FrameBuffer& target, const MazeGrid& grid, const ViewState& view,
              const LightState& light, std::span<const Sprite> sprites,
              const DisplayEffects& effects);

  static float computeLighting(float distance, const LightState& light);
  static Color shadeWall(float distance, WallSide side, float lightFactor, float maxDepth);

private:
  struct Star {
    float x{0.0f};
    float y{0.0f};
    float brightness{1.0f};
    int size{1};
  };

  void generateStars();
  void drawBackground(FrameBuffer& target, float elapsedTime) const;
  void drawWalls(FrameBuffer& target, const ViewState& view, const LightState& light,
                 const DisplayEffects& effects) const;
  void drawSprite(FrameBuffer& target, const VisibleSprite& visible, const Sprite& sprite) const;

  RenderConfig m_config;
  std::vector<ColumnHit> m_columns;
  std::vector<Star> m_stars;
};

} // namespace NightCage

#endif // RAYCAST_RENDERER_HPP
