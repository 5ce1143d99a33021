/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "rendering/HudText.hpp"
#include <SDL3/SDL.h>
#include <string>

namespace NightCage {

float hudTextWidth(std::string_view text, float scale) {
  return static_cast<float>(text.size()) * HUD_GLYPH_SIZE * scale;
}

void drawHudText(SDL_Renderer* renderer, float x, float y, std::string_view text,
                 const Color& color, float scale) {
  if (!renderer || text.empty() || scale <= 0.0f) {
    return;
  }

  float oldScaleX = 1.0f;
  float oldScaleY = 1.0f;
  SDL_GetRenderScale(renderer, &oldScaleX, &oldScaleY);
  SDL_SetRenderScale(renderer, scale, scale);
  SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);

  // The debug font needs a terminated string
  const std::string buffer(text);
  SDL_RenderDebugText(renderer, x / scale, y / scale, buffer.c_str());

  SDL_SetRenderScale(renderer, oldScaleX, oldScaleY);
}

void drawHudTextCentered(SDL_Renderer* renderer, float centerX, float y, std::string_view text,
                         const Color& color, float scale) {
  drawHudText(renderer, centerX - hudTextWidth(text, scale) * 0.5f, y, text, color, scale);
}

void drawHudOverlay(SDL_Renderer* renderer, int width, int height, uint8_t alpha) {
  if (!renderer) {
    return;
  }
  SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
  SDL_SetRenderDrawColor(renderer, 0, 0, 0, alpha);
  const SDL_FRect rect{0.0f, 0.0f, static_cast<float>(width), static_cast<float>(height)};
  SDL_RenderFillRect(renderer, &rect);
}

} // namespace NightCage
