/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef HUD_TEXT_HPP
#define HUD_TEXT_HPP

#include "rendering/FrameBuffer.hpp"
#include <string_view>

struct SDL_Renderer;

namespace NightCage {

// SDL's built-in debug font: fixed 8x8 pixel glyphs
constexpr float HUD_GLYPH_SIZE = 8.0f;

float hudTextWidth(std::string_view text, float scale = 1.0f);

// Draws text with its top-left at (x, y) in logical coordinates
void drawHudText(SDL_Renderer* renderer, float x, float y, std::string_view text,
                 const Color& color, float scale = 1.0f);

void drawHudTextCentered(SDL_Renderer* renderer, float centerX, float y, std::string_view text,
                         const Color& color, float scale = 1.0f);

// Translucent full-screen dimming used behind overlay menus
void drawHudOverlay(SDL_Renderer* renderer, int width, int height, uint8_t alpha);

} // namespace NightCage

#endif // HUD_TEXT_HPP
