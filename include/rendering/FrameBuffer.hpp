/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef FRAME_BUFFER_HPP
#define FRAME_BUFFER_HPP

#include <cstdint>
#include <vector>

namespace NightCage {

struct Color {
  uint8_t r{0};
  uint8_t g{0};
  uint8_t b{0};
  uint8_t a{255};

  static constexpr Color fromHex(uint32_t rgb) {
    return Color{static_cast<uint8_t>((rgb >> 16) & 0xFF), static_cast<uint8_t>((rgb >> 8) & 0xFF),
                 static_cast<uint8_t>(rgb & 0xFF), 255};
  }

  // Channels scaled by factor and clamped to [0, 255]
  Color scaled(float factor) const;
  // Linear blend toward other by t in [0, 1]
  Color blended(const Color& other, float t) const;

  // Packed for SDL_PIXELFORMAT_ARGB8888
  constexpr uint32_t toARGB() const {
    return (static_cast<uint32_t>(a) << 24) | (static_cast<uint32_t>(r) << 16) |
           (static_cast<uint32_t>(g) << 8) | static_cast<uint32_t>(b);
  }

  bool operator==(const Color& other) const = default;
};

/**
 * CPU-side ARGB8888 pixel buffer the raycaster draws into. GamePlayState
 * uploads it to a streaming SDL texture once per frame.
 *
 * All drawing calls clip to the buffer, so callers can pass spans that run
 * off screen.
 */
class FrameBuffer {
public:
  FrameBuffer() = default;
  FrameBuffer(int width, int height);

  void resize(int width, int height);
  void clear(const Color& color);

  void setPixel(int x, int y, const Color& color);
  uint32_t getPixel(int x, int y) const;

  void fillRect(int x, int y, int w, int h, const Color& color);
  // Inclusive y0, exclusive y1
  void fillColumn(int x, int y0, int y1, const Color& color);
  void fillCircle(int cx, int cy, int radius, const Color& color);

  int getWidth() const { return m_width; }
  int getHeight() const { return m_height; }
  // Bytes per row, as SDL_UpdateTexture expects
  int getPitch() const { return m_width * static_cast<int>(sizeof(uint32_t)); }
  const uint32_t* data() const { return m_pixels.data(); }

private:
  int m_width{0};
  int m_height{0};
  std::vector<uint32_t> m_pixels;
};

} // namespace NightCage

#endif // FRAME_BUFFER_HPP
