/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "rendering/FrameBuffer.hpp"
#include <algorithm>
#include <stdexcept>

namespace NightCage {

namespace {
uint8_t clampChannel(float value) {
  return static_cast<uint8_t>(std::clamp(value, 0.0f, 255.0f));
}
} // namespace

Color Color::scaled(float factor) const {
  return Color{clampChannel(r * factor), clampChannel(g * factor), clampChannel(b * factor), a};
}

Color Color::blended(const Color& other, float t) const {
  t = std::clamp(t, 0.0f, 1.0f);
  return Color{clampChannel(r + (other.r - r) * t), clampChannel(g + (other.g - g) * t),
               clampChannel(b + (other.b - b) * t), a};
}

FrameBuffer::FrameBuffer(int width, int height) {
  resize(width, height);
}

void FrameBuffer::resize(int width, int height) {
  if (width <= 0 || height <= 0) {
    throw std::invalid_argument("NightCage - FrameBuffer dimensions must be positive");
  }
  m_width = width;
  m_height = height;
  m_pixels.assign(static_cast<size_t>(width) * static_cast<size_t>(height), Color{}.toARGB());
}

void FrameBuffer::clear(const Color& color) {
  std::fill(m_pixels.begin(), m_pixels.end(), color.toARGB());
}

void FrameBuffer::setPixel(int x, int y, const Color& color) {
  if (x < 0 || y < 0 || x >= m_width || y >= m_height) {
    return;
  }
  m_pixels[static_cast<size_t>(y) * m_width + x] = color.toARGB();
}

uint32_t FrameBuffer::getPixel(int x, int y) const {
  if (x < 0 || y < 0 || x >= m_width || y >= m_height) {
    return 0;
  }
  return m_pixels[static_cast<size_t>(y) * m_width + x];
}

void FrameBuffer::fillRect(int x, int y, int w, int h, const Color& color) {
  const int x0 = std::max(0, x);
  const int y0 = std::max(0, y);
  const int x1 = std::min(m_width, x + w);
  const int y1 = std::min(m_height, y + h);
  if (x0 >= x1 || y0 >= y1) {
    return;
  }

  const uint32_t packed = color.toARGB();
  for (int row = y0; row < y1; ++row) {
    auto rowStart = m_pixels.begin() + static_cast<ptrdiff_t>(row) * m_width;
    std::fill(rowStart + x0, rowStart + x1, packed);
  }
}

void FrameBuffer::fillColumn(int x, int y0, int y1, const Color& color) {
  if (x < 0 || x >= m_width) {
    return;
  }
  y0 = std::max(0, y0);
  y1 = std::min(m_height, y1);

  const uint32_t packed = color.toARGB();
  for (int row = y0; row < y1; ++row) {
    m_pixels[static_cast<size_t>(row) * m_width + x] = packed;
  }
}

void FrameBuffer::fillCircle(int cx, int cy, int radius, const Color& color) {
  if (radius <= 0) {
    setPixel(cx, cy, color);
    return;
  }
  const int r2 = radius * radius;
  for (int dy = -radius; dy <= radius; ++dy) {
    for (int dx = -radius; dx <= radius; ++dx) {
      if (dx * dx + dy * dy <= r2) {
        setPixel(cx + dx, cy + dy, color);
      }
    }
  }
}

} // namespace NightCage
