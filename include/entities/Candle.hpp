/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CANDLE_HPP
#define CANDLE_HPP

#include <cstdint>
#include <random>

namespace NightCage {

struct Inventory;
struct LightState;

/**
 * @brief Random flame wobble shared by the renderer (dimming) and the
 * player camera (jitter)
 *
 * The constants are tuned per 60 Hz frame and rescaled by the step length,
 * so the flicker looks the same at any frame rate.
 */
class CandleFlicker {
public:
  static constexpr float REROLL_CHANCE = 0.05f;
  static constexpr float MAX_TARGET = 0.5f;
  static constexpr float APPROACH_RATE = 0.2f;
  static constexpr float TARGET_DECAY = 0.95f;

  explicit CandleFlicker(uint32_t seed = 0);

  void update(float deltaTime);
  void reset();

  // Current flicker in [0, MAX_TARGET)
  float getAmount() const { return m_amount; }
  float getTarget() const { return m_target; }

private:
  std::mt19937 m_rng;
  std::uniform_real_distribution<float> m_unit{0.0f, 1.0f};
  float m_amount{0.0f};
  float m_target{0.0f};
};

/**
 * @brief The player's light: fuel, light radius and flicker
 *
 * Fuel burns at a fixed rate, so the duration upgrade buys time by raising
 * the tank size rather than slowing the burn.
 */
class Candle {
public:
  static constexpr float BASE_MAX_FUEL = 100.0f;
  static constexpr float BURN_SECONDS = 300.0f;
  static constexpr float BASE_LIGHT_RADIUS = 2.5f;

  explicit Candle(float durationMultiplier = 1.0f, float perceptionMultiplier = 1.0f,
                  uint32_t flickerSeed = 0);

  // Burns fuel and advances the flicker. When the flame dies and the
  // inventory holds a spare light source, the spare is lit. Returns true
  // if that happened this step.
  bool update(float deltaTime, Inventory& inventory);

  void refill() { m_fuel = m_maxFuel; }

  float getFuel() const { return m_fuel; }
  float getMaxFuel() const { return m_maxFuel; }
  float getFuelFraction() const { return m_maxFuel > 0.0f ? m_fuel / m_maxFuel : 0.0f; }
  float getIntensity() const { return getFuelFraction(); }
  float getLightRadius() const { return m_lightRadius; }
  float getDepletionRate() const { return BASE_MAX_FUEL / BURN_SECONDS; }
  bool isBurntOut() const { return m_fuel <= 0.0f; }

  const CandleFlicker& getFlicker() const { return m_flicker; }
  LightState getLightState() const;

private:
  float m_maxFuel;
  float m_fuel;
  float m_lightRadius;
  CandleFlicker m_flicker;
};

} // namespace NightCage

#endif // CANDLE_HPP
