/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/Candle.hpp"
#include "core/Logger.hpp"
#include "entities/Inventory.hpp"
#include "rendering/RaycastRenderer.hpp"
#include "utils/MathUtils.hpp"
#include <algorithm>
#include <format>

namespace NightCage {

CandleFlicker::CandleFlicker(uint32_t seed) : m_rng(seed) {}

void CandleFlicker::update(float deltaTime) {
  if (deltaTime <= 0.0f) {
    return;
  }

  // Chance of at least one re-roll over the frames this step covers
  const float rerollChance = 1.0f - perFrameFactor(1.0f - REROLL_CHANCE, deltaTime);
  if (m_unit(m_rng) < rerollChance) {
    m_target = m_unit(m_rng) * MAX_TARGET;
  }

  const float approach = 1.0f - perFrameFactor(1.0f - APPROACH_RATE, deltaTime);
  m_amount = lerp(m_amount, m_target, approach);
  m_target *= perFrameFactor(TARGET_DECAY, deltaTime);
}

void CandleFlicker::reset() {
  m_amount = 0.0f;
  m_target = 0.0f;
}

Candle::Candle(float durationMultiplier, float perceptionMultiplier, uint32_t flickerSeed)
    : m_maxFuel(BASE_MAX_FUEL * std::max(0.1f, durationMultiplier)),
      m_fuel(m_maxFuel),
      m_lightRadius(BASE_LIGHT_RADIUS * std::max(0.1f, perceptionMultiplier)),
      m_flicker(flickerSeed) {}

bool Candle::update(float deltaTime, Inventory& inventory) {
  m_flicker.update(deltaTime);
  m_fuel = std::max(0.0f, m_fuel - getDepletionRate() * deltaTime);

  if (m_fuel > 0.0f || inventory.lightSources <= 1) {
    return false;
  }

  --inventory.lightSources;
  refill();
  PLAYER_INFO(std::format("Candle burnt out, lit a spare ({} left)", inventory.lightSources));
  return true;
}

LightState Candle::getLightState() const {
  LightState light;
  light.radius = m_lightRadius;
  light.intensity = getIntensity();
  light.flicker = m_flicker.getAmount();
  return light;
}

} // namespace NightCage
