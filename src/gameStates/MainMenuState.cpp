/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "gameStates/MainMenuState.hpp"
#include "core/GameEngine.hpp"
#include "core/Logger.hpp"
#include "managers/GameStateManager.hpp"
#include "managers/InputManager.hpp"
#include "managers/ProgressionManager.hpp"
#include "rendering/HudText.hpp"
#include <cmath>
#include <format>

namespace {
constexpr NightCage::Color TITLE_COLOR = NightCage::Color::fromHex(0xffaa00);
constexpr NightCage::Color TEXT_COLOR = NightCage::Color::fromHex(0xc8c8c8);
constexpr NightCage::Color DIM_COLOR = NightCage::Color::fromHex(0x707070);
constexpr NightCage::Color WARN_COLOR = NightCage::Color::fromHex(0xff4040);
} // namespace

bool MainMenuState::enter() {
  m_elapsed = 0.0f;
  m_confirmReset = false;
  GameEngine::Instance().setRelativeMouseMode(false);
  GAMESTATE_INFO("Entering main menu");
  return true;
}

void MainMenuState::update(float deltaTime) {
  m_elapsed += deltaTime;
}

void MainMenuState::render(SDL_Renderer* renderer) {
  const auto& engine = GameEngine::Instance();
  const float centerX = static_cast<float>(engine.getLogicalWidth()) * 0.5f;
  float y = static_cast<float>(engine.getLogicalHeight()) * 0.2f;

  NightCage::drawHudTextCentered(renderer, centerX, y, "NIGHT CAGE", TITLE_COLOR, 5.0f);
  y += 70.0f;
  NightCage::drawHudTextCentered(renderer, centerX, y, "find the keys, mind the candle, get out",
                                 DIM_COLOR, 1.5f);

  const auto stats = NightCage::ProgressionManager::Instance().getStats();
  y += 60.0f;
  NightCage::drawHudTextCentered(
      renderer, centerX, y,
      std::format("Level {}   XP {}/{}", stats.level, stats.experience,
                  stats.level * NightCage::ProgressionManager::XP_PER_LEVEL),
      TEXT_COLOR, 2.0f);
  y += 30.0f;
  NightCage::drawHudTextCentered(
      renderer, centerX, y,
      std::format("Runs {}   Escapes {}   Artifacts {}   Achievements {}", stats.totalRuns,
                  stats.totalEscapes, stats.artifacts, stats.achievements),
      TEXT_COLOR, 1.5f);

  y += 70.0f;
  // Slow pulse on the start prompt
  const float pulse = 0.6f + 0.4f * std::sin(m_elapsed * 3.0f);
  NightCage::drawHudTextCentered(renderer, centerX, y, "ENTER / A - begin a run",
                                 TITLE_COLOR.scaled(pulse), 2.0f);
  y += 30.0f;
  NightCage::drawHudTextCentered(renderer, centerX, y, "U - upgrades     R - reset progress     ESC - quit",
                                 TEXT_COLOR, 1.5f);

  if (m_confirmReset) {
    y += 40.0f;
    NightCage::drawHudTextCentered(renderer, centerX, y, "Erase all progress? Y / N", WARN_COLOR, 2.0f);
  }
}

void MainMenuState::handleInput() {
  const auto& inputMgr = InputManager::Instance();

  if (m_confirmReset) {
    if (inputMgr.wasKeyPressed(SDL_SCANCODE_Y) || inputMgr.wasButtonPressed(SDL_GAMEPAD_BUTTON_SOUTH)) {
      NightCage::ProgressionManager::Instance().resetProgress();
      m_confirmReset = false;
    } else if (inputMgr.wasKeyPressed(SDL_SCANCODE_N) || inputMgr.wasKeyPressed(SDL_SCANCODE_ESCAPE) ||
               inputMgr.wasButtonPressed(SDL_GAMEPAD_BUTTON_EAST)) {
      m_confirmReset = false;
    }
    return;
  }

  if (inputMgr.wasKeyPressed(SDL_SCANCODE_RETURN) || inputMgr.wasKeyPressed(SDL_SCANCODE_SPACE) ||
      inputMgr.wasButtonPressed(SDL_GAMEPAD_BUTTON_SOUTH)) {
    mp_stateManager->changeState("GamePlayState");
    return;
  }
  if (inputMgr.wasKeyPressed(SDL_SCANCODE_U)) {
    mp_stateManager->changeState("GameOverState");
    return;
  }
  if (inputMgr.wasKeyPressed(SDL_SCANCODE_R)) {
    m_confirmReset = true;
    return;
  }
  if (inputMgr.wasKeyPressed(SDL_SCANCODE_ESCAPE)) {
    GameEngine::Instance().setRunning(false);
  }
}

bool MainMenuState::exit() {
  GAMESTATE_INFO("Exiting main menu");
  return true;
}

std::string MainMenuState::getName() const {
  return "MainMenuState";
}
