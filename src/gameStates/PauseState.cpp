/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "gameStates/PauseState.hpp"
#include "core/GameEngine.hpp"
#include "core/Logger.hpp"
#include "managers/GameStateManager.hpp"
#include "managers/InputManager.hpp"
#include "rendering/HudText.hpp"

bool PauseState::enter() {
  GameEngine::Instance().setRelativeMouseMode(false);
  GAMESTATE_INFO("Game paused");
  return true;
}

void PauseState::update([[maybe_unused]] float deltaTime) {
}

void PauseState::render(SDL_Renderer* renderer) {
  const auto& engine = GameEngine::Instance();
  const int width = engine.getLogicalWidth();
  const int height = engine.getLogicalHeight();

  // Dim the frozen game behind the menu
  NightCage::drawHudOverlay(renderer, width, height, 160);

  const float centerX = static_cast<float>(width) * 0.5f;
  const float y = static_cast<float>(height) * 0.35f;
  NightCage::drawHudTextCentered(renderer, centerX, y, "PAUSED",
                                 NightCage::Color::fromHex(0xffaa00), 4.0f);
  NightCage::drawHudTextCentered(renderer, centerX, y + 70.0f, "ESC / R / START - resume",
                                 NightCage::Color::fromHex(0xc8c8c8), 2.0f);
  NightCage::drawHudTextCentered(renderer, centerX, y + 100.0f, "M / BACK - abandon run and return to menu",
                                 NightCage::Color::fromHex(0xc8c8c8), 2.0f);
  NightCage::drawHudTextCentered(renderer, centerX, y + 130.0f, "Q - quit game",
                                 NightCage::Color::fromHex(0xc8c8c8), 2.0f);
}

void PauseState::handleInput() {
  const auto& inputMgr = InputManager::Instance();

  if (inputMgr.wasKeyPressed(SDL_SCANCODE_ESCAPE) || inputMgr.wasKeyPressed(SDL_SCANCODE_R) ||
      inputMgr.wasButtonPressed(SDL_GAMEPAD_BUTTON_START)) {
    mp_stateManager->popState();
    return;
  }

  if (inputMgr.wasKeyPressed(SDL_SCANCODE_M) || inputMgr.wasButtonPressed(SDL_GAMEPAD_BUTTON_BACK)) {
    // An abandoned run is not booked as a death
    mp_stateManager->resetToState("MainMenuState");
    return;
  }

  if (inputMgr.wasKeyPressed(SDL_SCANCODE_Q)) {
    GameEngine::Instance().setRunning(false);
  }
}

bool PauseState::exit() {
  GAMESTATE_INFO("Leaving pause");
  return true;
}

std::string PauseState::getName() const {
  return "PauseState";
}
