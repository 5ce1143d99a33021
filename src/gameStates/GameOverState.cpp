/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "gameStates/GameOverState.hpp"
#include "core/GameEngine.hpp"
#include "core/Logger.hpp"
#include "managers/GameStateManager.hpp"
#include "managers/InputManager.hpp"
#include "managers/ProgressionManager.hpp"
#include "rendering/HudText.hpp"
#include <array>
#include <format>

namespace {
constexpr NightCage::Color TITLE_WIN = NightCage::Color::fromHex(0xffaa00);
constexpr NightCage::Color TITLE_LOSS = NightCage::Color::fromHex(0xc02020);
constexpr NightCage::Color TEXT_COLOR = NightCage::Color::fromHex(0xc8c8c8);
constexpr NightCage::Color DIM_COLOR = NightCage::Color::fromHex(0x707070);
constexpr float MESSAGE_SECONDS = 2.0f;

constexpr std::array<SDL_Scancode, 4> SHOP_KEYS{SDL_SCANCODE_1, SDL_SCANCODE_2, SDL_SCANCODE_3,
                                                SDL_SCANCODE_4};

std::string formatTime(int64_t ms) {
  const int64_t totalSeconds = ms / 1000;
  return std::format("{}:{:02}", totalSeconds / 60, totalSeconds % 60);
}
} // namespace

bool GameOverState::enter() {
  GameEngine::Instance().setRelativeMouseMode(false);
  m_shopMessage.clear();
  m_messageTimer = 0.0f;
  return true;
}

void GameOverState::update(float deltaTime) {
  if (m_messageTimer > 0.0f) {
    m_messageTimer -= deltaTime;
  }
}

void GameOverState::render(SDL_Renderer* renderer) {
  const auto& engine = GameEngine::Instance();
  const auto& progression = NightCage::ProgressionManager::Instance();
  const float centerX = static_cast<float>(engine.getLogicalWidth()) * 0.5f;
  float y = static_cast<float>(engine.getLogicalHeight()) * 0.1f;

  if (const auto& lastRun = progression.getLastRun()) {
    if (lastRun->victory) {
      NightCage::drawHudTextCentered(renderer, centerX, y, "YOU ESCAPED", TITLE_WIN, 4.0f);
    } else {
      NightCage::drawHudTextCentered(renderer, centerX, y, "YOU DIED", TITLE_LOSS, 4.0f);
    }
    y += 50.0f;
    if (!lastRun->victory && !lastRun->deathCause.empty()) {
      NightCage::drawHudTextCentered(renderer, centerX, y, std::format("taken by {}", lastRun->deathCause),
                                     DIM_COLOR, 1.5f);
      y += 24.0f;
    }
    NightCage::drawHudTextCentered(
        renderer, centerX, y,
        std::format("Maze reached {}   Time {}   Items {}", lastRun->levelReached,
                    formatTime(lastRun->timeMs), lastRun->itemsCollected),
        TEXT_COLOR, 1.5f);
    y += 24.0f;
    NightCage::drawHudTextCentered(renderer, centerX, y,
                                   std::format("Experience gained {}{}", lastRun->experienceGained,
                                               lastRun->leveledUp ? "   LEVEL UP!" : ""),
                                   TEXT_COLOR, 1.5f);
    y += 24.0f;
    for (const std::string& achievement : lastRun->newAchievements) {
      NightCage::drawHudTextCentered(renderer, centerX, y, std::format("Achievement: {}", achievement),
                                     TITLE_WIN, 1.5f);
      y += 20.0f;
    }
  } else {
    NightCage::drawHudTextCentered(renderer, centerX, y, "UPGRADES", TITLE_WIN, 4.0f);
    y += 50.0f;
  }

  const auto stats = progression.getStats();
  y += 20.0f;
  NightCage::drawHudTextCentered(renderer, centerX, y,
                                 std::format("Level {}   XP {}", stats.level, stats.experience),
                                 TEXT_COLOR, 2.0f);
  y += 40.0f;

  const auto offers = progression.getAvailableUpgrades();
  for (size_t i = 0; i < offers.size(); ++i) {
    const auto& offer = offers[i];
    NightCage::drawHudTextCentered(
        renderer, centerX, y,
        std::format("{} - {} x{:.1f} ({} XP)", i + 1, offer.name, offer.current, offer.cost),
        stats.experience >= offer.cost ? TEXT_COLOR : DIM_COLOR, 1.5f);
    y += 18.0f;
    NightCage::drawHudTextCentered(renderer, centerX, y, offer.description, DIM_COLOR, 1.0f);
    y += 22.0f;
  }

  if (m_messageTimer > 0.0f) {
    NightCage::drawHudTextCentered(renderer, centerX, y + 10.0f, m_shopMessage, TITLE_WIN, 1.5f);
  }

  NightCage::drawHudTextCentered(renderer, centerX, static_cast<float>(engine.getLogicalHeight()) - 40.0f,
                                 "SPACE / A - new run     ENTER / B - main menu", TEXT_COLOR, 1.5f);
}

void GameOverState::buyUpgrade(size_t offerIndex) {
  auto& progression = NightCage::ProgressionManager::Instance();
  const auto offers = progression.getAvailableUpgrades();
  if (offerIndex >= offers.size()) {
    return;
  }

  const auto& offer = offers[offerIndex];
  if (progression.applyUpgrade(offer.type)) {
    m_shopMessage = std::format("{} improved", offer.name);
  } else {
    m_shopMessage = std::format("Not enough experience for {}", offer.name);
  }
  m_messageTimer = MESSAGE_SECONDS;
}

void GameOverState::handleInput() {
  const auto& inputMgr = InputManager::Instance();

  for (size_t i = 0; i < SHOP_KEYS.size(); ++i) {
    if (inputMgr.wasKeyPressed(SHOP_KEYS[i])) {
      buyUpgrade(i);
    }
  }

  if (inputMgr.wasKeyPressed(SDL_SCANCODE_SPACE) || inputMgr.wasButtonPressed(SDL_GAMEPAD_BUTTON_SOUTH)) {
    mp_stateManager->changeState("GamePlayState");
    return;
  }
  if (inputMgr.wasKeyPressed(SDL_SCANCODE_RETURN) || inputMgr.wasKeyPressed(SDL_SCANCODE_ESCAPE) ||
      inputMgr.wasButtonPressed(SDL_GAMEPAD_BUTTON_EAST)) {
    mp_stateManager->changeState("MainMenuState");
  }
}

bool GameOverState::exit() {
  return true;
}

std::string GameOverState::getName() const {
  return "GameOverState";
}
