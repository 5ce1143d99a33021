/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/GameEngine.hpp"
#include "core/Logger.hpp"
#include "core/TimestepManager.hpp"
#include "managers/SettingsManager.hpp"
#include <format>
#include <string>

const int WINDOW_WIDTH{1280};
const int WINDOW_HEIGHT{720};
const std::string GAME_NAME{NIGHTCAGE_APP_NAME};

// maybe_unused is just a hint to the compiler that the variable is not used.
// with -Wall -Wextra flags
int main([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
  GAMEENGINE_INFO(std::format("Initializing {}", GAME_NAME));

  // Load settings from disk before GameEngine initialization
  // This ensures VSync and other settings are loaded before they're applied
  auto& settingsManager = NightCage::SettingsManager::Instance();
  if (!settingsManager.loadFromFile("res/settings.json")) {
    GAMEENGINE_WARN("Failed to load settings.json - using defaults");
  } else {
    GAMEENGINE_INFO("Settings loaded from res/settings.json");
  }

  const int windowWidth = settingsManager.get<int>("graphics", "resolution_width", WINDOW_WIDTH);
  const int windowHeight = settingsManager.get<int>("graphics", "resolution_height", WINDOW_HEIGHT);
  const bool fullscreen = settingsManager.get<bool>("graphics", "fullscreen", false);

  GameEngine& gameEngine = GameEngine::Instance();

  if (!gameEngine.init(GAME_NAME, windowWidth, windowHeight, fullscreen)) {
    GAMEENGINE_CRITICAL(std::format("Init {} Failed: {}", GAME_NAME, SDL_GetError()));

    // Always clean up on init failure so partially created SDL objects are released
    gameEngine.clean();
    return -1;
  }

  gameEngine.getGameStateManager()->pushState("MainMenuState");

  GAMEENGINE_INFO("Starting Main Loop");

  TimestepManager& ts = gameEngine.getTimestepManager();

  // One variable step per frame, clamped inside TimestepManager
  while (gameEngine.isRunning()) {
    ts.startFrame();

    gameEngine.handleEvents();

    gameEngine.update(ts.getUpdateDeltaTime());

    if (ts.shouldRender()) {
      gameEngine.render();
    }

    ts.endFrame();
  }

  GAMEENGINE_INFO(std::format("Game {} shutting down", GAME_NAME));

  gameEngine.clean();

  return 0;
}
