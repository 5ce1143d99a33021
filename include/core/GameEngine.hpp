/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GAME_ENGINE_HPP
#define GAME_ENGINE_HPP

#include "core/TimestepManager.hpp"
#include "managers/GameStateManager.hpp"
#include <SDL3/SDL.h>
#include <memory>
#include <string_view>

class GameEngine {
public:
  ~GameEngine() = default;

  /**
   * @brief Gets the singleton instance of GameEngine
   * @return Reference to the GameEngine singleton instance
   */
  static GameEngine &Instance() {
    static GameEngine instance;
    return instance;
  }

  /**
   * @brief Initializes SDL, the window and renderer, the managers, and
   *        registers every game state
   * @param title Window title for the game
   * @param width Initial window width (0 for the 1280x720 default)
   * @param height Initial window height (0 for the 1280x720 default)
   * @param fullscreen Whether to start in fullscreen mode
   * @return true if initialization successful, false otherwise
   *
   * @details Initialization order:
   *   - SDL video and gamepad subsystems
   *   - Window, renderer, logical presentation, VSync (from SettingsManager)
   *   - TimestepManager, with software frame limiting when VSync failed
   *   - InputManager (gamepads, mouse sensitivity)
   *   - ProgressionManager (save file path from settings, then load)
   *   - GameStateManager and the states
   */
  bool init(const std::string_view title, const int width, const int height,
            bool fullscreen);

  /**
   * @brief Polls SDL events, routes input to InputManager, then lets the
   *        top state handle input
   */
  void handleEvents();

  /**
   * @brief Updates the active game state
   * @param deltaTime Clamped frame step in seconds
   */
  void update(float deltaTime);

  /**
   * @brief Clears, renders every active state, presents
   */
  void render();

  /**
   * @brief Saves progression and releases managers and SDL resources
   */
  void clean();

  GameStateManager *getGameStateManager() const {
    return mp_gameStateManager.get();
  }

  TimestepManager &getTimestepManager() { return *m_timestepManager; }

  void setRunning(bool running);
  bool isRunning() const { return m_running; }

  SDL_Renderer *getRenderer() const noexcept { return mp_renderer.get(); }
  SDL_Window *getWindow() const noexcept { return mp_window.get(); }

  float getCurrentFPS() const;

  int getWindowWidth() const noexcept { return m_windowWidth; }
  int getWindowHeight() const noexcept { return m_windowHeight; }
  int getLogicalWidth() const noexcept { return m_logicalWidth; }
  int getLogicalHeight() const noexcept { return m_logicalHeight; }

  bool isVSyncEnabled() const noexcept;
  bool isUsingSoftwareFrameLimiting() const { return m_usingSoftwareFrameLimiting; }

  /**
   * @brief Captures the mouse for mouse-look (hidden cursor, relative motion)
   * @param enabled true while gameplay is active
   */
  void setRelativeMouseMode(bool enabled);
  bool isRelativeMouseMode() const { return m_relativeMouse; }

  void toggleFullscreen();
  bool isFullscreen() const noexcept { return m_isFullscreen; }

private:
  std::unique_ptr<GameStateManager> mp_gameStateManager{nullptr};
  std::unique_ptr<TimestepManager> m_timestepManager{nullptr};
  std::unique_ptr<SDL_Window, decltype(&SDL_DestroyWindow)> mp_window{
      nullptr, SDL_DestroyWindow};
  std::unique_ptr<SDL_Renderer, decltype(&SDL_DestroyRenderer)> mp_renderer{
      nullptr, SDL_DestroyRenderer};
  int m_windowWidth{0};
  int m_windowHeight{0};
  int m_logicalWidth{1280};  // Logical rendering width for HUD positioning
  int m_logicalHeight{720};  // Logical rendering height for HUD positioning

  bool m_running{false};
  bool m_usingSoftwareFrameLimiting{false};
  bool m_isFullscreen{false};
  bool m_relativeMouse{false};
  bool m_sdlInitialized{false};

  void registerStates();
  void onWindowResize(const SDL_Event &event);

  // Delete copy constructor and assignment operator
  GameEngine(const GameEngine &) = delete;
  GameEngine &operator=(const GameEngine &) = delete;

  GameEngine() = default;
};

#endif // GAME_ENGINE_HPP
