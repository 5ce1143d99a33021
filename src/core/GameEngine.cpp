/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/GameEngine.hpp"
#include "core/Logger.hpp"
#include "gameStates/GameOverState.hpp"
#include "gameStates/GamePlayState.hpp"
#include "gameStates/MainMenuState.hpp"
#include "gameStates/PauseState.hpp"
#include "managers/InputManager.hpp"
#include "managers/ProgressionManager.hpp"
#include "managers/SettingsManager.hpp"
#include <format>
#include <string>

#define NIGHTCAGE_BLACK 0, 0, 5, 255

bool GameEngine::init(const std::string_view title, const int width,
                      const int height, bool fullscreen) {
  GAMEENGINE_INFO("Initializing SDL Video and Gamepad");

  if (!SDL_Init(SDL_INIT_VIDEO | SDL_INIT_GAMEPAD)) {
    GAMEENGINE_CRITICAL(std::format("SDL initialization failed: {}", SDL_GetError()));
    return false;
  }
  m_sdlInitialized = true;

  GAMEENGINE_INFO("SDL Video online");

  // Nearest sampling keeps the low-resolution frame buffer crisp when scaled up
  SDL_SetHint("SDL_RENDER_SCALE_QUALITY", "0");
  SDL_SetHint("SDL_MOUSE_AUTO_CAPTURE", "0");

  if (width <= 0 || height <= 0) {
    m_windowWidth = 1280;
    m_windowHeight = 720;
    GAMEENGINE_INFO(std::format("Using default window size: {}x{}", m_windowWidth, m_windowHeight));
  } else {
    m_windowWidth = width;
    m_windowHeight = height;
    GAMEENGINE_INFO(std::format("Using requested window size: {}x{}", m_windowWidth, m_windowHeight));
  }
  m_logicalWidth = m_windowWidth;
  m_logicalHeight = m_windowHeight;

  SDL_WindowFlags const flags =
      SDL_WINDOW_RESIZABLE | (fullscreen ? SDL_WINDOW_FULLSCREEN : 0);
  m_isFullscreen = fullscreen;

  mp_window.reset(
      SDL_CreateWindow(std::string(title).c_str(), m_windowWidth, m_windowHeight, flags));

  if (!mp_window) {
    GAMEENGINE_ERROR(std::format("Failed to create window: {}", SDL_GetError()));
    return false;
  }

  GAMEENGINE_DEBUG("Window creation system online");

  // Create renderer (let SDL3 choose the best available backend)
  mp_renderer.reset(SDL_CreateRenderer(mp_window.get(), nullptr));

  if (!mp_renderer) {
    GAMEENGINE_ERROR(std::format("Failed to create renderer: {}", SDL_GetError()));
    return false;
  }

#ifdef DEBUG
  auto rendererName = SDL_GetRendererName(mp_renderer.get());
  if (rendererName) {
    GAMEENGINE_INFO(std::format("SDL3 selected renderer backend: {}", rendererName));
  }
#endif

  // Fixed logical size: the HUD lays out in window units, the game texture stretches
  if (!SDL_SetRenderLogicalPresentation(mp_renderer.get(), m_logicalWidth, m_logicalHeight,
                                        SDL_LOGICAL_PRESENTATION_LETTERBOX)) {
    GAMEENGINE_ERROR(std::format("Failed to set render logical presentation: {}", SDL_GetError()));
  }
  SDL_SetRenderDrawBlendMode(mp_renderer.get(), SDL_BLENDMODE_BLEND);

  auto& settings = NightCage::SettingsManager::Instance();
  bool vsyncRequested = settings.get<bool>("graphics", "vsync", true);
  bool vsyncSetSuccessfully = SDL_SetRenderVSync(mp_renderer.get(), vsyncRequested ? 1 : 0);
  if (!vsyncSetSuccessfully) {
    GAMEENGINE_WARN(std::format("Failed to {} VSync: {}",
                                vsyncRequested ? "enable" : "disable", SDL_GetError()));
  }

  m_timestepManager = std::make_unique<TimestepManager>(
      static_cast<float>(settings.get<int>("graphics", "target_fps", 60)));
  m_usingSoftwareFrameLimiting = !vsyncRequested || !vsyncSetSuccessfully || !isVSyncEnabled();
  m_timestepManager->setSoftwareFrameLimiting(m_usingSoftwareFrameLimiting);

  GAMEENGINE_INFO(std::format("TimestepManager created: {} FPS, {} frame limiting",
                              m_timestepManager->getTargetFPS(),
                              m_usingSoftwareFrameLimiting ? "software" : "hardware"));

  InputManager& inputMgr = InputManager::Instance();
  inputMgr.initializeGamePad();
  inputMgr.setMouseSensitivity(settings.get<float>(
      "gameplay", "mouse_sensitivity", InputManager::DEFAULT_MOUSE_SENSITIVITY));

  auto& progression = NightCage::ProgressionManager::Instance();
  progression.setSaveFile(
      settings.get<std::string>("save", "progression_file", "res/progression.json"));
  if (!progression.load()) {
    GAMEENGINE_INFO("No saved progression found, starting fresh");
  }

  mp_gameStateManager = std::make_unique<GameStateManager>();
  try {
    registerStates();
  } catch (const std::exception& e) {
    GAMEENGINE_CRITICAL(std::format("Failed to register game states: {}", e.what()));
    return false;
  }

  m_running = true;
  GAMEENGINE_INFO("Game engine initialized");
  return true;
}

void GameEngine::registerStates() {
  mp_gameStateManager->addState(std::make_unique<MainMenuState>());
  mp_gameStateManager->addState(std::make_unique<GamePlayState>());
  mp_gameStateManager->addState(std::make_unique<PauseState>());
  mp_gameStateManager->addState(std::make_unique<GameOverState>());
}

void GameEngine::handleEvents() {
  // GameEngine owns the event loop as it owns the window/renderer;
  // InputManager receives input events and maintains input state
  InputManager &inputMgr = InputManager::Instance();

  // Clear previous frame's pressed keys before processing new events
  inputMgr.clearFrameInput();

  SDL_Event event;
  while (SDL_PollEvent(&event)) {
    switch (event.type) {
      case SDL_EVENT_QUIT:
        GAMEENGINE_INFO("Shutting down! {}===]>");
        setRunning(false);
        break;

      case SDL_EVENT_KEY_DOWN:
        inputMgr.onKeyDown(event);
        if (event.key.scancode == SDL_SCANCODE_F11 && !event.key.repeat) {
          toggleFullscreen();
        }
        break;
      case SDL_EVENT_KEY_UP:
        inputMgr.onKeyUp(event);
        break;
      case SDL_EVENT_MOUSE_MOTION:
        inputMgr.onMouseMove(event);
        break;
      case SDL_EVENT_MOUSE_BUTTON_DOWN:
        inputMgr.onMouseButtonDown(event);
        break;
      case SDL_EVENT_MOUSE_BUTTON_UP:
        inputMgr.onMouseButtonUp(event);
        break;
      case SDL_EVENT_GAMEPAD_AXIS_MOTION:
        inputMgr.onGamepadAxisMove(event);
        break;
      case SDL_EVENT_GAMEPAD_BUTTON_DOWN:
        inputMgr.onGamepadButtonDown(event);
        break;

      case SDL_EVENT_WINDOW_RESIZED:
        onWindowResize(event);
        break;

      default:
        break;
    }
  }

  if (mp_gameStateManager) {
    mp_gameStateManager->handleInput();
  }
}

void GameEngine::setRunning(bool running) {
  m_running = running;
}

float GameEngine::getCurrentFPS() const {
  return m_timestepManager ? m_timestepManager->getCurrentFPS() : 0.0f;
}

void GameEngine::update(float deltaTime) {
  mp_gameStateManager->update(deltaTime);
}

void GameEngine::render() {
  SDL_SetRenderDrawColor(mp_renderer.get(), NIGHTCAGE_BLACK);
  SDL_RenderClear(mp_renderer.get());

  mp_gameStateManager->render(mp_renderer.get());

  SDL_RenderPresent(mp_renderer.get());
}

bool GameEngine::isVSyncEnabled() const noexcept {
  if (!mp_renderer) {
    return false;
  }

  int vsync = 0;
  if (SDL_GetRenderVSync(mp_renderer.get(), &vsync)) {
    return (vsync > 0); // Any positive value means VSync is enabled
  }

  return false;
}

void GameEngine::setRelativeMouseMode(bool enabled) {
  if (!mp_window || m_relativeMouse == enabled) {
    return;
  }
  if (!SDL_SetWindowRelativeMouseMode(mp_window.get(), enabled)) {
    GAMEENGINE_WARN(std::format("Failed to {} relative mouse mode: {}",
                                enabled ? "enable" : "disable", SDL_GetError()));
    return;
  }
  m_relativeMouse = enabled;
  // Motion accumulated before the switch would snap the view
  InputManager::Instance().consumeMouseDelta();
}

void GameEngine::toggleFullscreen() {
  if (!mp_window) {
    GAMEENGINE_ERROR("Cannot toggle fullscreen - window not initialized");
    return;
  }

  m_isFullscreen = !m_isFullscreen;
  if (!SDL_SetWindowFullscreen(mp_window.get(), m_isFullscreen)) {
    GAMEENGINE_ERROR(std::format("Failed to toggle fullscreen: {}", SDL_GetError()));
    m_isFullscreen = !m_isFullscreen; // Revert state on failure
    return;
  }

  GAMEENGINE_INFO(std::format("Fullscreen mode {}", m_isFullscreen ? "enabled" : "disabled"));
}

void GameEngine::onWindowResize(const SDL_Event& event) {
  m_windowWidth = event.window.data1;
  m_windowHeight = event.window.data2;

  GAMEENGINE_INFO(std::format("Window resized to: {}x{}", m_windowWidth, m_windowHeight));

  // Logical size stays fixed, letterboxing absorbs the new aspect ratio
  if (mp_gameStateManager) {
    mp_gameStateManager->notifyResize(m_logicalWidth, m_logicalHeight);
  }
}

void GameEngine::clean() {
  GAMEENGINE_INFO("Starting shutdown sequence...");

  setRelativeMouseMode(false);

  GAMEENGINE_INFO("Cleaning up GameState manager...");
  if (mp_gameStateManager) {
    mp_gameStateManager->clearAllStates();
    mp_gameStateManager.reset();
  }

  if (!NightCage::ProgressionManager::Instance().save()) {
    GAMEENGINE_ERROR("Failed to save progression during shutdown");
  }

  GAMEENGINE_INFO("Cleaning up Input Manager...");
  InputManager::Instance().clean();

  m_timestepManager.reset();

  // Renderer before window, then SDL itself
  GAMEENGINE_INFO("Destroying renderer...");
  mp_renderer.reset();
  GAMEENGINE_INFO("Destroying window...");
  mp_window.reset();

  if (m_sdlInitialized) {
    GAMEENGINE_INFO("Calling SDL_Quit...");
    SDL_Quit();
    m_sdlInitialized = false;
  }

  m_running = false;
  GAMEENGINE_INFO("Shutdown complete!");
}
