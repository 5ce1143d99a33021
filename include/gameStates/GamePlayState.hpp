/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef GAME_PLAY_STATE_HPP
#define GAME_PLAY_STATE_HPP

#include "gameStates/GameState.hpp"
#include "entities/Inventory.hpp"
#include "managers/HazardManager.hpp"
#include "rendering/FrameBuffer.hpp"
#include "rendering/RaycastRenderer.hpp"
#include "world/Level.hpp"
#include <SDL3/SDL.h>
#include <memory>
#include <optional>
#include <random>
#include <string>

/**
 * A run: up to max_level mazes played back to back.
 *
 * Each frame the movement intent from InputManager drives the Level, the
 * raycaster paints the frame buffer, and the buffer is uploaded to a
 * streaming texture stretched over the window with the HUD on top.
 * Escaping a maze carries the inventory into the next one; dying or
 * escaping the last maze books the run with ProgressionManager and moves
 * to GameOverState.
 */
class GamePlayState : public GameState {
 public:
  static constexpr int DEFAULT_MAX_LEVEL = 10;
  static constexpr float DEFAULT_RENDER_SCALE = 0.5f;
  static constexpr float TOAST_SECONDS = 2.5f;

  bool enter() override;
  void update(float deltaTime) override;
  void render(SDL_Renderer* renderer) override;
  void handleInput() override;
  bool exit() override;
  void pause() override;
  void resume() override;
  std::string getName() const override;

  const NightCage::Level* getLevel() const { return m_level.get(); }

 private:
  std::unique_ptr<NightCage::Level> m_level;
  NightCage::FrameBuffer m_frameBuffer{640, 360};
  NightCage::RaycastRenderer m_renderer;
  std::unique_ptr<SDL_Texture, decltype(&SDL_DestroyTexture)> mp_frameTexture{
      nullptr, SDL_DestroyTexture};

  std::mt19937 m_seedRng{std::random_device{}()};
  int m_levelNumber{1};
  int m_maxLevel{DEFAULT_MAX_LEVEL};
  float m_runTime{0.0f};
  int m_runItems{0};

  bool m_showMinimap{true};
  bool m_showFps{false};
  std::string m_toast;
  float m_toastTimer{0.0f};

  bool createFrameTexture(SDL_Renderer* renderer);
  void startRun();
  bool startLevel(const NightCage::Inventory& carried);
  void finishRun(bool escaped, std::optional<NightCage::DeathCause> cause);
  void showToast(std::string message);

  void renderHud(SDL_Renderer* renderer) const;
  void renderMinimap(SDL_Renderer* renderer) const;
};

#endif  // GAME_PLAY_STATE_HPP
