/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef MAIN_MENU_STATE_HPP
#define MAIN_MENU_STATE_HPP

#include "gameStates/GameState.hpp"

class MainMenuState : public GameState {
 public:
  bool enter() override;
  void update(float deltaTime) override;
  void render(SDL_Renderer* renderer) override;
  void handleInput() override;
  bool exit() override;
  std::string getName() const override;

 private:
  float m_elapsed{0.0f};
  bool m_confirmReset{false};
};

#endif  // MAIN_MENU_STATE_HPP
