/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef GAME_OVER_STATE_HPP
#define GAME_OVER_STATE_HPP

#include "gameStates/GameState.hpp"
#include <string>

// Summary of the run just booked (if any) and the upgrade shop
class GameOverState : public GameState {
 public:
  bool enter() override;
  void update(float deltaTime) override;
  void render(SDL_Renderer* renderer) override;
  void handleInput() override;
  bool exit() override;
  std::string getName() const override;

 private:
  std::string m_shopMessage;
  float m_messageTimer{0.0f};

  void buyUpgrade(size_t offerIndex);
};

#endif  // GAME_OVER_STATE_HPP
