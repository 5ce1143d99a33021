/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/GameStateManager.hpp"
#include "core/Logger.hpp"
#include "gameStates/GameState.hpp"
#include <algorithm>
#include <format>
#include <stdexcept>

GameStateManager::GameStateManager() {
  m_registeredStates.reserve(8);
  m_activeStates.reserve(3); // For the active stack
}

void GameStateManager::addState(std::unique_ptr<GameState> state) {
  if (!state) {
    throw std::invalid_argument("NightCage - cannot register a null state");
  }
  const std::string name = state->getName();
  if (hasState(name)) {
    GAMESTATE_ERROR(std::format("State with name {} already exists", name));
    throw std::runtime_error(std::format("NightCage - State with name {} already exists", name));
  }
  state->setStateManager(this);
  m_registeredStates[name] = std::move(state);
}

void GameStateManager::pushState(const std::string &stateName) {
  auto it = m_registeredStates.find(stateName);
  if (it == m_registeredStates.end()) {
    GAMESTATE_ERROR(std::format("State not found: {}", stateName));
    return;
  }

  // Pause the current top state if it exists
  if (!m_activeStates.empty()) {
    m_activeStates.back()->pause();
  }

  m_activeStates.push_back(it->second);
  if (!it->second->enter()) {
    GAMESTATE_ERROR(std::format("State {} failed to enter", stateName));
  }
  GAMESTATE_INFO(std::format("Pushed state: {}", stateName));
}

void GameStateManager::popState() {
  if (m_activeStates.empty()) {
    return;
  }

  // Keep the state alive while it exits, a caller may be inside one of its methods
  std::shared_ptr<GameState> top = m_activeStates.back();
  m_activeStates.pop_back();
  top->exit();
  GAMESTATE_INFO(std::format("Popped state: {}", top->getName()));

  // Resume the new top state if it exists
  if (!m_activeStates.empty()) {
    m_activeStates.back()->resume();
  }
}

void GameStateManager::changeState(const std::string &stateName) {
  if (!hasState(stateName)) {
    GAMESTATE_ERROR(std::format("Cannot change to unknown state: {}", stateName));
    return;
  }
  if (!m_activeStates.empty()) {
    std::shared_ptr<GameState> top = m_activeStates.back();
    m_activeStates.pop_back();
    top->exit();
  }
  pushState(stateName);
}

void GameStateManager::resetToState(const std::string &stateName) {
  if (!hasState(stateName)) {
    GAMESTATE_ERROR(std::format("Cannot reset to unknown state: {}", stateName));
    return;
  }
  while (!m_activeStates.empty()) {
    std::shared_ptr<GameState> top = m_activeStates.back();
    m_activeStates.pop_back();
    top->exit();
  }
  pushState(stateName);
}

void GameStateManager::update(float deltaTime) {
  // States beneath the top are frozen
  if (!m_activeStates.empty()) {
    std::shared_ptr<GameState> top = m_activeStates.back();
    top->update(deltaTime);
  }
}

void GameStateManager::render(SDL_Renderer* renderer) {
  for (const auto &state : m_activeStates) {
    state->render(renderer);
  }
}

void GameStateManager::handleInput() {
  // Only the top state handles input
  if (!m_activeStates.empty()) {
    std::shared_ptr<GameState> top = m_activeStates.back();
    top->handleInput();
  }
}

void GameStateManager::notifyResize(int newLogicalWidth, int newLogicalHeight) {
  for (const auto &state : m_activeStates) {
    state->onWindowResize(newLogicalWidth, newLogicalHeight);
  }
}

bool GameStateManager::hasState(const std::string &stateName) const {
  return m_registeredStates.find(stateName) != m_registeredStates.end();
}

std::shared_ptr<GameState>
GameStateManager::getState(const std::string &stateName) const {
  auto it = m_registeredStates.find(stateName);
  return it != m_registeredStates.end() ? it->second : nullptr;
}

std::shared_ptr<GameState> GameStateManager::getCurrentState() const {
  return m_activeStates.empty() ? nullptr : m_activeStates.back();
}

bool GameStateManager::isActive(const std::string &stateName) const {
  return std::any_of(m_activeStates.begin(), m_activeStates.end(),
                     [&](const std::shared_ptr<GameState> &state) {
                       return state->getName() == stateName;
                     });
}

void GameStateManager::removeState(const std::string &stateName) {
  // First, remove the state from the active stack if it's there
  m_activeStates.erase(
      std::remove_if(m_activeStates.begin(), m_activeStates.end(),
                     [&](const std::shared_ptr<GameState> &state) {
                       if (state->getName() == stateName) {
                         state->exit();
                         return true;
                       }
                       return false;
                     }),
      m_activeStates.end());

  // Resume the new top state if it exists
  if (!m_activeStates.empty()) {
    m_activeStates.back()->resume();
  }

  m_registeredStates.erase(stateName);
}

void GameStateManager::clearAllStates() {
  // Exit all active states, top first
  while (!m_activeStates.empty()) {
    std::shared_ptr<GameState> top = m_activeStates.back();
    m_activeStates.pop_back();
    top->exit();
  }
  m_registeredStates.clear();
}
