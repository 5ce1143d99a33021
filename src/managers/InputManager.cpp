/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/InputManager.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>
#include <memory>

InputManager::InputManager() {
  m_pressedThisFrame.reserve(16);  // Typical max keys pressed per frame
  m_buttonsPressedThisFrame.reserve(8);
  m_mouseButtonStates.assign(3, false);
}

void InputManager::initializeGamePad() {
  if (m_gamePadInitialized) {
    return;
  }

  if (!SDL_InitSubSystem(SDL_INIT_GAMEPAD)) {
    INPUT_CRITICAL(std::format("Unable to initialize gamepad subsystem: {}", SDL_GetError()));
    return;
  }

  // Get all available gamepads with RAII management
  int numGamepads = 0;
  auto gamepadIDs = std::unique_ptr<SDL_JoystickID[], decltype(&SDL_free)>(
      SDL_GetGamepads(&numGamepads), SDL_free);

  if (!gamepadIDs) {
    INPUT_ERROR(std::format("Failed to get gamepad IDs: {}", SDL_GetError()));
    SDL_QuitSubSystem(SDL_INIT_GAMEPAD);
    return;
  }

  if (numGamepads <= 0) {
    INPUT_INFO("No gamepads found");
    SDL_QuitSubSystem(SDL_INIT_GAMEPAD);
    return;
  }

  INPUT_INFO(std::format("Number of Game Pads detected: {}", numGamepads));
  for (int i = 0; i < numGamepads; i++) {
    if (!SDL_IsGamepad(gamepadIDs[i])) {
      continue;
    }
    SDL_Gamepad* gamepad = SDL_OpenGamepad(gamepadIDs[i]);
    if (!gamepad) {
      INPUT_ERROR(std::format("Could not open gamepad: {}", SDL_GetError()));
      continue;
    }
    m_joysticks.push_back(gamepad);
    m_joystickValues.emplace_back(Vector2D(0, 0), Vector2D(0, 0));
    INPUT_INFO(std::format("Gamepad connected: {}", SDL_GetGamepadName(gamepad)));
  }

  m_gamePadInitialized = true;
}

void InputManager::reset() {
  std::fill(m_mouseButtonStates.begin(), m_mouseButtonStates.end(), false);
  m_mouseDelta = Vector2D(0, 0);
  clearFrameInput();
}

bool InputManager::isKeyDown(SDL_Scancode key) const {
  if (m_keystates != nullptr) {
    return m_keystates[key];
  }
  return false;
}

bool InputManager::getMouseButtonState(int buttonNumber) const {
  if (buttonNumber < 0 ||
      buttonNumber >= static_cast<int>(m_mouseButtonStates.size())) {
    return false;
  }

  return m_mouseButtonStates[buttonNumber];
}

const Vector2D& InputManager::getMousePosition() const {
  return m_mousePosition;
}

Vector2D InputManager::consumeMouseDelta() {
  Vector2D delta = m_mouseDelta;
  m_mouseDelta = Vector2D(0, 0);
  return delta;
}

void InputManager::setMouseSensitivity(float sensitivity) {
  if (sensitivity < 0.0f) {
    INPUT_WARN(std::format("Ignoring negative mouse sensitivity {}", sensitivity));
    return;
  }
  m_mouseSensitivity = sensitivity;
}

bool InputManager::wasKeyPressed(SDL_Scancode key) const {
  return std::any_of(m_pressedThisFrame.begin(), m_pressedThisFrame.end(),
                     [key](SDL_Scancode pressedKey) { return pressedKey == key; });
}

bool InputManager::wasButtonPressed(SDL_GamepadButton button) const {
  return std::find(m_buttonsPressedThisFrame.begin(), m_buttonsPressedThisFrame.end(), button) !=
         m_buttonsPressedThisFrame.end();
}

void InputManager::clearFrameInput() {
  m_pressedThisFrame.clear();
  m_buttonsPressedThisFrame.clear();
}

void InputManager::update() {
  // SDL event polling lives in GameEngine::handleEvents()
  clearFrameInput();
}

MovementKeys InputManager::getMovementKeys() const {
  MovementKeys keys;
  keys.forward = isKeyDown(SDL_SCANCODE_W) || isKeyDown(SDL_SCANCODE_UP);
  keys.back = isKeyDown(SDL_SCANCODE_S) || isKeyDown(SDL_SCANCODE_DOWN);
  keys.turnLeft = isKeyDown(SDL_SCANCODE_A) || isKeyDown(SDL_SCANCODE_LEFT);
  keys.turnRight = isKeyDown(SDL_SCANCODE_D) || isKeyDown(SDL_SCANCODE_RIGHT);
  keys.strafeLeft = isKeyDown(SDL_SCANCODE_Q);
  keys.strafeRight = isKeyDown(SDL_SCANCODE_E);

  for (const auto& [leftStick, rightStick] : m_joystickValues) {
    keys.forward = keys.forward || leftStick.getY() < 0.0f;
    keys.back = keys.back || leftStick.getY() > 0.0f;
    keys.strafeLeft = keys.strafeLeft || leftStick.getX() < 0.0f;
    keys.strafeRight = keys.strafeRight || leftStick.getX() > 0.0f;
    keys.turnLeft = keys.turnLeft || rightStick.getX() < 0.0f;
    keys.turnRight = keys.turnRight || rightStick.getX() > 0.0f;
  }
  return keys;
}

NightCage::MovementIntent InputManager::composeIntent(const MovementKeys& keys, float mouseDeltaX,
                                                      float sensitivity) {
  NightCage::MovementIntent intent;
  intent.forward = static_cast<float>(keys.forward) - static_cast<float>(keys.back);
  intent.strafe = static_cast<float>(keys.strafeRight) - static_cast<float>(keys.strafeLeft);
  intent.turn = static_cast<float>(keys.turnRight) - static_cast<float>(keys.turnLeft);
  intent.mouseYaw = mouseDeltaX * sensitivity;
  return intent;
}

NightCage::MovementIntent InputManager::pollMovementIntent() {
  const Vector2D delta = consumeMouseDelta();
  return composeIntent(getMovementKeys(), delta.getX(), m_mouseSensitivity);
}

void InputManager::onKeyDown(const SDL_Event& event) {
  m_keystates = SDL_GetKeyboardState(nullptr);

  if (event.key.repeat) {
    return;
  }
  bool alreadyTracked = std::any_of(m_pressedThisFrame.begin(), m_pressedThisFrame.end(),
                                    [scancode = event.key.scancode](SDL_Scancode pressedKey) {
                                      return pressedKey == scancode;
                                    });
  if (!alreadyTracked) {
    m_pressedThisFrame.push_back(event.key.scancode);
  }
}

void InputManager::onKeyUp(const SDL_Event& /*event*/) {
  m_keystates = SDL_GetKeyboardState(nullptr);
}

void InputManager::onMouseMove(const SDL_Event& event) {
  m_mousePosition.setX(event.motion.x);
  m_mousePosition.setY(event.motion.y);
  m_mouseDelta += Vector2D(event.motion.xrel, event.motion.yrel);
}

void InputManager::onMouseButtonDown(const SDL_Event& event) {
  if (event.button.button == SDL_BUTTON_LEFT) {
    m_mouseButtonStates[LEFT] = true;
    INPUT_DEBUG("Mouse button Left clicked!");
  }
  if (event.button.button == SDL_BUTTON_MIDDLE) {
    m_mouseButtonStates[MIDDLE] = true;
  }
  if (event.button.button == SDL_BUTTON_RIGHT) {
    m_mouseButtonStates[RIGHT] = true;
  }
}

void InputManager::onMouseButtonUp(const SDL_Event& event) {
  if (event.button.button == SDL_BUTTON_LEFT) {
    m_mouseButtonStates[LEFT] = false;
  }
  if (event.button.button == SDL_BUTTON_MIDDLE) {
    m_mouseButtonStates[MIDDLE] = false;
  }
  if (event.button.button == SDL_BUTTON_RIGHT) {
    m_mouseButtonStates[RIGHT] = false;
  }
}

int InputManager::gamepadIndex(SDL_JoystickID id) const {
  for (size_t i = 0; i < m_joysticks.size(); i++) {
    if (SDL_GetGamepadID(m_joysticks[i]) == id) {
      return static_cast<int>(i);
    }
  }
  return -1;
}

void InputManager::onGamepadAxisMove(const SDL_Event& event) {
  const int whichOne = gamepadIndex(event.gaxis.which);
  if (whichOne < 0 || whichOne >= static_cast<int>(m_joystickValues.size())) {
    return;
  }

  float value = 0.0f;
  if (event.gaxis.value > m_joystickDeadZone) {
    value = 1.0f;
  } else if (event.gaxis.value < -m_joystickDeadZone) {
    value = -1.0f;
  }

  auto& [leftStick, rightStick] = m_joystickValues[whichOne];
  switch (event.gaxis.axis) {
    case SDL_GAMEPAD_AXIS_LEFTX: leftStick.setX(value); break;
    case SDL_GAMEPAD_AXIS_LEFTY: leftStick.setY(value); break;
    case SDL_GAMEPAD_AXIS_RIGHTX: rightStick.setX(value); break;
    case SDL_GAMEPAD_AXIS_RIGHTY: rightStick.setY(value); break;
    default: break;
  }
}

void InputManager::onGamepadButtonDown(const SDL_Event& event) {
  if (static_cast<int>(event.gbutton.button) >= SDL_GAMEPAD_BUTTON_COUNT) {
    return;
  }

  const auto button = static_cast<SDL_GamepadButton>(event.gbutton.button);
  if (!wasButtonPressed(button)) {
    m_buttonsPressedThisFrame.push_back(button);
  }
  INPUT_DEBUG(std::format("Gamepad {} button {} pressed", static_cast<int>(event.gbutton.which),
                          static_cast<int>(event.gbutton.button)));
}

void InputManager::clean() {
  if (m_isShutdown) {
    return;
  }

  if (m_gamePadInitialized) {
    int gamepadCount{0};
    for (auto& gamepad : m_joysticks) {
      if (gamepad) {
        SDL_CloseGamepad(gamepad);
        gamepadCount++;
      }
    }

    m_joysticks.clear();
    m_joystickValues.clear();
    m_gamePadInitialized = false;
    SDL_QuitSubSystem(SDL_INIT_GAMEPAD);
    INPUT_INFO(std::format("{} gamepads freed", gamepadCount));
  }

  m_buttonsPressedThisFrame.clear();
  m_mouseButtonStates.assign(3, false);
  m_mouseDelta = Vector2D(0, 0);
  m_keystates = nullptr;

  m_isShutdown = true;
  INPUT_INFO("InputManager resources cleaned");
}
