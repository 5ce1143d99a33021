/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef INPUT_MANAGER_HPP
#define INPUT_MANAGER_HPP

#include <SDL3/SDL.h>
#include <boost/container/small_vector.hpp>
#include "entities/Player.hpp"
#include "utils/Vector2D.hpp"

enum mouse_buttons { LEFT = 0, MIDDLE = 1, RIGHT = 2 };

// Digital movement state gathered from keyboard and gamepad
struct MovementKeys {
    bool forward{false};
    bool back{false};
    bool turnLeft{false};
    bool turnRight{false};
    bool strafeLeft{false};
    bool strafeRight{false};
};

class InputManager {
 public:
    static constexpr float DEFAULT_MOUSE_SENSITIVITY = 0.002f; // radians per pixel

    ~InputManager() {
        if (!m_isShutdown) {
            clean();
        }
    }

    static InputManager& Instance(){
        static InputManager instance;
        return instance;
    }

    // Initialize gamepad
    void initializeGamePad();

    // Update method
    void update();

    // Reset mouse button states and accumulated motion
    void reset();

    // Clean up
    void clean();

    // Check if InputManager has been shut down
    bool isShutdown() const { return m_isShutdown; }

    // Keyboard events
    bool isKeyDown(SDL_Scancode key) const;
    bool wasKeyPressed(SDL_Scancode key) const;  // True once per press
    void clearFrameInput();  // Call once per frame to clear pressed keys

    // Gamepad events, any connected pad counts
    bool wasButtonPressed(SDL_GamepadButton button) const;  // True once per press

    // Mouse events
    bool getMouseButtonState(int buttonNumber) const;
    const Vector2D& getMousePosition() const;
    // Relative motion accumulated since the last consumeMouseDelta()
    const Vector2D& getMouseDelta() const { return m_mouseDelta; }
    Vector2D consumeMouseDelta();

    void setMouseSensitivity(float sensitivity);
    float getMouseSensitivity() const { return m_mouseSensitivity; }

    // W/S or Up/Down move, A/D or Left/Right turn, Q/E strafe, left stick
    // moves and strafes, right stick turns
    MovementKeys getMovementKeys() const;

    // Movement intent for this frame; consumes the accumulated mouse motion
    NightCage::MovementIntent pollMovementIntent();

    static NightCage::MovementIntent composeIntent(const MovementKeys& keys, float mouseDeltaX,
                                                   float sensitivity);

    // Event routing, called from GameEngine::handleEvents()
    void onKeyDown(const SDL_Event& event);
    void onKeyUp(const SDL_Event& event);
    void onMouseMove(const SDL_Event& event);
    void onMouseButtonDown(const SDL_Event& event);
    void onMouseButtonUp(const SDL_Event& event);
    void onGamepadAxisMove(const SDL_Event& event);
    void onGamepadButtonDown(const SDL_Event& event);

 private:

    // Keyboard specific
    const bool* m_keystates{nullptr}; // Owned by SDL, don't delete
    boost::container::small_vector<SDL_Scancode, 16> m_pressedThisFrame{}; // Keys pressed this frame

    // Gamepad specific: left and right stick per pad, each axis in {-1, 0, 1}
    boost::container::small_vector<std::pair<Vector2D, Vector2D>, 4> m_joystickValues{};
    // Non-owning pointers to SDL_Gamepad objects, which are closed with SDL_CloseGamepad in clean()
    boost::container::small_vector<SDL_Gamepad*, 4> m_joysticks{};
    boost::container::small_vector<SDL_GamepadButton, 8> m_buttonsPressedThisFrame{};
    const int m_joystickDeadZone{10000};
    bool m_gamePadInitialized{false};

    // Mouse specific
    boost::container::small_vector<bool, 3> m_mouseButtonStates{};
    Vector2D m_mousePosition{0.0f, 0.0f};
    Vector2D m_mouseDelta{0.0f, 0.0f};
    float m_mouseSensitivity{DEFAULT_MOUSE_SENSITIVITY};

    // Shutdown state
    bool m_isShutdown{false};

    int gamepadIndex(SDL_JoystickID id) const;

    // Delete copy constructor and assignment operator
    InputManager(const InputManager&) = delete; // Prevent copying
    InputManager& operator=(const InputManager&) = delete; // Prevent assignment

    InputManager();
};

#endif  // INPUT_MANAGER_HPP
