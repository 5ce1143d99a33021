/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE InputManagerTests
#include <boost/test/unit_test.hpp>

#include <SDL3/SDL.h>
#include "managers/InputManager.hpp"
#include "utils/Vector2D.hpp"

// Events are routed straight into the handlers, no SDL event queue involved
struct InputManagerTestFixture {
    InputManager& input = InputManager::Instance();

    InputManagerTestFixture() {
        input.reset();
        input.setMouseSensitivity(InputManager::DEFAULT_MOUSE_SENSITIVITY);
    }

    ~InputManagerTestFixture() {
        input.reset();
    }

    static SDL_Event mouseMotion(float x, float y, float xrel, float yrel) {
        SDL_Event event;
        SDL_zero(event);
        event.type = SDL_EVENT_MOUSE_MOTION;
        event.motion.x = x;
        event.motion.y = y;
        event.motion.xrel = xrel;
        event.motion.yrel = yrel;
        return event;
    }

    static SDL_Event mouseButton(Uint8 button, bool isDown) {
        SDL_Event event;
        SDL_zero(event);
        event.type = isDown ? SDL_EVENT_MOUSE_BUTTON_DOWN : SDL_EVENT_MOUSE_BUTTON_UP;
        event.button.button = button;
        event.button.clicks = 1;
        return event;
    }

    static SDL_Event gamepadButton(SDL_GamepadButton button) {
        SDL_Event event;
        SDL_zero(event);
        event.type = SDL_EVENT_GAMEPAD_BUTTON_DOWN;
        event.gbutton.which = 1;
        event.gbutton.button = static_cast<Uint8>(button);
        event.gbutton.down = true;
        return event;
    }
};

BOOST_FIXTURE_TEST_SUITE(InputManagerTests, InputManagerTestFixture)

BOOST_AUTO_TEST_CASE(TestComposeIntentFromKeys) {
    MovementKeys keys;
    keys.forward = true;
    keys.strafeLeft = true;
    keys.turnRight = true;

    const NightCage::MovementIntent intent = InputManager::composeIntent(keys, 0.0f, 0.002f);
    BOOST_CHECK_EQUAL(intent.forward, 1.0f);
    BOOST_CHECK_EQUAL(intent.strafe, -1.0f);
    BOOST_CHECK_EQUAL(intent.turn, 1.0f);
    BOOST_CHECK_EQUAL(intent.mouseYaw, 0.0f);
    BOOST_CHECK(intent.hasTranslation());
}

BOOST_AUTO_TEST_CASE(TestOpposingKeysCancel) {
    MovementKeys keys;
    keys.forward = true;
    keys.back = true;
    keys.turnLeft = true;
    keys.turnRight = true;

    const NightCage::MovementIntent intent = InputManager::composeIntent(keys, 0.0f, 0.002f);
    BOOST_CHECK_EQUAL(intent.forward, 0.0f);
    BOOST_CHECK_EQUAL(intent.turn, 0.0f);
    BOOST_CHECK(!intent.hasTranslation());
}

BOOST_AUTO_TEST_CASE(TestMouseYawScalesWithSensitivity) {
    const NightCage::MovementIntent intent = InputManager::composeIntent(MovementKeys{}, -150.0f, 0.004f);
    BOOST_CHECK_CLOSE(intent.mouseYaw, -0.6f, 0.001f);
    BOOST_CHECK(!intent.hasTranslation());
}

BOOST_AUTO_TEST_CASE(TestSensitivity) {
    BOOST_CHECK_CLOSE(input.getMouseSensitivity(), InputManager::DEFAULT_MOUSE_SENSITIVITY, 0.001f);

    input.setMouseSensitivity(0.005f);
    BOOST_CHECK_CLOSE(input.getMouseSensitivity(), 0.005f, 0.001f);

    // Negative values are rejected
    input.setMouseSensitivity(-1.0f);
    BOOST_CHECK_CLOSE(input.getMouseSensitivity(), 0.005f, 0.001f);

    input.setMouseSensitivity(0.0f);
    BOOST_CHECK_EQUAL(input.getMouseSensitivity(), 0.0f);
}

BOOST_AUTO_TEST_CASE(TestMouseMotionAccumulates) {
    input.onMouseMove(mouseMotion(100.0f, 50.0f, 12.0f, -3.0f));
    input.onMouseMove(mouseMotion(110.0f, 48.0f, 8.0f, -2.0f));

    BOOST_CHECK_EQUAL(input.getMousePosition().getX(), 110.0f);
    BOOST_CHECK_EQUAL(input.getMousePosition().getY(), 48.0f);
    BOOST_CHECK_EQUAL(input.getMouseDelta().getX(), 20.0f);
    BOOST_CHECK_EQUAL(input.getMouseDelta().getY(), -5.0f);

    const Vector2D delta = input.consumeMouseDelta();
    BOOST_CHECK_EQUAL(delta.getX(), 20.0f);
    BOOST_CHECK_EQUAL(input.getMouseDelta().getX(), 0.0f);
    BOOST_CHECK_EQUAL(input.consumeMouseDelta().getY(), 0.0f);
}

BOOST_AUTO_TEST_CASE(TestPollConsumesMouseMotion) {
    input.setMouseSensitivity(0.01f);
    input.onMouseMove(mouseMotion(0.0f, 0.0f, 30.0f, 0.0f));

    const NightCage::MovementIntent first = input.pollMovementIntent();
    BOOST_CHECK_CLOSE(first.mouseYaw, 0.3f, 0.001f);

    // Motion turns the view once
    const NightCage::MovementIntent second = input.pollMovementIntent();
    BOOST_CHECK_EQUAL(second.mouseYaw, 0.0f);
}

BOOST_AUTO_TEST_CASE(TestMouseButtons) {
    input.onMouseButtonDown(mouseButton(SDL_BUTTON_LEFT, true));
    input.onMouseButtonDown(mouseButton(SDL_BUTTON_RIGHT, true));
    BOOST_CHECK(input.getMouseButtonState(LEFT));
    BOOST_CHECK(input.getMouseButtonState(RIGHT));
    BOOST_CHECK(!input.getMouseButtonState(MIDDLE));

    input.onMouseButtonUp(mouseButton(SDL_BUTTON_LEFT, false));
    BOOST_CHECK(!input.getMouseButtonState(LEFT));
    BOOST_CHECK(!input.getMouseButtonState(7));

    input.reset();
    BOOST_CHECK(!input.getMouseButtonState(RIGHT));
}

BOOST_AUTO_TEST_CASE(TestNoKeyboardOrGamepadState) {
    BOOST_CHECK(!input.isKeyDown(SDL_SCANCODE_W));
    BOOST_CHECK(!input.wasKeyPressed(SDL_SCANCODE_SPACE));
    BOOST_CHECK(!input.wasButtonPressed(SDL_GAMEPAD_BUTTON_SOUTH));

    const MovementKeys keys = input.getMovementKeys();
    BOOST_CHECK(!keys.forward && !keys.back && !keys.turnLeft && !keys.turnRight);
}

BOOST_AUTO_TEST_CASE(TestGamepadButtonPressedOncePerFrame) {
    input.onGamepadButtonDown(gamepadButton(SDL_GAMEPAD_BUTTON_START));
    input.onGamepadButtonDown(gamepadButton(SDL_GAMEPAD_BUTTON_START));
    input.onGamepadButtonDown(gamepadButton(SDL_GAMEPAD_BUTTON_SOUTH));

    BOOST_CHECK(input.wasButtonPressed(SDL_GAMEPAD_BUTTON_START));
    BOOST_CHECK(input.wasButtonPressed(SDL_GAMEPAD_BUTTON_SOUTH));
    BOOST_CHECK(!input.wasButtonPressed(SDL_GAMEPAD_BUTTON_EAST));

    input.update();
    BOOST_CHECK(!input.wasButtonPressed(SDL_GAMEPAD_BUTTON_START));
    BOOST_CHECK(!input.wasButtonPressed(SDL_GAMEPAD_BUTTON_SOUTH));
}

BOOST_AUTO_TEST_CASE(TestInvalidGamepadButtonIgnored) {
    SDL_Event event = gamepadButton(SDL_GAMEPAD_BUTTON_SOUTH);
    event.gbutton.button = static_cast<Uint8>(SDL_GAMEPAD_BUTTON_COUNT);
    input.onGamepadButtonDown(event);
    BOOST_CHECK(!input.wasButtonPressed(SDL_GAMEPAD_BUTTON_SOUTH));

    input.onGamepadButtonDown(gamepadButton(SDL_GAMEPAD_BUTTON_EAST));
    input.reset();
    BOOST_CHECK(!input.wasButtonPressed(SDL_GAMEPAD_BUTTON_EAST));
}

BOOST_AUTO_TEST_SUITE_END()
