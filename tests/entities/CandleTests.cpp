/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE CandleTests
#include <boost/test/unit_test.hpp>

#include "entities/Candle.hpp"
#include "entities/Inventory.hpp"
#include "rendering/RaycastRenderer.hpp"
#include <algorithm>

using namespace NightCage;

namespace {

// Burns in 60 Hz steps
bool burn(Candle& candle, Inventory& inventory, float seconds) {
    bool relit = false;
    const int steps = static_cast<int>(seconds * 60.0f + 0.5f);
    for (int i = 0; i < steps; ++i) {
        relit = candle.update(1.0f / 60.0f, inventory) || relit;
    }
    return relit;
}

} // namespace

BOOST_AUTO_TEST_SUITE(CandleTestSuite)

BOOST_AUTO_TEST_CASE(TestFreshCandle) {
    Candle candle;

    BOOST_CHECK_CLOSE(candle.getMaxFuel(), Candle::BASE_MAX_FUEL, 0.001f);
    BOOST_CHECK_CLOSE(candle.getFuel(), Candle::BASE_MAX_FUEL, 0.001f);
    BOOST_CHECK_CLOSE(candle.getFuelFraction(), 1.0f, 0.001f);
    BOOST_CHECK_CLOSE(candle.getLightRadius(), Candle::BASE_LIGHT_RADIUS, 0.001f);
    BOOST_CHECK_CLOSE(candle.getDepletionRate(), Candle::BASE_MAX_FUEL / Candle::BURN_SECONDS, 0.001f);
    BOOST_CHECK(!candle.isBurntOut());
}

BOOST_AUTO_TEST_CASE(TestFuelBurnsLinearly) {
    Candle candle;
    Inventory inventory;

    burn(candle, inventory, 30.0f);
    BOOST_CHECK_CLOSE(candle.getFuel(), 90.0f, 0.1f);
    BOOST_CHECK_CLOSE(candle.getIntensity(), 0.9f, 0.1f);
}

BOOST_AUTO_TEST_CASE(TestBurnsOutWithoutSpare) {
    Candle candle;
    Inventory inventory;

    BOOST_CHECK(!burn(candle, inventory, Candle::BURN_SECONDS + 1.0f));
    BOOST_CHECK(candle.isBurntOut());
    BOOST_CHECK_EQUAL(candle.getFuel(), 0.0f);
    BOOST_CHECK_EQUAL(inventory.lightSources, 1);

    // Fuel never goes negative
    candle.update(10.0f, inventory);
    BOOST_CHECK_EQUAL(candle.getFuel(), 0.0f);
}

BOOST_AUTO_TEST_CASE(TestSpareIsLitOnBurnout) {
    Candle candle;
    Inventory inventory;
    inventory.lightSources = 3;

    BOOST_CHECK(candle.update(Candle::BURN_SECONDS + 1.0f, inventory));
    BOOST_CHECK_EQUAL(inventory.lightSources, 2);
    BOOST_CHECK(!candle.isBurntOut());
    BOOST_CHECK_CLOSE(candle.getFuel(), candle.getMaxFuel(), 0.001f);
}

BOOST_AUTO_TEST_CASE(TestDurationUpgradeRaisesCapacity) {
    Candle candle(2.0f);
    Inventory inventory;

    BOOST_CHECK_CLOSE(candle.getMaxFuel(), Candle::BASE_MAX_FUEL * 2.0f, 0.001f);
    burn(candle, inventory, Candle::BURN_SECONDS);
    BOOST_CHECK(!candle.isBurntOut());
    BOOST_CHECK_CLOSE(candle.getFuelFraction(), 0.5f, 0.1f);
}

BOOST_AUTO_TEST_CASE(TestLightState) {
    Candle candle(1.0f, 1.4f);
    Inventory inventory;
    burn(candle, inventory, 150.0f);

    const LightState light = candle.getLightState();
    BOOST_CHECK_CLOSE(light.radius, Candle::BASE_LIGHT_RADIUS * 1.4f, 0.001f);
    BOOST_CHECK_CLOSE(light.intensity, 0.5f, 0.2f);
    BOOST_CHECK_EQUAL(light.flicker, candle.getFlicker().getAmount());
}

BOOST_AUTO_TEST_CASE(TestRefill) {
    Candle candle;
    Inventory inventory;
    burn(candle, inventory, 60.0f);
    candle.refill();
    BOOST_CHECK_CLOSE(candle.getFuel(), candle.getMaxFuel(), 0.001f);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(CandleFlickerTestSuite)

BOOST_AUTO_TEST_CASE(TestFlickerIsSeeded) {
    CandleFlicker a(99);
    CandleFlicker b(99);
    for (int i = 0; i < 500; ++i) {
        a.update(1.0f / 60.0f);
        b.update(1.0f / 60.0f);
        BOOST_REQUIRE_EQUAL(a.getAmount(), b.getAmount());
    }
}

BOOST_AUTO_TEST_CASE(TestFlickerStaysInRange) {
    CandleFlicker flicker(5);
    float peak = 0.0f;
    for (int i = 0; i < 5000; ++i) {
        flicker.update(1.0f / 60.0f);
        BOOST_REQUIRE_GE(flicker.getAmount(), 0.0f);
        BOOST_REQUIRE_LT(flicker.getAmount(), CandleFlicker::MAX_TARGET);
        peak = std::max(peak, flicker.getAmount());
    }
    BOOST_CHECK_GT(peak, 0.0f);
}

BOOST_AUTO_TEST_CASE(TestZeroStepAndReset) {
    CandleFlicker flicker(11);
    for (int i = 0; i < 300; ++i) {
        flicker.update(1.0f / 60.0f);
    }
    const float amount = flicker.getAmount();
    flicker.update(0.0f);
    BOOST_CHECK_EQUAL(flicker.getAmount(), amount);

    flicker.reset();
    BOOST_CHECK_EQUAL(flicker.getAmount(), 0.0f);
    BOOST_CHECK_EQUAL(flicker.getTarget(), 0.0f);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(InventoryTestSuite)

BOOST_AUTO_TEST_CASE(TestTotalsAndClear) {
    Inventory inventory;
    BOOST_CHECK_EQUAL(inventory.totalCollected(), 0);

    inventory.keys = 2;
    inventory.artifacts.push_back(4);
    inventory.notes.push_back(7);
    inventory.lightSources = 3;
    BOOST_CHECK_EQUAL(inventory.totalCollected(), 6);

    inventory.clear();
    BOOST_CHECK_EQUAL(inventory.totalCollected(), 0);
    BOOST_CHECK_EQUAL(inventory.lightSources, Inventory::STARTING_LIGHT_SOURCES);
}

BOOST_AUTO_TEST_SUITE_END()
