/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE SettingsManagerTests
#include <boost/test/unit_test.hpp>
#include "managers/SettingsManager.hpp"
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <thread>

using namespace NightCage;

struct SettingsTestFixture {
    const std::filesystem::path testDir =
        std::filesystem::temp_directory_path() / "nightcage_settings_tests";
    const std::string testFile = (testDir / "test_settings.json").string();

    SettingsTestFixture() {
        std::filesystem::create_directories(testDir);
        SettingsManager::Instance().clearAll();
    }

    ~SettingsTestFixture() {
        std::error_code ec;
        std::filesystem::remove_all(testDir, ec);
    }

    void createTestFile(const std::string& content) {
        std::ofstream file(testFile);
        file << content;
    }
};

BOOST_FIXTURE_TEST_SUITE(SettingsManagerTestSuite, SettingsTestFixture)

BOOST_AUTO_TEST_CASE(TestGetSetInt) {
    auto& settings = SettingsManager::Instance();

    BOOST_CHECK(settings.set("graphics", "resolution_width", 1920));
    BOOST_CHECK_EQUAL(settings.get<int>("graphics", "resolution_width", 0), 1920);

    // Default when the key doesn't exist
    BOOST_CHECK_EQUAL(settings.get<int>("graphics", "nonexistent", 42), 42);
}

BOOST_AUTO_TEST_CASE(TestGetSetFloat) {
    auto& settings = SettingsManager::Instance();

    BOOST_CHECK(settings.set("gameplay", "mouse_sensitivity", 0.004f));
    BOOST_CHECK_CLOSE(settings.get<float>("gameplay", "mouse_sensitivity", 0.0f), 0.004f, 0.001f);

    BOOST_CHECK_CLOSE(settings.get<float>("gameplay", "nonexistent", 1.0f), 1.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestGetSetBool) {
    auto& settings = SettingsManager::Instance();

    BOOST_CHECK(settings.set("graphics", "vsync", true));
    BOOST_CHECK_EQUAL(settings.get<bool>("graphics", "vsync", false), true);

    BOOST_CHECK(settings.set("graphics", "vsync", false));
    BOOST_CHECK_EQUAL(settings.get<bool>("graphics", "vsync", true), false);
}

BOOST_AUTO_TEST_CASE(TestGetSetString) {
    auto& settings = SettingsManager::Instance();

    BOOST_CHECK(settings.set("save", "progression_file", std::string("saves/progress.json")));
    BOOST_CHECK_EQUAL(settings.get<std::string>("save", "progression_file", ""), "saves/progress.json");

    // String literals are stored as strings
    BOOST_CHECK(settings.set("save", "slot", "alpha"));
    BOOST_CHECK_EQUAL(settings.get<std::string>("save", "slot", ""), "alpha");

    BOOST_CHECK_EQUAL(settings.get<std::string>("save", "nonexistent", "default"), "default");
}

BOOST_AUTO_TEST_CASE(TestHasMethod) {
    auto& settings = SettingsManager::Instance();

    settings.set("test", "key", 42);

    BOOST_CHECK(settings.has("test", "key"));
    BOOST_CHECK(!settings.has("test", "nonexistent"));
    BOOST_CHECK(!settings.has("nonexistent", "key"));
}

BOOST_AUTO_TEST_CASE(TestRemoveMethod) {
    auto& settings = SettingsManager::Instance();

    settings.set("test", "key1", 1);
    settings.set("test", "key2", 2);

    BOOST_CHECK(settings.remove("test", "key1"));
    BOOST_CHECK(!settings.has("test", "key1"));
    BOOST_CHECK(settings.has("test", "key2"));

    BOOST_CHECK(!settings.remove("test", "nonexistent"));
}

BOOST_AUTO_TEST_CASE(TestClearAll) {
    auto& settings = SettingsManager::Instance();

    settings.set("cat1", "key1", 1);
    settings.set("cat2", "key2", 2);

    settings.clearAll();

    BOOST_CHECK(!settings.has("cat1", "key1"));
    BOOST_CHECK(!settings.has("cat2", "key2"));
    BOOST_CHECK(settings.getCategories().empty());
}

BOOST_AUTO_TEST_CASE(TestGetCategories) {
    auto& settings = SettingsManager::Instance();

    settings.set("graphics", "key", 1);
    settings.set("gameplay", "key", 2);
    settings.set("save", "key", 3);

    auto categories = settings.getCategories();
    std::sort(categories.begin(), categories.end());

    BOOST_REQUIRE_EQUAL(categories.size(), 3u);
    BOOST_CHECK_EQUAL(categories[0], "gameplay");
    BOOST_CHECK_EQUAL(categories[1], "graphics");
    BOOST_CHECK_EQUAL(categories[2], "save");
}

BOOST_AUTO_TEST_CASE(TestLoadFromFile) {
    auto& settings = SettingsManager::Instance();

    createTestFile(R"({
  "graphics": {
    "resolution_width": 1920,
    "resolution_height": 1080,
    "vsync": true,
    "render_scale": 0.75
  },
  "gameplay": {
    "fov_degrees": 70,
    "mouse_sensitivity": 0.003,
    "max_level": 5
  },
  "save": {
    "progression_file": "res/progression.json"
  }
})");

    BOOST_REQUIRE(settings.loadFromFile(testFile));

    BOOST_CHECK_EQUAL(settings.get<int>("graphics", "resolution_width", 0), 1920);
    BOOST_CHECK_EQUAL(settings.get<int>("graphics", "resolution_height", 0), 1080);
    BOOST_CHECK_EQUAL(settings.get<bool>("graphics", "vsync", false), true);
    BOOST_CHECK_CLOSE(settings.get<float>("graphics", "render_scale", 0.0f), 0.75f, 0.001f);
    BOOST_CHECK_CLOSE(settings.get<float>("gameplay", "mouse_sensitivity", 0.0f), 0.003f, 0.001f);
    BOOST_CHECK_EQUAL(settings.get<int>("gameplay", "max_level", 10), 5);
    BOOST_CHECK_EQUAL(settings.get<std::string>("save", "progression_file", ""), "res/progression.json");
}

BOOST_AUTO_TEST_CASE(TestWholeNumberReadsAsFloat) {
    auto& settings = SettingsManager::Instance();

    // "fov_degrees": 70 parses as an int
    createTestFile(R"({ "gameplay": { "fov_degrees": 70 } })");
    BOOST_REQUIRE(settings.loadFromFile(testFile));

    BOOST_CHECK_EQUAL(settings.get<int>("gameplay", "fov_degrees", 0), 70);
    BOOST_CHECK_CLOSE(settings.get<float>("gameplay", "fov_degrees", 0.0f), 70.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestSaveToFile) {
    auto& settings = SettingsManager::Instance();

    settings.set("graphics", "resolution_width", 1024);
    settings.set("graphics", "fullscreen", true);
    settings.set("gameplay", "mouse_sensitivity", 0.0025f);
    settings.set("save", "progression_file", std::string("a \"quoted\" path.json"));

    BOOST_REQUIRE(settings.saveToFile(testFile));
    BOOST_CHECK(std::filesystem::exists(testFile));

    settings.clearAll();
    BOOST_REQUIRE(settings.loadFromFile(testFile));

    BOOST_CHECK_EQUAL(settings.get<int>("graphics", "resolution_width", 0), 1024);
    BOOST_CHECK_EQUAL(settings.get<bool>("graphics", "fullscreen", false), true);
    BOOST_CHECK_CLOSE(settings.get<float>("gameplay", "mouse_sensitivity", 0.0f), 0.0025f, 0.001f);
    BOOST_CHECK_EQUAL(settings.get<std::string>("save", "progression_file", ""), "a \"quoted\" path.json");
}

BOOST_AUTO_TEST_CASE(TestThreadSafety) {
    auto& settings = SettingsManager::Instance();

    const int numThreads = 8;
    const int operationsPerThread = 100;

    std::vector<std::thread> threads;
    std::atomic<int> failures{0};

    for (int t = 0; t < numThreads; ++t) {
        threads.emplace_back([&settings, &failures, t, count = operationsPerThread]() {
            for (int i = 0; i < count; ++i) {
                std::string category = "category" + std::to_string(t);
                std::string key = "key" + std::to_string(i);

                settings.set(category, key, i * t);
                if (settings.get<int>(category, key, -1) == -1 || !settings.has(category, key)) {
                    failures++;
                }
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    BOOST_CHECK_EQUAL(failures.load(), 0);
    for (int t = 0; t < numThreads; ++t) {
        std::string category = "category" + std::to_string(t);
        for (int i = 0; i < operationsPerThread; ++i) {
            BOOST_CHECK(settings.has(category, "key" + std::to_string(i)));
        }
    }
}

BOOST_AUTO_TEST_CASE(TestInvalidFile) {
    auto& settings = SettingsManager::Instance();

    BOOST_CHECK(!settings.loadFromFile((testDir / "nonexistent_file.json").string()));

    createTestFile("{ invalid json }");
    BOOST_CHECK(!settings.loadFromFile(testFile));
}

BOOST_AUTO_TEST_CASE(TestTypeMismatch) {
    auto& settings = SettingsManager::Instance();

    settings.set("test", "value", 42);
    settings.set("test", "ratio", 0.5f);

    // Mismatched reads fall back to the default
    BOOST_CHECK_EQUAL(settings.get<bool>("test", "value", true), true);
    BOOST_CHECK_EQUAL(settings.get<std::string>("test", "value", "default"), "default");
    BOOST_CHECK_EQUAL(settings.get<int>("test", "ratio", 7), 7);
}

BOOST_AUTO_TEST_SUITE_END()
