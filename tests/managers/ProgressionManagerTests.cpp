/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE ProgressionManagerTests
#include <boost/test/unit_test.hpp>

#include "managers/ProgressionManager.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>

using namespace NightCage;

struct ProgressionFixture {
    const std::filesystem::path testDir =
        std::filesystem::temp_directory_path() / "nightcage_progression_tests";
    const std::string saveFile = (testDir / "saves" / "progression.json").string();
    ProgressionManager& progression = ProgressionManager::Instance();

    ProgressionFixture() {
        std::error_code ec;
        std::filesystem::remove_all(testDir, ec);
        progression.setSaveFile(saveFile);
        progression.resetProgress();
    }

    ~ProgressionFixture() {
        std::error_code ec;
        std::filesystem::remove_all(testDir, ec);
    }

    void writeSave(const std::string& content) {
        std::filesystem::create_directories(std::filesystem::path(saveFile).parent_path());
        std::ofstream file(saveFile);
        file << content;
    }
};

BOOST_FIXTURE_TEST_SUITE(ProgressionManagerTestSuite, ProgressionFixture)

BOOST_AUTO_TEST_CASE(TestFreshDefaults) {
    const auto stats = progression.getStats();
    BOOST_CHECK_EQUAL(stats.level, 1);
    BOOST_CHECK_EQUAL(stats.experience, 0);
    BOOST_CHECK_EQUAL(stats.totalRuns, 0);
    BOOST_CHECK_EQUAL(stats.artifacts, 0u);

    const Upgrades& upgrades = progression.getUpgrades();
    BOOST_CHECK_EQUAL(upgrades.candleDuration, 1.0f);
    BOOST_CHECK_EQUAL(upgrades.perception, 1.0f);
    BOOST_CHECK_EQUAL(upgrades.movementSpeed, 1.0f);
    BOOST_CHECK_EQUAL(upgrades.shadowEvasion, 1.0f);

    BOOST_REQUIRE_EQUAL(progression.getData().unlockedThemes.size(), 1u);
    BOOST_CHECK_EQUAL(progression.getData().unlockedThemes.front(), "default");
    BOOST_CHECK(!progression.getLastRun().has_value());
}

BOOST_AUTO_TEST_CASE(TestExperienceAndLevels) {
    BOOST_CHECK(!progression.awardExperience(60, false));
    BOOST_CHECK_EQUAL(progression.getStats().experience, 60);

    BOOST_CHECK(progression.awardExperience(60, true));
    BOOST_CHECK_EQUAL(progression.getStats().level, 2);
    BOOST_CHECK_EQUAL(progression.getStats().experience, 20);
    BOOST_CHECK_EQUAL(progression.getStats().totalRuns, 2);
    BOOST_CHECK_EQUAL(progression.getStats().totalEscapes, 1);

    // One level per award, the rest carries over
    BOOST_CHECK(progression.awardExperience(1000, false));
    BOOST_CHECK_EQUAL(progression.getStats().level, 3);
    BOOST_CHECK_EQUAL(progression.getStats().experience, 820);

    // Negative awards still count the run
    BOOST_CHECK(!progression.awardExperience(-50, false));
    BOOST_CHECK_EQUAL(progression.getStats().experience, 820);
    BOOST_CHECK_EQUAL(progression.getStats().totalRuns, 4);
}

BOOST_AUTO_TEST_CASE(TestRunExperienceFormulas) {
    BOOST_CHECK_EQUAL(ProgressionManager::victoryExperience(60000, 5), 1000 + 540 + 50);
    BOOST_CHECK_EQUAL(ProgressionManager::victoryExperience(700000, 2), 1000 + 20);
    BOOST_CHECK_EQUAL(ProgressionManager::victoryExperience(599500, 0), 1000);
    BOOST_CHECK_EQUAL(ProgressionManager::deathExperience(3), 30);
    BOOST_CHECK_EQUAL(ProgressionManager::deathExperience(-1), 0);
}

BOOST_AUTO_TEST_CASE(TestFinishVictoriousRun) {
    RunStats run;
    run.escaped = true;
    run.timeMs = 90000;
    run.itemsCollected = 12;

    const RunSummary summary = progression.finishRun(run, 10);

    BOOST_CHECK(summary.victory);
    BOOST_CHECK_EQUAL(summary.levelReached, 10);
    BOOST_CHECK_EQUAL(summary.experienceGained, ProgressionManager::victoryExperience(90000, 12));
    BOOST_CHECK(summary.leveledUp);
    BOOST_CHECK(std::find(summary.newAchievements.begin(), summary.newAchievements.end(), "first_escape") !=
                summary.newAchievements.end());
    BOOST_CHECK(progression.hasAchievement("speed_run"));
    BOOST_CHECK(progression.hasAchievement("collector"));
    BOOST_CHECK(!progression.hasAchievement("survivor"));

    BOOST_CHECK_EQUAL(progression.getData().totalPlayTimeMs, 90000);
    BOOST_REQUIRE(progression.getLastRun().has_value());
    BOOST_CHECK_EQUAL(progression.getLastRun()->itemsCollected, 12);

    // Booking a run writes the save, creating its directory
    BOOST_CHECK(std::filesystem::exists(saveFile));
}

BOOST_AUTO_TEST_CASE(TestFinishDeathRun) {
    RunStats run;
    run.escaped = false;
    run.timeMs = 30000;
    run.itemsCollected = 2;

    const RunSummary summary = progression.finishRun(run, 3, "shadow_creature");
    BOOST_CHECK(!summary.victory);
    BOOST_CHECK_EQUAL(summary.deathCause, "shadow_creature");
    BOOST_CHECK_EQUAL(summary.experienceGained, 20);
    BOOST_CHECK(!summary.leveledUp);
    BOOST_CHECK(summary.newAchievements.empty());
    BOOST_CHECK_EQUAL(progression.getStats().totalEscapes, 0);
}

BOOST_AUTO_TEST_CASE(TestAchievementsUnlockOnce) {
    RunStats slowEscape;
    slowEscape.escaped = true;
    slowEscape.timeMs = 200000;

    for (int i = 0; i < ProgressionManager::SURVIVOR_ESCAPES; ++i) {
        progression.finishRun(slowEscape, 10);
    }
    BOOST_CHECK(progression.hasAchievement("first_escape"));
    BOOST_CHECK(progression.hasAchievement("survivor"));
    BOOST_CHECK(progression.hasAchievement("explorer"));
    BOOST_CHECK(!progression.hasAchievement("speed_run"));

    const auto& achievements = progression.getData().achievements;
    BOOST_CHECK_EQUAL(std::count(achievements.begin(), achievements.end(), "first_escape"), 1);
    BOOST_CHECK(!progression.unlockAchievement("survivor"));
}

BOOST_AUTO_TEST_CASE(TestUpgradeShop) {
    BOOST_CHECK(!progression.applyUpgrade(UpgradeType::MovementSpeed));
    BOOST_CHECK_EQUAL(progression.getUpgrades().movementSpeed, 1.0f);

    progression.awardExperience(80, false);
    BOOST_CHECK(progression.applyUpgrade(UpgradeType::MovementSpeed));
    BOOST_CHECK_CLOSE(progression.getUpgrades().movementSpeed, 1.1f, 0.001f);
    BOOST_CHECK_EQUAL(progression.getStats().experience, 30);
    BOOST_CHECK(!progression.applyUpgrade(UpgradeType::Perception));

    const auto offers = progression.getAvailableUpgrades();
    BOOST_REQUIRE_EQUAL(offers.size(), 4u);
    for (const UpgradeOffer& offer : offers) {
        BOOST_CHECK_EQUAL(offer.cost, ProgressionManager::UPGRADE_COST);
        BOOST_CHECK_EQUAL(offer.current, progression.getUpgrades().get(offer.type));
        BOOST_CHECK(!offer.name.empty());
    }
}

BOOST_AUTO_TEST_CASE(TestArtifactsAreUnique) {
    BOOST_CHECK(progression.addArtifact("Artifact 1"));
    BOOST_CHECK(!progression.addArtifact("Artifact 1"));
    BOOST_CHECK(progression.addArtifact("Artifact 2"));
    BOOST_CHECK_EQUAL(progression.getStats().artifacts, 2u);
}

BOOST_AUTO_TEST_CASE(TestSaveAndLoad) {
    progression.awardExperience(250, true);
    progression.addArtifact("Artifact 3");
    progression.unlockUpgrade(UpgradeType::Perception, 0.3f);
    progression.unlockAchievement("collector");
    progression.addPlayTime(123456);
    BOOST_REQUIRE(progression.save());

    const ProgressionData before = progression.getData();
    progression.fromJson(JsonValue());
    BOOST_CHECK_EQUAL(progression.getStats().level, 1);

    BOOST_REQUIRE(progression.load());
    const ProgressionData& after = progression.getData();
    BOOST_CHECK_EQUAL(after.level, before.level);
    BOOST_CHECK_EQUAL(after.experience, before.experience);
    BOOST_CHECK_EQUAL(after.totalRuns, before.totalRuns);
    BOOST_CHECK_EQUAL(after.totalEscapes, before.totalEscapes);
    BOOST_CHECK_EQUAL(after.totalPlayTimeMs, 123456);
    BOOST_CHECK(after.artifacts == before.artifacts);
    BOOST_CHECK(after.achievements == before.achievements);
    BOOST_CHECK_CLOSE(after.upgrades.perception, 1.3f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestMissingAndMalformedFiles) {
    progression.awardExperience(40, false);

    BOOST_CHECK(!progression.loadFromFile((testDir / "missing.json").string()));
    BOOST_CHECK_EQUAL(progression.getStats().experience, 0);

    writeSave("{ \"level\": 4, ");
    BOOST_CHECK(!progression.load());
    BOOST_CHECK_EQUAL(progression.getStats().level, 1);
}

BOOST_AUTO_TEST_CASE(TestTolerantFieldParsing) {
    writeSave(R"({
        "level": "seven",
        "experience": -20,
        "totalRuns": 5,
        "artifacts": ["Artifact 1", 3, "Artifact 1", "Artifact 2"],
        "upgrades": { "perception": 1.5, "movementSpeed": "fast", "shadowEvasion": -1, "flight": 2 },
        "unlockedThemes": ["crypt"],
        "somethingElse": true
    })");

    BOOST_REQUIRE(progression.load());
    const ProgressionData& data = progression.getData();
    BOOST_CHECK_EQUAL(data.level, 1);
    BOOST_CHECK_EQUAL(data.experience, 0);
    BOOST_CHECK_EQUAL(data.totalRuns, 5);
    BOOST_REQUIRE_EQUAL(data.artifacts.size(), 2u);
    BOOST_CHECK_EQUAL(data.artifacts[1], "Artifact 2");
    BOOST_CHECK_CLOSE(data.upgrades.perception, 1.5f, 0.001f);
    BOOST_CHECK_EQUAL(data.upgrades.movementSpeed, 1.0f);
    BOOST_CHECK_EQUAL(data.upgrades.shadowEvasion, 1.0f);
    BOOST_REQUIRE_EQUAL(data.unlockedThemes.size(), 2u);
    BOOST_CHECK_EQUAL(data.unlockedThemes[0], "default");
    BOOST_CHECK_EQUAL(data.unlockedThemes[1], "crypt");
}

BOOST_AUTO_TEST_CASE(TestOutOfRangeNumbersAreClamped) {
    writeSave(R"({
        "level": 1e12,
        "experience": 2147483647,
        "totalRuns": -1e300,
        "totalEscapes": 1e20,
        "totalPlayTimeMs": 1e30
    })");

    BOOST_REQUIRE(progression.load());
    const ProgressionData& data = progression.getData();
    BOOST_CHECK_EQUAL(data.level, ProgressionManager::MAX_LEVEL);
    BOOST_CHECK_EQUAL(data.experience, ProgressionManager::MAX_COUNTER);
    BOOST_CHECK_EQUAL(data.totalRuns, 0);
    BOOST_CHECK_EQUAL(data.totalEscapes, ProgressionManager::MAX_COUNTER);
    BOOST_CHECK_EQUAL(data.totalPlayTimeMs, ProgressionManager::MAX_PLAY_TIME_MS);

    // Counters saturate instead of wrapping
    BOOST_CHECK(!progression.awardExperience(10, true));
    BOOST_CHECK_EQUAL(progression.getData().level, ProgressionManager::MAX_LEVEL);
    BOOST_CHECK_EQUAL(progression.getData().experience, ProgressionManager::MAX_COUNTER);
    BOOST_CHECK_EQUAL(progression.getData().totalEscapes, ProgressionManager::MAX_COUNTER);
    BOOST_CHECK_EQUAL(progression.getData().totalRuns, 1);
}

BOOST_AUTO_TEST_CASE(TestHugeLevelStillLevelsUp) {
    writeSave(R"({ "level": 2147483647, "experience": -1e300 })");

    BOOST_REQUIRE(progression.load());
    BOOST_CHECK_EQUAL(progression.getData().level, ProgressionManager::MAX_LEVEL);
    BOOST_CHECK_EQUAL(progression.getData().experience, 0);

    writeSave(R"({ "level": 999999 })");
    BOOST_REQUIRE(progression.load());
    BOOST_CHECK(!progression.awardExperience(10, false));
    BOOST_CHECK(progression.awardExperience(999999 * ProgressionManager::XP_PER_LEVEL, false));
    BOOST_CHECK_EQUAL(progression.getData().level, ProgressionManager::MAX_LEVEL);
    BOOST_CHECK_EQUAL(progression.getData().experience, 10);
}

BOOST_AUTO_TEST_CASE(TestResetProgress) {
    progression.awardExperience(500, true);
    progression.unlockAchievement("collector");
    progression.resetProgress();

    BOOST_CHECK_EQUAL(progression.getStats().level, 1);
    BOOST_CHECK_EQUAL(progression.getStats().achievements, 0u);
    BOOST_CHECK(!progression.getLastRun().has_value());
}

BOOST_AUTO_TEST_CASE(TestUpgradeKeys) {
    BOOST_CHECK_EQUAL(upgradeKey(UpgradeType::CandleDuration), "candleDuration");
    BOOST_CHECK_EQUAL(upgradeKey(UpgradeType::ShadowEvasion), "shadowEvasion");
    BOOST_REQUIRE(upgradeFromKey("movementSpeed").has_value());
    BOOST_CHECK(*upgradeFromKey("movementSpeed") == UpgradeType::MovementSpeed);
    BOOST_CHECK(!upgradeFromKey("flight").has_value());
}

BOOST_AUTO_TEST_SUITE_END()
