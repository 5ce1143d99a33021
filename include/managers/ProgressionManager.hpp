/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef PROGRESSION_MANAGER_HPP
#define PROGRESSION_MANAGER_HPP

#include <boost/container/small_vector.hpp>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace NightCage {

class JsonValue;

enum class UpgradeType {
    CandleDuration,
    Perception,
    MovementSpeed,
    ShadowEvasion
};

// JSON key of an upgrade ("candleDuration", ...)
std::string_view upgradeKey(UpgradeType type);
std::optional<UpgradeType> upgradeFromKey(std::string_view key);

// Multipliers applied at level start, all 1.0 on a fresh save
struct Upgrades {
    float candleDuration{1.0f};
    float perception{1.0f};
    float movementSpeed{1.0f};
    float shadowEvasion{1.0f};

    float get(UpgradeType type) const;
    float& at(UpgradeType type);
};

struct ProgressionData {
    int level{1};
    int experience{0};
    int totalRuns{0};
    int totalEscapes{0};
    int64_t totalPlayTimeMs{0};
    std::vector<std::string> artifacts;
    Upgrades upgrades;
    std::vector<std::string> achievements;
    std::vector<std::string> unlockedThemes{"default"};
};

// Outcome of one run as the achievement checks see it
struct RunStats {
    bool escaped{false};
    int64_t timeMs{0};
    int itemsCollected{0};
};

struct UpgradeOffer {
    UpgradeType type{UpgradeType::CandleDuration};
    std::string_view name;
    std::string_view description;
    float current{1.0f};
    int cost{0};
};

struct ProgressionStats {
    int level{1};
    int experience{0};
    int totalRuns{0};
    int totalEscapes{0};
    size_t artifacts{0};
    size_t achievements{0};
};

// What the run summary screen shows
struct RunSummary {
    bool victory{false};
    int levelReached{1};
    int64_t timeMs{0};
    int itemsCollected{0};
    int experienceGained{0};
    bool leveledUp{false};
    std::vector<std::string> newAchievements;
    std::string deathCause;
};

/**
 * Meta-progression that survives between runs: experience and levels,
 * upgrade multipliers, artifacts and achievements.
 *
 * Persisted as JSON through JsonReader. Loading is tolerant: a missing or
 * malformed file leaves the defaults in place, wrongly typed fields keep
 * their defaults, unknown keys are ignored.
 */
class ProgressionManager {
public:
    static constexpr int XP_PER_LEVEL = 100;
    static constexpr int MAX_LEVEL = 1000000;
    static constexpr int MAX_COUNTER = std::numeric_limits<int>::max() / 2;
    static constexpr int64_t MAX_PLAY_TIME_MS = int64_t{1} << 50;
    static constexpr int UPGRADE_COST = 50;
    static constexpr float UPGRADE_STEP = 0.1f;
    static constexpr int XP_PER_ITEM = 10;
    static constexpr int VICTORY_BASE_XP = 1000;
    static constexpr int64_t VICTORY_TARGET_MS = 600000;
    static constexpr int64_t SPEED_RUN_MS = 120000;
    static constexpr int COLLECTOR_ITEMS = 10;
    static constexpr int SURVIVOR_ESCAPES = 10;
    static constexpr int64_t EXPLORER_PLAY_TIME_MS = 600000;

    static ProgressionManager& Instance() {
        static ProgressionManager instance;
        return instance;
    }

    void setSaveFile(const std::string& path) { m_saveFile = path; }
    const std::string& getSaveFile() const { return m_saveFile; }

    // Loads the configured save file; on any failure the defaults remain
    bool load();
    bool save() const;
    bool loadFromFile(const std::string& path);
    bool saveToFile(const std::string& path) const;

    JsonValue toJson() const;
    // Replaces the data with defaults overlaid by whatever fields are valid
    void fromJson(const JsonValue& root);

    // Adds experience, counts the run, and levels up at most once.
    // Returns true on level-up.
    bool awardExperience(int amount, bool escaped);
    void addPlayTime(int64_t ms);
    bool addArtifact(const std::string& artifactId);
    bool unlockUpgrade(UpgradeType type, float amount = UPGRADE_STEP);
    // Spends UPGRADE_COST experience on one UPGRADE_STEP
    bool applyUpgrade(UpgradeType type);
    bool unlockAchievement(const std::string& achievementId);
    bool hasAchievement(const std::string& achievementId) const;
    // Unlocks whatever this run earned, returns the newly unlocked ids
    std::vector<std::string> checkAchievements(const RunStats& runStats);

    boost::container::small_vector<UpgradeOffer, 4> getAvailableUpgrades() const;
    ProgressionStats getStats() const;
    const ProgressionData& getData() const { return m_data; }
    const Upgrades& getUpgrades() const { return m_data.upgrades; }

    static int victoryExperience(int64_t totalTimeMs, int itemsCollected);
    static int deathExperience(int itemsCollected);

    // Books a finished run: play time, experience, achievements, then saves
    RunSummary finishRun(const RunStats& runStats, int levelReached, const std::string& deathCause = "");
    const std::optional<RunSummary>& getLastRun() const { return m_lastRun; }

    void resetProgress();

private:
    ProgressionData m_data;
    std::string m_saveFile{"res/progression.json"};
    std::optional<RunSummary> m_lastRun;

    ProgressionManager() = default;
    ~ProgressionManager() = default;
    ProgressionManager(const ProgressionManager&) = delete;
    ProgressionManager& operator=(const ProgressionManager&) = delete;
};

} // namespace NightCage

#endif // PROGRESSION_MANAGER_HPP
