/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/ProgressionManager.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <format>
#include <initializer_list>
#include <optional>

namespace NightCage {

namespace {

JsonValue stringArray(const std::vector<std::string>& values) {
    JsonArray array;
    array.reserve(values.size());
    for (const std::string& value : values) {
        array.push_back(JsonValue(value));
    }
    return JsonValue(std::move(array));
}

// Copies the string elements of a JSON array, skipping anything else
bool readStringArray(const JsonValue& value, std::vector<std::string>& out) {
    const JsonArray* array = value.tryAsArray();
    if (array == nullptr) {
        return false;
    }
    out.clear();
    for (const JsonValue& element : *array) {
        if (auto text = element.tryAsString()) {
            if (std::find(out.begin(), out.end(), *text) == out.end()) {
                out.push_back(*text);
            }
        }
    }
    return true;
}

// Reads a number and clamps it into [low, high] before narrowing
template <typename T>
std::optional<T> readClamped(const JsonValue& value, T low, T high) {
    auto number = value.tryAsNumber();
    if (!number || std::isnan(*number)) {
        return std::nullopt;
    }
    const double clamped = std::clamp(*number, static_cast<double>(low), static_cast<double>(high));
    return static_cast<T>(clamped);
}

bool ensureParentDirectory(const std::string& path) {
    const std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (parent.empty()) {
        return true;
    }
    std::error_code error;
    std::filesystem::create_directories(parent, error);
    if (error) {
        PROGRESSION_ERROR(std::format("Could not create directory {}: {}", parent.string(), error.message()));
        return false;
    }
    return true;
}

} // namespace

std::string_view upgradeKey(UpgradeType type) {
    switch (type) {
    case UpgradeType::CandleDuration:
        return "candleDuration";
    case UpgradeType::Perception:
        return "perception";
    case UpgradeType::MovementSpeed:
        return "movementSpeed";
    case UpgradeType::ShadowEvasion:
        return "shadowEvasion";
    }
    return "unknown";
}

std::optional<UpgradeType> upgradeFromKey(std::string_view key) {
    for (UpgradeType type : {UpgradeType::CandleDuration, UpgradeType::Perception,
                             UpgradeType::MovementSpeed, UpgradeType::ShadowEvasion}) {
        if (upgradeKey(type) == key) {
            return type;
        }
    }
    return std::nullopt;
}

float Upgrades::get(UpgradeType type) const {
    switch (type) {
    case UpgradeType::CandleDuration:
        return candleDuration;
    case UpgradeType::Perception:
        return perception;
    case UpgradeType::MovementSpeed:
        return movementSpeed;
    case UpgradeType::ShadowEvasion:
        return shadowEvasion;
    }
    return 1.0f;
}

float& Upgrades::at(UpgradeType type) {
    switch (type) {
    case UpgradeType::CandleDuration:
        return candleDuration;
    case UpgradeType::Perception:
        return perception;
    case UpgradeType::MovementSpeed:
        return movementSpeed;
    case UpgradeType::ShadowEvasion:
        return shadowEvasion;
    }
    return candleDuration;
}

bool ProgressionManager::load() {
    return loadFromFile(m_saveFile);
}

bool ProgressionManager::save() const {
    return saveToFile(m_saveFile);
}

bool ProgressionManager::loadFromFile(const std::string& path) {
    m_data = ProgressionData{};

    if (!std::filesystem::exists(path)) {
        PROGRESSION_INFO(std::format("No progression file at {}, starting fresh", path));
        return false;
    }

    JsonReader reader;
    if (!reader.loadFromFile(path)) {
        PROGRESSION_ERROR(std::format("Progression file {} is unreadable - {}", path, reader.getLastError()));
        return false;
    }

    fromJson(reader.getRoot());
    PROGRESSION_INFO(std::format("Loaded progression: level {}, {} XP, {} runs", m_data.level,
                                 m_data.experience, m_data.totalRuns));
    return true;
}

bool ProgressionManager::saveToFile(const std::string& path) const {
    if (!ensureParentDirectory(path)) {
        return false;
    }
    if (!JsonReader::writeToFile(path, toJson())) {
        PROGRESSION_ERROR(std::format("Failed to write progression file {}", path));
        return false;
    }
    PROGRESSION_DEBUG(std::format("Saved progression to {}", path));
    return true;
}

JsonValue ProgressionManager::toJson() const {
    JsonObject upgrades;
    for (UpgradeType type : {UpgradeType::CandleDuration, UpgradeType::Perception,
                             UpgradeType::MovementSpeed, UpgradeType::ShadowEvasion}) {
        upgrades[std::string(upgradeKey(type))] = JsonValue(m_data.upgrades.get(type));
    }

    JsonObject root;
    root["level"] = JsonValue(m_data.level);
    root["experience"] = JsonValue(m_data.experience);
    root["totalRuns"] = JsonValue(m_data.totalRuns);
    root["totalEscapes"] = JsonValue(m_data.totalEscapes);
    root["totalPlayTimeMs"] = JsonValue(m_data.totalPlayTimeMs);
    root["artifacts"] = stringArray(m_data.artifacts);
    root["upgrades"] = JsonValue(std::move(upgrades));
    root["achievements"] = stringArray(m_data.achievements);
    root["unlockedThemes"] = stringArray(m_data.unlockedThemes);
    return JsonValue(std::move(root));
}

void ProgressionManager::fromJson(const JsonValue& root) {
    m_data = ProgressionData{};
    if (!root.isObject()) {
        PROGRESSION_WARN("Progression root is not an object, using defaults");
        return;
    }

    if (auto level = readClamped(root["level"], 1, MAX_LEVEL)) {
        m_data.level = *level;
    }
    if (auto experience = readClamped(root["experience"], 0, MAX_COUNTER)) {
        m_data.experience = *experience;
    }
    if (auto runs = readClamped(root["totalRuns"], 0, MAX_COUNTER)) {
        m_data.totalRuns = *runs;
    }
    if (auto escapes = readClamped(root["totalEscapes"], 0, MAX_COUNTER)) {
        m_data.totalEscapes = *escapes;
    }
    if (auto playTime = readClamped(root["totalPlayTimeMs"], int64_t{0}, MAX_PLAY_TIME_MS)) {
        m_data.totalPlayTimeMs = *playTime;
    }

    readStringArray(root["artifacts"], m_data.artifacts);
    readStringArray(root["achievements"], m_data.achievements);
    if (readStringArray(root["unlockedThemes"], m_data.unlockedThemes) &&
        std::find(m_data.unlockedThemes.begin(), m_data.unlockedThemes.end(), "default") ==
            m_data.unlockedThemes.end()) {
        m_data.unlockedThemes.insert(m_data.unlockedThemes.begin(), "default");
    }

    if (const JsonObject* upgrades = root["upgrades"].tryAsObject()) {
        for (const auto& [key, value] : *upgrades) {
            auto type = upgradeFromKey(key);
            auto amount = value.tryAsNumber();
            if (type && amount && *amount > 0.0) {
                m_data.upgrades.at(*type) = static_cast<float>(*amount);
            }
        }
    }
}

bool ProgressionManager::awardExperience(int amount, bool escaped) {
    m_data.experience = static_cast<int>(std::min<int64_t>(
        int64_t{m_data.experience} + std::max(0, amount), MAX_COUNTER));
    m_data.totalRuns = std::min(m_data.totalRuns + 1, MAX_COUNTER);
    if (escaped) {
        m_data.totalEscapes = std::min(m_data.totalEscapes + 1, MAX_COUNTER);
    }

    const int64_t threshold = int64_t{m_data.level} * XP_PER_LEVEL;
    if (m_data.level < MAX_LEVEL && m_data.experience >= threshold) {
        ++m_data.level;
        m_data.experience -= static_cast<int>(threshold);
        PROGRESSION_INFO(std::format("Reached level {}", m_data.level));
        return true;
    }
    return false;
}

void ProgressionManager::addPlayTime(int64_t ms) {
    m_data.totalPlayTimeMs = std::min(m_data.totalPlayTimeMs + std::max<int64_t>(0, ms), MAX_PLAY_TIME_MS);
}

bool ProgressionManager::addArtifact(const std::string& artifactId) {
    if (std::find(m_data.artifacts.begin(), m_data.artifacts.end(), artifactId) != m_data.artifacts.end()) {
        return false;
    }
    m_data.artifacts.push_back(artifactId);
    return true;
}

bool ProgressionManager::unlockUpgrade(UpgradeType type, float amount) {
    m_data.upgrades.at(type) += amount;
    PROGRESSION_INFO(std::format("Upgrade {} now {:.2f}", upgradeKey(type), m_data.upgrades.get(type)));
    return true;
}

bool ProgressionManager::applyUpgrade(UpgradeType type) {
    if (m_data.experience < UPGRADE_COST) {
        PROGRESSION_DEBUG(std::format("Not enough experience for {} ({} < {})", upgradeKey(type),
                                      m_data.experience, UPGRADE_COST));
        return false;
    }
    m_data.experience -= UPGRADE_COST;
    unlockUpgrade(type, UPGRADE_STEP);
    save();
    return true;
}

bool ProgressionManager::unlockAchievement(const std::string& achievementId) {
    if (hasAchievement(achievementId)) {
        return false;
    }
    m_data.achievements.push_back(achievementId);
    PROGRESSION_INFO(std::format("Achievement unlocked: {}", achievementId));
    return true;
}

bool ProgressionManager::hasAchievement(const std::string& achievementId) const {
    return std::find(m_data.achievements.begin(), m_data.achievements.end(), achievementId) !=
           m_data.achievements.end();
}

std::vector<std::string> ProgressionManager::checkAchievements(const RunStats& runStats) {
    std::vector<std::string> unlocked;
    auto tryUnlock = [&](bool earned, const char* id) {
        if (earned && unlockAchievement(id)) {
            unlocked.emplace_back(id);
        }
    };

    tryUnlock(runStats.escaped && m_data.totalEscapes == 1, "first_escape");
    tryUnlock(runStats.escaped && runStats.timeMs < SPEED_RUN_MS, "speed_run");
    tryUnlock(runStats.itemsCollected >= COLLECTOR_ITEMS, "collector");
    tryUnlock(m_data.totalEscapes >= SURVIVOR_ESCAPES, "survivor");
    tryUnlock(m_data.totalPlayTimeMs > EXPLORER_PLAY_TIME_MS, "explorer");
    return unlocked;
}

boost::container::small_vector<UpgradeOffer, 4> ProgressionManager::getAvailableUpgrades() const {
    boost::container::small_vector<UpgradeOffer, 4> offers;
    offers.push_back({UpgradeType::CandleDuration, "Extended Light", "Candle burns 10% longer",
                      m_data.upgrades.candleDuration, UPGRADE_COST});
    offers.push_back({UpgradeType::Perception, "Sharp Eyes", "See further in the darkness",
                      m_data.upgrades.perception, UPGRADE_COST});
    offers.push_back({UpgradeType::MovementSpeed, "Swift Steps", "Move 10% faster",
                      m_data.upgrades.movementSpeed, UPGRADE_COST});
    offers.push_back({UpgradeType::ShadowEvasion, "Shadow Sense", "Shadows move more slowly",
                      m_data.upgrades.shadowEvasion, UPGRADE_COST});
    return offers;
}

ProgressionStats ProgressionManager::getStats() const {
    ProgressionStats stats;
    stats.level = m_data.level;
    stats.experience = m_data.experience;
    stats.totalRuns = m_data.totalRuns;
    stats.totalEscapes = m_data.totalEscapes;
    stats.artifacts = m_data.artifacts.size();
    stats.achievements = m_data.achievements.size();
    return stats;
}

int ProgressionManager::victoryExperience(int64_t totalTimeMs, int itemsCollected) {
    const double timeBonus = static_cast<double>(std::max<int64_t>(0, VICTORY_TARGET_MS - totalTimeMs)) / 1000.0;
    return static_cast<int>(std::floor(VICTORY_BASE_XP + timeBonus + XP_PER_ITEM * std::max(0, itemsCollected)));
}

int ProgressionManager::deathExperience(int itemsCollected) {
    return XP_PER_ITEM * std::max(0, itemsCollected);
}

RunSummary ProgressionManager::finishRun(const RunStats& runStats, int levelReached,
                                         const std::string& deathCause) {
    RunSummary summary;
    summary.victory = runStats.escaped;
    summary.levelReached = levelReached;
    summary.timeMs = runStats.timeMs;
    summary.itemsCollected = runStats.itemsCollected;
    summary.deathCause = deathCause;
    summary.experienceGained = runStats.escaped
                                   ? victoryExperience(runStats.timeMs, runStats.itemsCollected)
                                   : deathExperience(runStats.itemsCollected);

    addPlayTime(runStats.timeMs);
    summary.leveledUp = awardExperience(summary.experienceGained, runStats.escaped);
    summary.newAchievements = checkAchievements(runStats);

    PROGRESSION_INFO(std::format("Run finished ({}), level {} reached, {} XP gained",
                                 summary.victory ? "escaped" : deathCause, levelReached,
                                 summary.experienceGained));
    save();
    m_lastRun = summary;
    return summary;
}

void ProgressionManager::resetProgress() {
    m_data = ProgressionData{};
    m_lastRun.reset();
    save();
}

} // namespace NightCage
