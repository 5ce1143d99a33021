/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/SettingsManager.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <mutex>

namespace NightCage {

bool SettingsManager::loadFromFile(const std::string& filepath) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        SETTINGS_ERROR(std::format("Failed to load settings from {} - {}", filepath, reader.getLastError()));
        return false;
    }

    const JsonValue& root = reader.getRoot();
    if (!root.isObject()) {
        SETTINGS_ERROR(std::format("Settings root is not a JSON object: {}", filepath));
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);

    size_t loaded = 0;
    for (const auto& [categoryName, categoryValue] : root.asObject()) {
        if (!categoryValue.isObject()) {
            SETTINGS_WARN(std::format("Category '{}' is not an object, skipping", categoryName));
            continue;
        }

        for (const auto& [key, value] : categoryValue.asObject()) {
            SettingValue settingValue;
            if (value.isBool()) {
                settingValue = value.asBool();
            } else if (value.isNumber()) {
                const double number = value.asNumber();
                if (std::floor(number) == number && std::abs(number) < 2147483647.0) {
                    settingValue = static_cast<int>(number);
                } else {
                    settingValue = static_cast<float>(number);
                }
            } else if (value.isString()) {
                settingValue = value.asString();
            } else {
                SETTINGS_WARN(std::format("Unsupported value type for '{}.{}', skipping", categoryName, key));
                continue;
            }
            m_settings[categoryName][key] = std::move(settingValue);
            ++loaded;
        }
    }

    SETTINGS_INFO(std::format("Loaded {} settings from {}", loaded, filepath));
    return true;
}

bool SettingsManager::saveToFile(const std::string& filepath) const {
    JsonValue root{JsonObject{}};
    {
        std::shared_lock<std::shared_mutex> lock(m_settingsMutex);
        for (const auto& [categoryName, categorySettings] : m_settings) {
            JsonValue& category = root[categoryName];
            category = JsonValue(JsonObject{});
            for (const auto& [key, value] : categorySettings) {
                category[key] = std::visit([](const auto& arg) { return JsonValue(arg); }, value);
            }
        }
    }

    if (!JsonReader::writeToFile(filepath, root)) {
        SETTINGS_ERROR(std::format("Failed to write settings file: {}", filepath));
        return false;
    }

    SETTINGS_INFO(std::format("Saved settings to {}", filepath));
    return true;
}

bool SettingsManager::has(const std::string& category, const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    return categoryIt != m_settings.end() && categoryIt->second.contains(key);
}

bool SettingsManager::remove(const std::string& category, const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return false;
    }
    return categoryIt->second.erase(key) > 0;
}

void SettingsManager::clearAll() {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    m_settings.clear();
}

std::vector<std::string> SettingsManager::getCategories() const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    std::vector<std::string> categories;
    categories.reserve(m_settings.size());
    for (const auto& [name, settings] : m_settings) {
        categories.push_back(name);
    }
    std::sort(categories.begin(), categories.end());
    return categories;
}

} // namespace NightCage
