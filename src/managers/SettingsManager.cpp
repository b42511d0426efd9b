/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/SettingsManager.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"

#include <cmath>
#include <format>
#include <limits>
#include <optional>

namespace MarkerSync {
namespace {

// Whole numbers in int range become int, everything else numeric is float
std::optional<SettingsManager::SettingValue> toSettingValue(const JsonValue& value) {
    if (value.isBool()) {
        return value.asBool();
    }
    if (value.isString()) {
        return value.asString();
    }
    if (value.isNumber()) {
        double number = value.asNumber();
        bool whole = std::floor(number) == number &&
                     number >= std::numeric_limits<int>::min() &&
                     number <= std::numeric_limits<int>::max();
        if (whole) {
            return static_cast<int>(number);
        }
        return static_cast<float>(number);
    }
    return std::nullopt;
}

} // anonymous namespace

bool SettingsManager::loadFromFile(const std::string& filepath) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        SETTINGS_ERROR("Failed to load settings from file: " + filepath + " - " + reader.getLastError());
        return false;
    }
    return loadFromRoot(reader.getRoot(), filepath);
}

bool SettingsManager::loadFromString(const std::string& json) {
    JsonReader reader;
    if (!reader.parse(json)) {
        SETTINGS_ERROR("Failed to parse settings: " + reader.getLastError());
        return false;
    }
    return loadFromRoot(reader.getRoot(), "<string>");
}

bool SettingsManager::loadFromRoot(const JsonValue& root, const std::string& source) {
    if (!root.isObject()) {
        SETTINGS_ERROR("Settings root is not a JSON object: " + source);
        return false;
    }

    size_t loaded = 0;
    size_t skipped = 0;

    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    for (const auto& [categoryName, categoryValue] : root.asObject()) {
        if (!categoryValue.isObject()) {
            SETTINGS_WARNING("Category '" + categoryName + "' is not an object, skipping");
            ++skipped;
            continue;
        }

        CategorySettings& category = m_settings[categoryName];
        for (const auto& [key, value] : categoryValue.asObject()) {
            auto converted = toSettingValue(value);
            if (!converted) {
                SETTINGS_WARNING("Unsupported value type for setting '" + categoryName + "." + key + "', skipping");
                ++skipped;
                continue;
            }
            category.insert_or_assign(key, std::move(*converted));
            ++loaded;
        }
    }

    SETTINGS_INFO(std::format("Loaded {} settings from {} ({} skipped)", loaded, source, skipped));
    return true;
}

const SettingsManager::SettingValue* SettingsManager::findLocked(const std::string& category,
                                                                 const std::string& key) const {
    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return nullptr;
    }
    auto keyIt = categoryIt->second.find(key);
    return keyIt == categoryIt->second.end() ? nullptr : &keyIt->second;
}

bool SettingsManager::has(const std::string& category, const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);
    return findLocked(category, key) != nullptr;
}

bool SettingsManager::remove(const std::string& category, const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end() || categoryIt->second.erase(key) == 0) {
        return false;
    }
    // Empty categories disappear with their last key
    if (categoryIt->second.empty()) {
        m_settings.erase(categoryIt);
    }
    return true;
}

void SettingsManager::clearAll() {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    m_settings.clear();
}

std::vector<std::string> SettingsManager::getKeys(const std::string& category) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    std::vector<std::string> keys;
    auto categoryIt = m_settings.find(category);
    if (categoryIt != m_settings.end()) {
        keys.reserve(categoryIt->second.size());
        for (const auto& entry : categoryIt->second) {
            keys.push_back(entry.first);
        }
    }
    return keys;
}

} // namespace MarkerSync
