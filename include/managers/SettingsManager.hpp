/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SETTINGS_MANAGER_HPP
#define SETTINGS_MANAGER_HPP

#include <mutex>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace MarkerSync {

class JsonValue;

/**
 * @brief Thread-safe category/key settings store backed by JSON files
 *
 * Loading merges into what is already stored, so a base file can be
 * followed by an override file or string:
 *   auto& settings = SettingsManager::Instance();
 *   settings.loadFromFile("res/settings.json");
 *   int depth = settings.get<int>("server", "update_queue_depth", 100);
 */
class SettingsManager {
public:
    using SettingValue = std::variant<int, float, bool, std::string>;

    static SettingsManager& Instance() {
        static SettingsManager instance;
        return instance;
    }

    /**
     * @brief Merges a JSON file of {category: {key: value}}
     * @return false if the file is missing, malformed or not an object;
     *         unsupported values (arrays, objects, null) are skipped
     */
    bool loadFromFile(const std::string& filepath);
    bool loadFromString(const std::string& json);

    /**
     * @return The stored value, or defaultValue if missing or of another
     *         type. Whole numbers are stored as int and also read as float.
     */
    template<typename T>
    T get(const std::string& category, const std::string& key, T defaultValue = T{}) const;

    /**
     * @return false if T is not int, float, bool or convertible to string
     */
    template<typename T>
    bool set(const std::string& category, const std::string& key, const T& value);

    bool has(const std::string& category, const std::string& key) const;
    bool remove(const std::string& category, const std::string& key);
    void clearAll();

    std::vector<std::string> getKeys(const std::string& category) const;

private:
    using CategorySettings = std::unordered_map<std::string, SettingValue>;
    std::unordered_map<std::string, CategorySettings> m_settings;
    mutable std::shared_mutex m_settingsMutex;

    SettingsManager() = default;
    ~SettingsManager() = default;
    SettingsManager(const SettingsManager&) = delete;
    SettingsManager& operator=(const SettingsManager&) = delete;

    bool loadFromRoot(const JsonValue& root, const std::string& source);

    // Caller holds m_settingsMutex
    const SettingValue* findLocked(const std::string& category, const std::string& key) const;
};

template<typename T>
T SettingsManager::get(const std::string& category, const std::string& key, T defaultValue) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    const SettingValue* stored = findLocked(category, key);
    if (stored == nullptr) {
        return defaultValue;
    }

    if constexpr (std::is_same_v<T, float>) {
        if (const int* whole = std::get_if<int>(stored)) {
            return static_cast<float>(*whole);
        }
    }
    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        if (const T* typed = std::get_if<T>(stored)) {
            return *typed;
        }
    }
    return defaultValue;
}

template<typename T>
bool SettingsManager::set(const std::string& category, const std::string& key, const T& value) {
    SettingValue converted;
    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        converted = value;
    } else if constexpr (std::is_convertible_v<T, std::string>) {
        converted = std::string(value);
    } else {
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    m_settings[category].insert_or_assign(key, std::move(converted));
    return true;
}

} // namespace MarkerSync

#endif // SETTINGS_MANAGER_HPP
