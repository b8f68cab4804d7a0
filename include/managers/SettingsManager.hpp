/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SETTINGS_MANAGER_HPP
#define SETTINGS_MANAGER_HPP

#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace TickGuard {

class JsonValue;

/**
 * @brief Thread-safe key/value settings organised by category
 *
 * Backs CoreSettings. Values come from a JSON file or string whose root
 * object maps category names to objects of scalar settings, or are set
 * directly. Nested objects and arrays are skipped with a warning.
 *
 * Usage:
 *   SettingsManager settings;
 *   settings.loadFromFile("res/tickguard.json");
 *   int soft = settings.get<int>("redstone", "soft_threshold", 64);
 */
class SettingsManager {
public:
    /**
     * @brief Supported setting value types
     */
    using SettingValue = std::variant<int, double, bool, std::string>;

    SettingsManager() = default;
    ~SettingsManager() = default;

    SettingsManager(const SettingsManager&) = delete;
    SettingsManager& operator=(const SettingsManager&) = delete;

    /**
     * @brief Loads settings from a JSON file, merging over existing values
     * @return false if the file is missing or not a JSON object
     */
    bool loadFromFile(const std::string& filepath);

    /**
     * @brief Same as loadFromFile for an in-memory JSON document
     */
    bool loadFromString(const std::string& json);

    /**
     * @brief Gets a typed setting value
     * @tparam T int, double, bool or std::string
     * @return The stored value, or defaultValue when the setting is missing or
     * holds an incompatible type. An int setting satisfies a double request.
     */
    template<typename T>
    T get(const std::string& category, const std::string& key, T defaultValue = T{}) const;

    /**
     * @brief Same lookup as get() without a default
     * @return nullopt when the setting is missing or holds an incompatible type
     */
    template<typename T>
    std::optional<T> tryGet(const std::string& category, const std::string& key) const;

    /**
     * @brief Sets a typed setting value
     */
    template<typename T>
    void set(const std::string& category, const std::string& key, const T& value);

    bool has(const std::string& category, const std::string& key) const;
    bool remove(const std::string& category, const std::string& key);
    void clearAll();

    std::vector<std::string> getCategories() const;
    std::vector<std::string> getKeys(const std::string& category) const;

private:
    bool applyRoot(const JsonValue& root, const std::string& source);

    using CategorySettings = std::unordered_map<std::string, SettingValue>;
    std::unordered_map<std::string, CategorySettings> m_settings;

    // Concurrent reads, exclusive writes
    mutable std::shared_mutex m_settingsMutex;
};

template<typename T>
T SettingsManager::get(const std::string& category, const std::string& key, T defaultValue) const {
    return tryGet<T>(category, key).value_or(std::move(defaultValue));
}

template<typename T>
std::optional<T> SettingsManager::tryGet(const std::string& category, const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return std::nullopt;
    }

    auto keyIt = categoryIt->second.find(key);
    if (keyIt == categoryIt->second.end()) {
        return std::nullopt;
    }

    const SettingValue& value = keyIt->second;
    if constexpr (std::is_same_v<T, double>) {
        if (const int* asInt = std::get_if<int>(&value)) {
            return static_cast<double>(*asInt);
        }
    }
    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, double> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        if (const T* typed = std::get_if<T>(&value)) {
            return *typed;
        }
    }
    return std::nullopt;
}

template<typename T>
void SettingsManager::set(const std::string& category, const std::string& key, const T& value) {
    SettingValue settingValue;

    if constexpr (std::is_same_v<T, bool>) {
        settingValue = value;
    } else if constexpr (std::is_integral_v<T>) {
        settingValue = static_cast<int>(value);
    } else if constexpr (std::is_floating_point_v<T>) {
        settingValue = static_cast<double>(value);
    } else {
        static_assert(std::is_convertible_v<T, std::string>,
                      "settings hold int, double, bool or string values");
        settingValue = std::string(value);
    }

    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    m_settings[category][key] = std::move(settingValue);
}

} // namespace TickGuard

#endif // SETTINGS_MANAGER_HPP
