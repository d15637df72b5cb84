/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SETTINGS_MANAGER_HPP
#define SETTINGS_MANAGER_HPP

#include <functional>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace LockboxEngine {

class JsonValue;

/**
 * @brief Thread-safe settings store with category organization
 *
 * Provides type-safe access to settings with JSON loading, change
 * notifications, and default value support. The settings UI lives in the
 * host; this store is what it writes into and what subsystems read from.
 *
 * Usage:
 *   auto& settings = SettingsManager::Instance();
 *   settings.loadFromFile("res/settings.json");
 *   int opacity = settings.get<int>("item_dimmer", "dim_opacity", 150);
 *   settings.set("item_dimmer", "enabled", false);
 */
class SettingsManager {
public:
    ~SettingsManager() = default;

    static SettingsManager& Instance() {
        static SettingsManager instance;
        return instance;
    }

    using SettingValue = std::variant<int, float, bool, std::string>;

    /**
     * @brief Callback function type for change notifications
     * @param category The category that changed
     * @param key The setting key that changed
     * @param newValue The new value of the setting
     */
    using ChangeCallback = std::function<void(const std::string& category,
                                             const std::string& key,
                                             const SettingValue& newValue)>;

    /**
     * @brief Loads settings from a JSON file of {category: {key: value}}
     * @param filepath Path to the JSON settings file
     * @return true if loading successful, false otherwise
     *
     * Every loaded value is reported to matching change listeners.
     */
    bool loadFromFile(const std::string& filepath);

    /**
     * @brief Loads settings from an in-memory JSON document
     * @param json Document text in the same layout as loadFromFile()
     * @return true if parsing succeeded, false otherwise
     */
    bool loadFromString(std::string_view json);

    /**
     * @brief Gets a typed setting value with optional default
     * @return The setting value, or defaultValue if missing or of another type
     *
     * Thread-safe for concurrent reads
     */
    template<typename T>
    T get(const std::string& category, const std::string& key, T defaultValue = T{}) const;

    /**
     * @brief Sets a typed setting value and notifies listeners
     * @return true if set successful, false for unsupported types
     */
    template<typename T>
    bool set(const std::string& category, const std::string& key, const T& value);

    bool has(const std::string& category, const std::string& key) const;
    bool remove(const std::string& category, const std::string& key);
    void clearAll();

    /**
     * @brief Registers a callback for setting changes
     * @param category Category to watch (empty string watches all categories)
     * @param callback Function to call when settings change
     * @return Callback ID that can be used to unregister
     *
     * Callbacks run on the thread that changed the setting, with the listener
     * lock held. Once unregisterChangeListener() returns, the callback is not
     * running and will not run again.
     */
    size_t registerChangeListener(const std::string& category, ChangeCallback callback);

    void unregisterChangeListener(size_t callbackId);

    size_t getListenerCount() const;

private:
    using CategorySettings = std::unordered_map<std::string, SettingValue>;
    std::unordered_map<std::string, CategorySettings> m_settings;

    // Allows multiple concurrent reads or single write
    mutable std::shared_mutex m_settingsMutex;

    struct ListenerInfo {
        size_t id;
        std::string category;
        ChangeCallback callback;
        bool removed;
    };
    std::vector<ListenerInfo> m_listeners;
    // Held for the whole dispatch; recursive so callbacks may (un)register
    mutable std::recursive_mutex m_listenersMutex;
    size_t m_nextCallbackId = 0;
    int m_dispatchDepth = 0;

    struct LoadedSetting {
        std::string category;
        std::string key;
        SettingValue value;
    };

    bool applyDocument(const JsonValue& root, const std::string& source);
    void notifyListeners(const std::string& category, const std::string& key, const SettingValue& newValue);

    SettingsManager(const SettingsManager&) = delete;
    SettingsManager& operator=(const SettingsManager&) = delete;

    SettingsManager() = default;
};

// Template implementations must be in header for linking

template<typename T>
T SettingsManager::get(const std::string& category, const std::string& key, T defaultValue) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return defaultValue;
    }

    auto keyIt = categoryIt->second.find(key);
    if (keyIt == categoryIt->second.end()) {
        return defaultValue;
    }

    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        if (const T* value = std::get_if<T>(&keyIt->second)) {
            return *value;
        }
        return defaultValue; // Type mismatch
    } else {
        return defaultValue; // Unsupported type
    }
}

template<typename T>
bool SettingsManager::set(const std::string& category, const std::string& key, const T& value) {
    SettingValue settingValue;

    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        settingValue = value;
    } else if constexpr (std::is_convertible_v<T, std::string>) {
        settingValue = std::string(value);
    } else {
        return false;
    }

    {
        std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
        m_settings[category][key] = settingValue;
    }

    // Settings lock is released first; listeners may read settings
    notifyListeners(category, key, settingValue);

    return true;
}

} // namespace LockboxEngine

#endif // SETTINGS_MANAGER_HPP
