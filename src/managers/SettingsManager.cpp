/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/SettingsManager.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace LockboxEngine {

bool SettingsManager::loadFromFile(const std::string& filepath) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        SETTINGS_ERROR("Failed to load settings from file: " + filepath + " - " + reader.getLastError());
        return false;
    }
    return applyDocument(reader.getRoot(), filepath);
}

bool SettingsManager::loadFromString(std::string_view json) {
    JsonReader reader;
    if (!reader.parse(json)) {
        SETTINGS_ERROR("Failed to parse settings: " + reader.getLastError());
        return false;
    }
    return applyDocument(reader.getRoot(), "<memory>");
}

bool SettingsManager::applyDocument(const JsonValue& root, const std::string& source) {
    const JsonObject* rootObj = root.tryAsObject();
    if (rootObj == nullptr) {
        SETTINGS_ERROR("Settings root is not a JSON object: " + source);
        return false;
    }

    std::vector<LoadedSetting> loaded;
    {
        std::unique_lock<std::shared_mutex> lock(m_settingsMutex);

        for (const auto& [categoryName, categoryValue] : *rootObj) {
            const JsonObject* categoryObj = categoryValue.tryAsObject();
            if (categoryObj == nullptr) {
                SETTINGS_WARNING("Category '" + categoryName + "' is not an object, skipping");
                continue;
            }

            for (const auto& [key, value] : *categoryObj) {
                SettingValue settingValue;

                if (value.isBool()) {
                    settingValue = value.asBool();
                } else if (value.isNumber()) {
                    const double numValue = value.asNumber();
                    // Whole numbers in int range are stored as int
                    if (auto whole = JsonValue::wholeNumberToInt(numValue)) {
                        settingValue = *whole;
                    } else if (std::isfinite(numValue) &&
                               std::abs(numValue) <= static_cast<double>(std::numeric_limits<float>::max())) {
                        settingValue = static_cast<float>(numValue);
                    } else {
                        SETTINGS_WARNING("Setting '" + categoryName + "." + key + "' is out of range, skipping");
                        continue;
                    }
                } else if (value.isString()) {
                    settingValue = value.asString();
                } else {
                    SETTINGS_WARNING("Unsupported value type for setting '" + categoryName + "." + key + "', skipping");
                    continue;
                }

                m_settings[categoryName][key] = settingValue;
                loaded.push_back({categoryName, key, std::move(settingValue)});
            }
        }
    }

    for (const auto& entry : loaded) {
        notifyListeners(entry.category, entry.key, entry.value);
    }

    SETTINGS_INFO("Loaded " + std::to_string(loaded.size()) + " settings from " + source);
    return true;
}

bool SettingsManager::has(const std::string& category, const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return false;
    }

    return categoryIt->second.find(key) != categoryIt->second.end();
}

bool SettingsManager::remove(const std::string& category, const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return false;
    }

    if (categoryIt->second.erase(key) == 0) {
        return false;
    }

    if (categoryIt->second.empty()) {
        m_settings.erase(categoryIt);
    }

    return true;
}

void SettingsManager::clearAll() {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    m_settings.clear();
}

size_t SettingsManager::registerChangeListener(const std::string& category, ChangeCallback callback) {
    std::lock_guard<std::recursive_mutex> lock(m_listenersMutex);

    size_t id = m_nextCallbackId++;
    m_listeners.push_back({id, category, std::move(callback), false});

    return id;
}

void SettingsManager::unregisterChangeListener(size_t callbackId) {
    // Blocks while another thread is dispatching, so the callback cannot
    // run after this returns
    std::lock_guard<std::recursive_mutex> lock(m_listenersMutex);

    if (m_dispatchDepth > 0) {
        // Called from inside a callback; erase once dispatch unwinds
        for (auto& listener : m_listeners) {
            if (listener.id == callbackId) {
                listener.removed = true;
            }
        }
        return;
    }

    std::erase_if(m_listeners, [callbackId](const ListenerInfo& info) {
        return info.id == callbackId;
    });
}

size_t SettingsManager::getListenerCount() const {
    std::lock_guard<std::recursive_mutex> lock(m_listenersMutex);
    return static_cast<size_t>(std::count_if(m_listeners.begin(), m_listeners.end(),
        [](const ListenerInfo& info) { return !info.removed; }));
}

void SettingsManager::notifyListeners(const std::string& category, const std::string& key, const SettingValue& newValue) {
    std::lock_guard<std::recursive_mutex> lock(m_listenersMutex);
    ++m_dispatchDepth;

    // Listeners registered by a callback wait for the next change
    const size_t count = m_listeners.size();
    for (size_t i = 0; i < count; ++i) {
        if (m_listeners[i].removed) {
            continue;
        }
        if (!m_listeners[i].category.empty() && m_listeners[i].category != category) {
            continue;
        }
        // Local copy, a nested register may reallocate m_listeners
        ChangeCallback callback = m_listeners[i].callback;
        callback(category, key, newValue);
    }

    if (--m_dispatchDepth == 0) {
        std::erase_if(m_listeners, [](const ListenerInfo& info) { return info.removed; });
    }
}

} // namespace LockboxEngine
