/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "items/UnlockedItemStore.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <format>
#include <mutex>

namespace LockboxEngine {

std::optional<bool> UnlockedItemStore::isUnlocked(int itemId) const
{
    if (!isReady()) {
        return std::nullopt;
    }

    std::shared_lock<std::shared_mutex> lock(m_unlockedMutex);
    return m_unlocked.find(itemId) != m_unlocked.end();
}

bool UnlockedItemStore::unlock(int itemId)
{
    if (itemId <= 0) {
        return false;
    }

    bool inserted = false;
    {
        std::unique_lock<std::shared_mutex> lock(m_unlockedMutex);
        inserted = m_unlocked.insert(itemId).second;
    }
    if (inserted) {
        UNLOCK_DEBUG(std::format("Unlocked item {}", itemId));
    }
    return inserted;
}

bool UnlockedItemStore::lock(int itemId)
{
    std::unique_lock<std::shared_mutex> lock(m_unlockedMutex);
    return m_unlocked.erase(itemId) > 0;
}

void UnlockedItemStore::clear()
{
    std::unique_lock<std::shared_mutex> lock(m_unlockedMutex);
    m_unlocked.clear();
}

bool UnlockedItemStore::loadFromJson(const std::string& filename)
{
    JsonReader reader;
    if (!reader.loadFromFile(filename)) {
        UNLOCK_ERROR("UnlockedItemStore::loadFromJson - Failed to load " + filename +
                     ": " + reader.getLastError());
        return false;
    }
    return loadFromRoot(reader.getRoot(), filename);
}

bool UnlockedItemStore::loadFromJsonString(std::string_view jsonString)
{
    JsonReader reader;
    if (!reader.parse(jsonString)) {
        UNLOCK_ERROR("UnlockedItemStore::loadFromJsonString - Failed to parse JSON: " +
                     reader.getLastError());
        return false;
    }
    return loadFromRoot(reader.getRoot(), "<memory>");
}

bool UnlockedItemStore::loadFromRoot(const JsonValue& root, const std::string& source)
{
    const JsonArray* ids = root["unlocked"].tryAsArray();
    if (ids == nullptr) {
        UNLOCK_ERROR("UnlockedItemStore - Missing or invalid 'unlocked' array: " + source);
        return false;
    }

    std::unordered_set<int> loaded;
    loaded.reserve(ids->size());
    size_t skipped = 0;
    for (const auto& value : *ids) {
        auto id = value.tryAsInt();
        if (id && *id > 0) {
            loaded.insert(*id);
        } else {
            ++skipped;
        }
    }

    if (skipped > 0) {
        UNLOCK_WARN(std::format("Skipped {} invalid entries in {}", skipped, source));
    }

    {
        std::unique_lock<std::shared_mutex> lock(m_unlockedMutex);
        m_unlocked = std::move(loaded);
    }
    setReady(true);

    UNLOCK_INFO(std::format("Loaded {} unlocked items from {}", getUnlockedCount(), source));
    return true;
}

size_t UnlockedItemStore::getUnlockedCount() const
{
    std::shared_lock<std::shared_mutex> lock(m_unlockedMutex);
    return m_unlocked.size();
}

std::vector<int> UnlockedItemStore::getUnlockedIds() const
{
    std::vector<int> ids;
    {
        std::shared_lock<std::shared_mutex> lock(m_unlockedMutex);
        ids.assign(m_unlocked.begin(), m_unlocked.end());
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace LockboxEngine
