/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef UNLOCKED_ITEM_STORE_HPP
#define UNLOCKED_ITEM_STORE_HPP

#include "items/IUnlockOracle.hpp"
#include <atomic>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace LockboxEngine {

class JsonValue;

/**
 * @brief Thread-safe set of unlocked item ids backing IUnlockOracle
 *
 * The store answers queries only once it is ready (after a successful load
 * or an explicit setReady(true)). Until then isUnlocked() returns
 * std::nullopt so consumers can fail open while unlock data is still loading.
 *
 * JSON layout: { "unlocked": [100, 201, 4151] }
 */
class UnlockedItemStore : public IUnlockOracle
{
public:
    UnlockedItemStore() = default;
    ~UnlockedItemStore() override = default;

    UnlockedItemStore(const UnlockedItemStore&) = delete;
    UnlockedItemStore& operator=(const UnlockedItemStore&) = delete;

    // --- IUnlockOracle ---
    std::optional<bool> isUnlocked(int itemId) const override;

    /**
     * @return true if the id was newly added
     */
    bool unlock(int itemId);
    bool lock(int itemId);
    void clear();

    /**
     * @brief Replace the set with the ids listed in a JSON file and mark ready
     */
    bool loadFromJson(const std::string& filename);
    bool loadFromJsonString(std::string_view jsonString);

    void setReady(bool ready) { m_ready.store(ready, std::memory_order_release); }
    bool isReady() const { return m_ready.load(std::memory_order_acquire); }

    size_t getUnlockedCount() const;
    std::vector<int> getUnlockedIds() const;

private:
    bool loadFromRoot(const JsonValue& root, const std::string& source);

    std::unordered_set<int> m_unlocked;
    mutable std::shared_mutex m_unlockedMutex;
    std::atomic<bool> m_ready{false};
};

} // namespace LockboxEngine

#endif // UNLOCKED_ITEM_STORE_HPP
