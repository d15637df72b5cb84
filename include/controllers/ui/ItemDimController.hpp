/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ITEM_DIM_CONTROLLER_HPP
#define ITEM_DIM_CONTROLLER_HPP

/**
 * @file ItemDimController.hpp
 * @brief Dims item icons whose item is tradeable but not yet unlocked
 *
 * ItemDimController handles:
 * - BeforeRender: walks the host UI forest and writes icon opacity
 * - Tradeability classification per canonical item id (process lifetime cache)
 * - Per-frame dim verdicts per raw item id (cleared every frame)
 * - Unlock resolution over related ids (placeholder target, noted pair)
 * - item_dimmer settings (enabled, dim_opacity) via SettingsManager
 *
 * Runs at BeforeRender so UI scripts earlier in the same frame cannot
 * overwrite the opacity it sets. Every collaborator failure resolves towards
 * NOT dimming: unknown tradeability counts as untradeable, unknown unlock
 * state counts as unlocked.
 *
 * Threading: processFrame() runs on the render thread only. setEnabled(),
 * setDimOpacity() and the tradeable cache are safe to use from other threads.
 */

#include "controllers/ControllerBase.hpp"
#include "items/IItemIdentityResolver.hpp"
#include "items/IUnlockOracle.hpp"
#include "ui/SceneNode.hpp"
#include <boost/container/small_vector.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string_view>
#include <unordered_map>

/**
 * @brief Counters for the most recent frame
 */
struct DimFrameStats
{
    uint64_t frameNumber{0};
    size_t nodesVisited{0};
    size_t itemNodes{0};
    size_t verdictsComputed{0};
    size_t verdictCacheHits{0};
    size_t opacityWrites{0};
    size_t placeholdersSkipped{0};
    bool skipped{true}; // gate rejected the frame (disabled / not logged in)
};

class ItemDimController : public ControllerBase
{
public:
    /**
     * @param client Host client (scene roots + client state). Required.
     * @param resolver Item metadata provider. Required.
     * @param unlockOracle Unlock set; nullptr means every item is unlocked.
     */
    ItemDimController(std::shared_ptr<const IGameClient> client,
                      std::shared_ptr<const LockboxEngine::IItemIdentityResolver> resolver,
                      std::shared_ptr<const LockboxEngine::IUnlockOracle> unlockOracle);

    ~ItemDimController() override;

    // --- ControllerBase interface ---

    /**
     * @brief Subscribe to BeforeRender / ClientStateChanged and item_dimmer settings
     *
     * Reads the current item_dimmer settings before registering handlers.
     */
    void subscribe() override;
    void unsubscribe() override;

    [[nodiscard]] std::string_view getName() const override { return "ItemDimController"; }

    // --- Frame processing ---

    /**
     * @brief One pre-render pass over the host UI forest
     * @param frameNumber Host frame counter, recorded in the frame stats
     *
     * No-op unless enabled and the host reports ClientState::LoggedIn.
     */
    void processFrame(uint64_t frameNumber = 0);

    /**
     * @brief Dim verdict for a raw item id, memoized until the next frame starts
     * @return true if icons of this item should be dimmed
     */
    bool shouldDim(int rawItemId);

    /**
     * @brief Unlock resolution over raw, canonical and related ids
     * @return true if any candidate is unlocked or the oracle can't answer
     */
    [[nodiscard]] bool isUnlocked(int rawItemId, int canonicalItemId) const;

    // --- Configuration ---

    void setEnabled(bool enabled);
    [[nodiscard]] bool isEnabled() const { return m_enabled.load(std::memory_order_relaxed); }

    /**
     * @brief Opacity applied to dimmed icons, clamped to [0, 255]
     */
    void setDimOpacity(int opacity);
    [[nodiscard]] int getDimOpacity() const { return m_dimOpacity.load(std::memory_order_relaxed); }

    // --- Inspection ---

    [[nodiscard]] const DimFrameStats& getLastFrameStats() const { return m_frameStats; }
    [[nodiscard]] uint64_t getFramesProcessed() const { return m_framesProcessed; }
    [[nodiscard]] size_t getTradeableCacheSize() const;
    [[nodiscard]] std::optional<bool> getCachedTradeable(int canonicalItemId) const;

    /**
     * @brief Forget all tradeability classifications
     * @note Only for host-driven catalog reloads; never called per frame
     */
    void clearTradeableCache();

    static constexpr const char* SETTINGS_CATEGORY = "item_dimmer";
    static constexpr const char* SETTING_ENABLED = "enabled";
    static constexpr const char* SETTING_DIM_OPACITY = "dim_opacity";
    static constexpr int DEFAULT_DIM_OPACITY = 150;
    static constexpr int MIN_OPACITY = 0;
    static constexpr int MAX_OPACITY = 255;

private:
    // Ordered, de-duplicated; raw + canonical + up to two related ids per lookup
    using CandidateIds = boost::container::small_vector<int, 6>;

    void onBeforeRender(const EventData& data);
    void onClientStateChanged(const EventData& data);

    void walkAndDim(SceneNode& node, int dimOpacity);
    bool computeShouldDim(int rawItemId);
    int canonicalize(int rawItemId) const;
    bool isTradeableCanonical(int canonicalItemId);
    void collectRelatedIds(int itemId, CandidateIds& sink) const;

    static bool isBankPlaceholder(const SceneNode& node);
    static void addCandidate(CandidateIds& candidates, int itemId);

    std::shared_ptr<const IGameClient> mp_client;
    std::shared_ptr<const LockboxEngine::IItemIdentityResolver> mp_resolver;
    std::shared_ptr<const LockboxEngine::IUnlockOracle> mp_unlockOracle;

    std::atomic<bool> m_enabled{true};
    std::atomic<int> m_dimOpacity{DEFAULT_DIM_OPACITY};

    // Canonical id -> tradeable. Append-only; first writer wins.
    std::unordered_map<int, bool> m_tradeableCache;
    mutable std::shared_mutex m_tradeableMutex;

    // Raw id -> verdict. Render thread only, cleared at frame start.
    std::unordered_map<int, bool> m_dimDecisionCache;

    DimFrameStats m_frameStats{};
    uint64_t m_framesProcessed{0};

    std::optional<size_t> m_settingsListenerId;
};

#endif // ITEM_DIM_CONTROLLER_HPP
