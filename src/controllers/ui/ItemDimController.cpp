/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/ui/ItemDimController.hpp"
#include "core/Logger.hpp"
#include "events/FrameEvent.hpp"
#include "managers/SettingsManager.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <limits>
#include <mutex>

using LockboxEngine::CompositionLookup;
using LockboxEngine::LookupStatus;
using LockboxEngine::SettingsManager;

namespace {

// Clamps in float before rounding so huge values cannot overflow lround
int roundOpacity(float opacity)
{
    if (std::isnan(opacity)) {
        return ItemDimController::MIN_OPACITY;
    }
    const float clamped = std::clamp(opacity,
                                     static_cast<float>(ItemDimController::MIN_OPACITY),
                                     static_cast<float>(ItemDimController::MAX_OPACITY));
    return static_cast<int>(std::lround(clamped));
}

} // namespace

ItemDimController::ItemDimController(
    std::shared_ptr<const IGameClient> client,
    std::shared_ptr<const LockboxEngine::IItemIdentityResolver> resolver,
    std::shared_ptr<const LockboxEngine::IUnlockOracle> unlockOracle)
    : mp_client(std::move(client))
    , mp_resolver(std::move(resolver))
    , mp_unlockOracle(std::move(unlockOracle))
{
    m_dimDecisionCache.reserve(256);

    if (!mp_unlockOracle) {
        DIMMER_WARN("No unlock oracle provided, all items will be treated as unlocked");
    }
}

ItemDimController::~ItemDimController()
{
    // Base destructor only reaches ControllerBase::unsubscribe()
    unsubscribe();
}

void ItemDimController::subscribe()
{
    if (checkAlreadySubscribed()) {
        return;
    }

    auto& settings = SettingsManager::Instance();
    setEnabled(settings.get<bool>(SETTINGS_CATEGORY, SETTING_ENABLED, isEnabled()));
    if (settings.has(SETTINGS_CATEGORY, SETTING_DIM_OPACITY)) {
        // Fractional values in settings.json load as float
        const float nan = std::numeric_limits<float>::quiet_NaN();
        const float opacityF = settings.get<float>(SETTINGS_CATEGORY, SETTING_DIM_OPACITY, nan);
        if (!std::isnan(opacityF)) {
            setDimOpacity(roundOpacity(opacityF));
        } else {
            setDimOpacity(settings.get<int>(SETTINGS_CATEGORY, SETTING_DIM_OPACITY, getDimOpacity()));
        }
    }

    m_settingsListenerId = settings.registerChangeListener(
        SETTINGS_CATEGORY,
        [this](const std::string&, const std::string& key,
               const SettingsManager::SettingValue& value) {
            if (key == SETTING_ENABLED) {
                if (const bool* enabled = std::get_if<bool>(&value)) {
                    setEnabled(*enabled);
                }
            } else if (key == SETTING_DIM_OPACITY) {
                if (const int* opacity = std::get_if<int>(&value)) {
                    setDimOpacity(*opacity);
                } else if (const float* opacityF = std::get_if<float>(&value)) {
                    setDimOpacity(roundOpacity(*opacityF));
                }
            }
        });

    auto& eventMgr = EventManager::Instance();

    addHandlerToken(eventMgr.registerHandlerWithToken(
        EventTypeId::BeforeRender,
        [this](const EventData& data) { onBeforeRender(data); }));

    addHandlerToken(eventMgr.registerHandlerWithToken(
        EventTypeId::ClientStateChanged,
        [this](const EventData& data) { onClientStateChanged(data); }));

    setSubscribed(true);
    DIMMER_INFO(std::format("Subscribed (enabled: {}, dim opacity: {})",
                            isEnabled(), getDimOpacity()));
}

void ItemDimController::unsubscribe()
{
    if (m_settingsListenerId) {
        SettingsManager::Instance().unregisterChangeListener(*m_settingsListenerId);
        m_settingsListenerId.reset();
    }
    ControllerBase::unsubscribe();
}

void ItemDimController::onBeforeRender(const EventData& data)
{
    uint64_t frameNumber = m_framesProcessed + 1;
    if (auto beforeRender = std::dynamic_pointer_cast<BeforeRenderEvent>(data.event)) {
        frameNumber = beforeRender->getFrameNumber();
    }
    processFrame(frameNumber);
}

void ItemDimController::onClientStateChanged(const EventData& data)
{
    auto stateChange = std::dynamic_pointer_cast<ClientStateChangedEvent>(data.event);
    if (!stateChange) {
        return;
    }

    const bool wasActive = stateChange->getOldState() == ClientState::LoggedIn;
    const bool isActive = stateChange->getNewState() == ClientState::LoggedIn;
    if (wasActive != isActive) {
        DIMMER_DEBUG(std::format("Client state {} -> {}, dimming {}",
                                 clientStateToString(stateChange->getOldState()),
                                 clientStateToString(stateChange->getNewState()),
                                 isActive ? "active" : "paused"));
    }
}

void ItemDimController::processFrame(uint64_t frameNumber)
{
    m_frameStats = DimFrameStats{};
    m_frameStats.frameNumber = frameNumber;

    // Never touch the UI while the client state is ambiguous
    if (!isEnabled() || !mp_client || mp_client->getClientState() != ClientState::LoggedIn) {
        return;
    }

    m_frameStats.skipped = false;
    ++m_framesProcessed;
    m_dimDecisionCache.clear();

    const SceneNodeList* roots = mp_client->getWidgetRoots();
    if (roots == nullptr) {
        return;
    }

    // One opacity value for the whole frame even if settings change mid-walk
    const int dimOpacity = getDimOpacity();
    for (const auto& root : *roots) {
        if (root) {
            walkAndDim(*root, dimOpacity);
        }
    }
}

void ItemDimController::walkAndDim(SceneNode& node, int dimOpacity)
{
    // Hidden subtrees are irrelevant for this frame
    if (node.isHidden()) {
        return;
    }
    ++m_frameStats.nodesVisited;

    const int itemId = node.getItemId();
    if (itemId > 0) {
        ++m_frameStats.itemNodes;
        const bool dim = shouldDim(itemId);

        // Leave the host's own dimming of empty bank placeholder slots alone
        if (isBankPlaceholder(node)) {
            ++m_frameStats.placeholdersSkipped;
        } else {
            const int target = dim ? dimOpacity : 0;
            if (node.getOpacity() != target) {
                node.setOpacity(target);
                ++m_frameStats.opacityWrites;
            }
        }
    }

    for (size_t p = 0; p < static_cast<size_t>(ChildPartition::COUNT); ++p) {
        const SceneNodeList* children = node.getChildren(static_cast<ChildPartition>(p));
        if (children == nullptr) {
            continue;
        }
        for (const auto& child : *children) {
            if (child) {
                walkAndDim(*child, dimOpacity);
            }
        }
    }
}

bool ItemDimController::shouldDim(int rawItemId)
{
    auto it = m_dimDecisionCache.find(rawItemId);
    if (it != m_dimDecisionCache.end()) {
        ++m_frameStats.verdictCacheHits;
        return it->second;
    }

    const bool result = computeShouldDim(rawItemId);
    m_dimDecisionCache.emplace(rawItemId, result);
    return result;
}

bool ItemDimController::computeShouldDim(int rawItemId)
{
    ++m_frameStats.verdictsComputed;

    const int canonicalItemId = canonicalize(rawItemId);
    if (canonicalItemId <= 0) {
        return false;
    }

    if (!isTradeableCanonical(canonicalItemId)) {
        return false;
    }

    return !isUnlocked(rawItemId, canonicalItemId);
}

int ItemDimController::canonicalize(int rawItemId) const
{
    if (!mp_resolver) {
        return rawItemId;
    }
    // On failure the raw id stands in for its own canonical id
    return mp_resolver->canonicalize(rawItemId).value_or(rawItemId);
}

bool ItemDimController::isTradeableCanonical(int canonicalItemId)
{
    {
        std::shared_lock<std::shared_mutex> lock(m_tradeableMutex);
        auto it = m_tradeableCache.find(canonicalItemId);
        if (it != m_tradeableCache.end()) {
            return it->second;
        }
    }

    if (!mp_resolver) {
        return false;
    }

    const CompositionLookup lookup = mp_resolver->getComposition(canonicalItemId);
    if (lookup.status == LookupStatus::Failed) {
        // Unknown, so don't dim, and don't cache: the provider may recover
        return false;
    }

    const bool tradeable = lookup.found() && lookup.composition.tradeable;

    std::unique_lock<std::shared_mutex> lock(m_tradeableMutex);
    auto [it, inserted] = m_tradeableCache.try_emplace(canonicalItemId, tradeable);
    if (inserted) {
        DIMMER_DEBUG(std::format("Classified item {} as {}", canonicalItemId,
                                 tradeable ? "tradeable" : "untradeable"));
    }
    return it->second;
}

bool ItemDimController::isUnlocked(int rawItemId, int canonicalItemId) const
{
    if (!mp_unlockOracle) {
        return true;
    }

    // Any unanswered query fails open
    auto queryUnlocked = [this](int itemId) {
        return mp_unlockOracle->isUnlocked(itemId).value_or(true);
    };

    // Fast paths: raw or canonical known unlocked
    if (rawItemId > 0 && queryUnlocked(rawItemId)) {
        return true;
    }
    if (canonicalItemId > 0 && canonicalItemId != rawItemId && queryUnlocked(canonicalItemId)) {
        return true;
    }

    // Slow path: related ids (placeholders / noted variants)
    CandidateIds candidates;
    addCandidate(candidates, rawItemId);
    addCandidate(candidates, canonicalItemId);

    collectRelatedIds(rawItemId, candidates);
    if (canonicalItemId != rawItemId) {
        collectRelatedIds(canonicalItemId, candidates);
    }

    for (int id : candidates) {
        if (id <= 0 || id == rawItemId || id == canonicalItemId) {
            continue; // already asked above
        }
        if (queryUnlocked(id)) {
            return true;
        }
    }

    return false;
}

void ItemDimController::collectRelatedIds(int itemId, CandidateIds& sink) const
{
    if (itemId <= 0 || !mp_resolver) {
        return;
    }

    const CompositionLookup lookup = mp_resolver->getComposition(itemId);
    if (!lookup.found()) {
        return;
    }
    const auto& comp = lookup.composition;

    if (comp.isPlaceholder()) {
        addCandidate(sink, comp.placeholderId);
    }

    if (comp.linkedNoteId > 0 && comp.linkedNoteId != itemId) {
        addCandidate(sink, comp.linkedNoteId);
    }
}

bool ItemDimController::isBankPlaceholder(const SceneNode& node)
{
    return node.getItemId() > 0 && node.getItemQuantity() == 0;
}

void ItemDimController::addCandidate(CandidateIds& candidates, int itemId)
{
    if (std::find(candidates.begin(), candidates.end(), itemId) == candidates.end()) {
        candidates.push_back(itemId);
    }
}

void ItemDimController::setEnabled(bool enabled)
{
    const bool previous = m_enabled.exchange(enabled, std::memory_order_relaxed);
    if (previous != enabled) {
        DIMMER_INFO(enabled ? "Item dimming enabled" : "Item dimming disabled");
    }
}

void ItemDimController::setDimOpacity(int opacity)
{
    m_dimOpacity.store(std::clamp(opacity, MIN_OPACITY, MAX_OPACITY),
                       std::memory_order_relaxed);
}

size_t ItemDimController::getTradeableCacheSize() const
{
    std::shared_lock<std::shared_mutex> lock(m_tradeableMutex);
    return m_tradeableCache.size();
}

std::optional<bool> ItemDimController::getCachedTradeable(int canonicalItemId) const
{
    std::shared_lock<std::shared_mutex> lock(m_tradeableMutex);
    auto it = m_tradeableCache.find(canonicalItemId);
    if (it == m_tradeableCache.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ItemDimController::clearTradeableCache()
{
    std::unique_lock<std::shared_mutex> lock(m_tradeableMutex);
    m_tradeableCache.clear();
    DIMMER_INFO("Tradeable cache cleared");
}
