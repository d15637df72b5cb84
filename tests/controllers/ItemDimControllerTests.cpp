/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE ItemDimControllerTests
#include <boost/test/unit_test.hpp>

#include "controllers/ui/ItemDimController.hpp"
#include "managers/EventManager.hpp"
#include "managers/SettingsManager.hpp"
#include "../events/EventManagerTestAccess.hpp"
#include "../mocks/MockDimCollaborators.hpp"
#include <atomic>
#include <memory>
#include <thread>

using LockboxEngine::ItemComposition;
using LockboxEngine::SettingsManager;

// ============================================================================
// Test Fixture
// ============================================================================

class ItemDimControllerTestFixture {
public:
    ItemDimControllerTestFixture()
        : m_resolver(std::make_shared<MockItemResolver>())
        , m_oracle(std::make_shared<MockUnlockOracle>())
        , m_client(std::make_shared<MockGameClient>())
    {
        // Reset event manager and settings to a clean state
        EventManagerTestAccess::reset();
        SettingsManager::Instance().clearAll();

        m_controller = std::make_unique<ItemDimController>(m_client, m_resolver, m_oracle);
    }

    ~ItemDimControllerTestFixture()
    {
        // Controller unsubscribes (events + settings listener) on destruction
        m_controller.reset();
        EventManager::Instance().clean();
        SettingsManager::Instance().clearAll();
    }

protected:
    std::shared_ptr<MockSceneNode> addItemRoot(int itemId, int quantity = 1, int opacity = 0)
    {
        return m_client->addRoot(std::make_shared<MockSceneNode>(itemId, quantity, opacity));
    }

    std::shared_ptr<MockItemResolver> m_resolver;
    std::shared_ptr<MockUnlockOracle> m_oracle;
    std::shared_ptr<MockGameClient> m_client;
    std::unique_ptr<ItemDimController> m_controller;
};

// ============================================================================
// SUBSCRIPTION TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(SubscriptionTests, ItemDimControllerTestFixture)

BOOST_AUTO_TEST_CASE(TestInitiallyNotSubscribed) {
    BOOST_CHECK(!m_controller->isSubscribed());
    BOOST_CHECK_EQUAL(m_controller->getName(), "ItemDimController");
}

BOOST_AUTO_TEST_CASE(TestSubscribeRegistersHandlers) {
    m_controller->subscribe();

    BOOST_CHECK(m_controller->isSubscribed());
    BOOST_CHECK_EQUAL(EventManager::Instance().getHandlerCount(EventTypeId::BeforeRender), 1);
    BOOST_CHECK_EQUAL(EventManager::Instance().getHandlerCount(EventTypeId::ClientStateChanged), 1);
}

BOOST_AUTO_TEST_CASE(TestDoubleSubscribeIgnored) {
    m_controller->subscribe();
    m_controller->subscribe();

    BOOST_CHECK_EQUAL(EventManager::Instance().getHandlerCount(EventTypeId::BeforeRender), 1);

    m_controller->unsubscribe();
    BOOST_CHECK(!m_controller->isSubscribed());
    BOOST_CHECK_EQUAL(EventManager::Instance().getHandlerCount(EventTypeId::BeforeRender), 0);
}

BOOST_AUTO_TEST_CASE(TestSubscribeUnsubscribeCycle) {
    const size_t baseListeners = SettingsManager::Instance().getListenerCount();

    for (int i = 0; i < 3; ++i) {
        m_controller->subscribe();
        BOOST_CHECK(m_controller->isSubscribed());
        BOOST_CHECK_EQUAL(SettingsManager::Instance().getListenerCount(), baseListeners + 1);

        m_controller->unsubscribe();
        BOOST_CHECK(!m_controller->isSubscribed());
        BOOST_CHECK_EQUAL(SettingsManager::Instance().getListenerCount(), baseListeners);
    }
}

BOOST_AUTO_TEST_CASE(TestAutoUnsubscribeOnDestruction) {
    const size_t baseListeners = SettingsManager::Instance().getListenerCount();
    {
        ItemDimController controller(m_client, m_resolver, m_oracle);
        controller.subscribe();
        BOOST_CHECK_EQUAL(EventManager::Instance().getHandlerCount(EventTypeId::BeforeRender), 1);
    }
    BOOST_CHECK_EQUAL(EventManager::Instance().getHandlerCount(EventTypeId::BeforeRender), 0);
    BOOST_CHECK_EQUAL(SettingsManager::Instance().getListenerCount(), baseListeners);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// VERDICT TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(VerdictTests, ItemDimControllerTestFixture)

BOOST_AUTO_TEST_CASE(TestTradeableLockedItemDims) {
    m_resolver->addItem(100, true);
    BOOST_CHECK(m_controller->shouldDim(100));
}

BOOST_AUTO_TEST_CASE(TestTradeableUnlockedItemNotDimmed) {
    m_resolver->addItem(100, true);
    m_oracle->unlock(100);
    BOOST_CHECK(!m_controller->shouldDim(100));
}

BOOST_AUTO_TEST_CASE(TestUntradeableItemNeverDims) {
    m_resolver->addItem(6570, false);
    BOOST_CHECK(!m_controller->shouldDim(6570));
    // Unlock state is irrelevant for untradeable items
    BOOST_CHECK_EQUAL(m_oracle->queryCount(), 0);
}

BOOST_AUTO_TEST_CASE(TestVerdictMemoizedWithinFrame) {
    m_resolver->addItem(100, true);

    const bool first = m_controller->shouldDim(100);
    const bool second = m_controller->shouldDim(100);

    BOOST_CHECK_EQUAL(first, second);
    BOOST_CHECK_EQUAL(m_resolver->canonicalizeCalls(100), 1);
}

BOOST_AUTO_TEST_CASE(TestVerdictRecomputedNextFrame) {
    m_resolver->addItem(100, true);
    addItemRoot(100);

    m_controller->processFrame(1);
    BOOST_CHECK_EQUAL(m_resolver->canonicalizeCalls(100), 1);

    // Unlock between frames is picked up because the decision cache is per frame
    m_oracle->unlock(100);
    m_controller->processFrame(2);
    BOOST_CHECK_EQUAL(m_resolver->canonicalizeCalls(100), 2);
    BOOST_CHECK(!m_controller->shouldDim(100));
}

BOOST_AUTO_TEST_CASE(TestTradeableCacheSurvivesFrames) {
    m_resolver->addItem(100, true);
    m_oracle->unlock(100);
    addItemRoot(100);

    for (uint64_t frame = 1; frame <= 5; ++frame) {
        m_controller->processFrame(frame);
    }

    // Unlocked via fast path, so the only composition lookup was classification
    BOOST_CHECK_EQUAL(m_resolver->compositionCalls(100), 1);
    BOOST_CHECK_EQUAL(m_controller->getTradeableCacheSize(), 1);
    BOOST_REQUIRE(m_controller->getCachedTradeable(100).has_value());
    BOOST_CHECK(*m_controller->getCachedTradeable(100));
}

BOOST_AUTO_TEST_CASE(TestClearTradeableCacheForcesReclassification) {
    m_resolver->addItem(100, true);
    m_oracle->unlock(100);

    BOOST_CHECK(!m_controller->shouldDim(100));
    BOOST_CHECK_EQUAL(m_controller->getTradeableCacheSize(), 1);

    m_controller->clearTradeableCache();
    BOOST_CHECK_EQUAL(m_controller->getTradeableCacheSize(), 0);
    BOOST_CHECK(!m_controller->getCachedTradeable(100).has_value());

    addItemRoot(100);
    m_controller->processFrame(1);
    BOOST_CHECK_EQUAL(m_resolver->compositionCalls(100), 2);
}

BOOST_AUTO_TEST_CASE(TestMissingCompositionCachedAsUntradeable) {
    // Known to canonicalize, but the metadata store has no composition
    m_resolver->setCanonical(300, 300);
    addItemRoot(300);

    m_controller->processFrame(1);
    m_controller->processFrame(2);

    BOOST_REQUIRE(m_controller->getCachedTradeable(300).has_value());
    BOOST_CHECK(!*m_controller->getCachedTradeable(300));
    BOOST_CHECK_EQUAL(m_resolver->compositionCalls(300), 1);
}

BOOST_AUTO_TEST_CASE(TestFailedCompositionNotDimmedAndNotCached) {
    m_resolver->addItem(300, true);
    m_resolver->failComposition(300);
    auto node = addItemRoot(300);

    m_controller->processFrame(1);
    BOOST_CHECK_EQUAL(node->getOpacity(), 0);
    BOOST_CHECK_EQUAL(node->writeCount(), 0);
    BOOST_CHECK(!m_controller->getCachedTradeable(300).has_value());

    // Provider recovers: classification happens on the next frame
    m_resolver->recoverComposition(300);
    m_controller->processFrame(2);
    BOOST_CHECK_EQUAL(node->getOpacity(), ItemDimController::DEFAULT_DIM_OPACITY);
    BOOST_REQUIRE(m_controller->getCachedTradeable(300).has_value());
    BOOST_CHECK(*m_controller->getCachedTradeable(300));
}

BOOST_AUTO_TEST_CASE(TestCanonicalizeFailureUsesRawId) {
    m_resolver->addItem(500, true);
    m_resolver->failCanonicalize(500);

    BOOST_CHECK(m_controller->shouldDim(500));
    BOOST_CHECK(m_controller->getCachedTradeable(500).has_value());

    m_oracle->unlock(500);
    m_controller->processFrame(1);
    BOOST_CHECK(!m_controller->shouldDim(500));
}

BOOST_AUTO_TEST_CASE(TestNonPositiveCanonicalNeverDims) {
    m_resolver->addItem(600, true);
    m_resolver->setCanonical(600, 0);
    m_resolver->setCanonical(601, -1);

    BOOST_CHECK(!m_controller->shouldDim(600));
    BOOST_CHECK(!m_controller->shouldDim(601));
    BOOST_CHECK_EQUAL(m_resolver->compositionCalls(0), 0);
    BOOST_CHECK_EQUAL(m_resolver->compositionCalls(-1), 0);
    BOOST_CHECK_EQUAL(m_controller->getTradeableCacheSize(), 0);
}

BOOST_AUTO_TEST_CASE(TestUnknownItemNotDimmed) {
    // Canonicalization fails, raw id has no composition either
    BOOST_CHECK(!m_controller->shouldDim(424242));
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// UNLOCK RESOLUTION TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(UnlockResolutionTests, ItemDimControllerTestFixture)

BOOST_AUTO_TEST_CASE(TestNullOracleTreatsEverythingUnlocked) {
    m_resolver->addItem(100, true);
    ItemDimController controller(m_client, m_resolver, nullptr);

    BOOST_CHECK(controller.isUnlocked(100, 100));
    BOOST_CHECK(controller.isUnlocked(-5, 0));
    BOOST_CHECK(!controller.shouldDim(100));

    auto node = addItemRoot(100);
    controller.processFrame(1);
    BOOST_CHECK_EQUAL(node->writeCount(), 0);
}

BOOST_AUTO_TEST_CASE(TestCanonicalFastPath) {
    ItemComposition noted;
    noted.id = 200;
    noted.tradeable = true;
    noted.noteTemplateId = 799;
    noted.linkedNoteId = 201;
    m_resolver->addItem(noted);

    ItemComposition unnoted;
    unnoted.id = 201;
    unnoted.tradeable = true;
    unnoted.linkedNoteId = 200;
    m_resolver->addItem(unnoted);

    m_resolver->setCanonical(200, 201);
    m_oracle->unlock(201);

    BOOST_CHECK(!m_controller->shouldDim(200));
    // Canonical hit: no related-id expansion needed
    BOOST_CHECK_EQUAL(m_resolver->compositionCalls(200), 0);
}

BOOST_AUTO_TEST_CASE(TestNotedPairExpansion) {
    // Canonicalization unavailable: only the linked note id connects the forms
    ItemComposition noted;
    noted.id = 1216;
    noted.tradeable = true;
    noted.noteTemplateId = 799;
    noted.linkedNoteId = 1215;
    m_resolver->addItem(noted);
    m_resolver->failCanonicalize(1216);

    m_oracle->unlock(1215);

    BOOST_CHECK(m_controller->isUnlocked(1216, 1216));
    BOOST_CHECK(!m_controller->shouldDim(1216));
}

BOOST_AUTO_TEST_CASE(TestPlaceholderTargetExpansion) {
    ItemComposition placeholder;
    placeholder.id = 14516;
    placeholder.tradeable = true;
    placeholder.placeholderTemplateId = 14401;
    placeholder.placeholderId = 4151;
    m_resolver->addItem(placeholder);

    BOOST_CHECK(!m_controller->isUnlocked(14516, 14516));

    m_oracle->unlock(4151);
    BOOST_CHECK(m_controller->isUnlocked(14516, 14516));
}

BOOST_AUTO_TEST_CASE(TestSelfLinkIgnored) {
    ItemComposition item;
    item.id = 700;
    item.tradeable = true;
    item.linkedNoteId = 700;
    m_resolver->addItem(item);

    BOOST_CHECK(!m_controller->isUnlocked(700, 700));
    // Raw id asked once, nothing else to ask
    BOOST_CHECK_EQUAL(m_oracle->queryCount(), 1);
}

BOOST_AUTO_TEST_CASE(TestRelatedIdsFromRawAndCanonical) {
    ItemComposition raw;
    raw.id = 800;
    raw.tradeable = true;
    raw.linkedNoteId = 801;
    m_resolver->addItem(raw);

    ItemComposition canonical;
    canonical.id = 900;
    canonical.tradeable = true;
    canonical.linkedNoteId = 901;
    m_resolver->addItem(canonical);

    m_oracle->unlock(901);
    BOOST_CHECK(m_controller->isUnlocked(800, 900));
    BOOST_CHECK_EQUAL(m_resolver->compositionCalls(800), 1);
    BOOST_CHECK_EQUAL(m_resolver->compositionCalls(900), 1);
}

BOOST_AUTO_TEST_CASE(TestOracleFailureFailsOpen) {
    m_resolver->addItem(100, true);
    m_oracle->setAllFail(true);
    auto node = addItemRoot(100, 1, 150);

    m_controller->processFrame(1);

    BOOST_CHECK(!m_controller->shouldDim(100));
    BOOST_CHECK_EQUAL(node->getOpacity(), 0);
}

BOOST_AUTO_TEST_CASE(TestPartialOracleFailureFailsOpen) {
    ItemComposition noted;
    noted.id = 1216;
    noted.tradeable = true;
    noted.noteTemplateId = 799;
    noted.linkedNoteId = 1215;
    m_resolver->addItem(noted);
    m_resolver->failCanonicalize(1216);

    // Raw says locked, related id can't be answered
    m_oracle->failQuery(1215);
    BOOST_CHECK(m_controller->isUnlocked(1216, 1216));
}

BOOST_AUTO_TEST_CASE(TestRelatedLookupFailureDegradesToFastPath) {
    m_resolver->addItem(100, true);
    BOOST_CHECK(m_controller->shouldDim(100));

    // Classification is cached, composition now fails during expansion
    m_resolver->failComposition(100);
    m_controller->processFrame(1);
    BOOST_CHECK(!m_controller->isUnlocked(100, 100));
    BOOST_CHECK(m_controller->shouldDim(100));
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// TRAVERSAL TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(TraversalTests, ItemDimControllerTestFixture)

BOOST_AUTO_TEST_CASE(TestScenarioLockedTradeableDims) {
    m_resolver->addItem(100, true);
    auto node = addItemRoot(100);

    m_controller->processFrame(1);

    BOOST_CHECK_EQUAL(node->getOpacity(), 150);
    BOOST_CHECK_EQUAL(node->writeCount(), 1);
    BOOST_CHECK_EQUAL(m_controller->getLastFrameStats().opacityWrites, 1);
}

BOOST_AUTO_TEST_CASE(TestScenarioUnlockedRestoresOpacity) {
    m_resolver->addItem(100, true);
    m_oracle->unlock(100);
    auto node = addItemRoot(100, 1, 150);

    m_controller->processFrame(1);

    BOOST_CHECK_EQUAL(node->getOpacity(), 0);
    BOOST_CHECK_EQUAL(node->writeCount(), 1);
}

BOOST_AUTO_TEST_CASE(TestScenarioNotedFormUnlockedViaPair) {
    ItemComposition noted;
    noted.id = 200;
    noted.tradeable = true;
    noted.noteTemplateId = 799;
    noted.linkedNoteId = 201;
    m_resolver->addItem(noted);
    m_resolver->addItem(201, true);
    m_resolver->setCanonical(200, 201);
    m_oracle->unlock(201);

    auto node = addItemRoot(200, 25);
    m_controller->processFrame(1);

    BOOST_CHECK_EQUAL(node->getOpacity(), 0);
    BOOST_CHECK_EQUAL(node->writeCount(), 0);
}

BOOST_AUTO_TEST_CASE(TestScenarioMissingMetadataNeverDims) {
    m_resolver->failComposition(300);
    m_resolver->setCanonical(300, 300);
    auto node = addItemRoot(300);

    m_controller->processFrame(1);

    BOOST_CHECK_EQUAL(node->getOpacity(), 0);
    BOOST_CHECK_EQUAL(node->writeCount(), 0);
}

BOOST_AUTO_TEST_CASE(TestScenarioDisabledSkipsTraversal) {
    m_resolver->addItem(100, true);
    auto node = addItemRoot(100, 1, 42);

    m_controller->setEnabled(false);
    m_controller->processFrame(1);

    BOOST_CHECK(m_controller->getLastFrameStats().skipped);
    BOOST_CHECK_EQUAL(m_controller->getLastFrameStats().nodesVisited, 0);
    BOOST_CHECK_EQUAL(node->itemIdReads(), 0);
    BOOST_CHECK_EQUAL(node->getOpacity(), 42);
    BOOST_CHECK_EQUAL(m_controller->getFramesProcessed(), 0);
}

BOOST_AUTO_TEST_CASE(TestNotLoggedInSkipsTraversal) {
    m_resolver->addItem(100, true);
    auto node = addItemRoot(100);

    const ClientState inactiveStates[] = {ClientState::Starting, ClientState::LoginScreen,
                                          ClientState::Loading, ClientState::Hopping};
    for (ClientState state : inactiveStates) {
        m_client->setState(state);
        m_controller->processFrame(1);
        BOOST_CHECK(m_controller->getLastFrameStats().skipped);
    }
    BOOST_CHECK_EQUAL(node->writeCount(), 0);

    m_client->setState(ClientState::LoggedIn);
    m_controller->processFrame(2);
    BOOST_CHECK(!m_controller->getLastFrameStats().skipped);
    BOOST_CHECK_EQUAL(node->getOpacity(), 150);
}

BOOST_AUTO_TEST_CASE(TestWriteSuppressionConverges) {
    m_resolver->addItem(100, true);
    m_resolver->addItem(995, true);
    m_oracle->unlock(995);
    auto locked = addItemRoot(100);
    auto unlocked = addItemRoot(995);

    m_controller->processFrame(1);
    BOOST_CHECK_EQUAL(m_controller->getLastFrameStats().opacityWrites, 1);

    m_controller->processFrame(2);
    m_controller->processFrame(3);
    BOOST_CHECK_EQUAL(m_controller->getLastFrameStats().opacityWrites, 0);
    BOOST_CHECK_EQUAL(locked->writeCount(), 1);
    BOOST_CHECK_EQUAL(unlocked->writeCount(), 0);
}

BOOST_AUTO_TEST_CASE(TestPlaceholderSlotNeverWritten) {
    m_resolver->addItem(100, true);
    auto placeholder = addItemRoot(100, 0, 120);

    m_controller->processFrame(1);

    BOOST_CHECK_EQUAL(placeholder->writeCount(), 0);
    BOOST_CHECK_EQUAL(placeholder->getOpacity(), 120);
    BOOST_CHECK_EQUAL(m_controller->getLastFrameStats().placeholdersSkipped, 1);

    // Verdict was still computed and cached for the frame
    BOOST_CHECK(m_controller->shouldDim(100));
    BOOST_CHECK_EQUAL(m_resolver->canonicalizeCalls(100), 1);
}

BOOST_AUTO_TEST_CASE(TestPlaceholderAndRealSlotShareVerdict) {
    m_resolver->addItem(100, true);
    auto slot = addItemRoot(100, 3);
    auto placeholder = addItemRoot(100, 0, 120);

    m_controller->processFrame(1);

    BOOST_CHECK_EQUAL(slot->getOpacity(), 150);
    BOOST_CHECK_EQUAL(placeholder->getOpacity(), 120);
    BOOST_CHECK_EQUAL(m_controller->getLastFrameStats().verdictsComputed, 1);
    BOOST_CHECK_EQUAL(m_controller->getLastFrameStats().verdictCacheHits, 1);
}

BOOST_AUTO_TEST_CASE(TestHiddenSubtreeSkipped) {
    m_resolver->addItem(100, true);
    auto hidden = addItemRoot(100);
    hidden->setHidden(true);
    auto child = hidden->addChild(ChildPartition::Dynamic, std::make_shared<MockSceneNode>(100));

    m_controller->processFrame(1);

    BOOST_CHECK_EQUAL(hidden->writeCount(), 0);
    BOOST_CHECK_EQUAL(child->writeCount(), 0);
    BOOST_CHECK_EQUAL(child->itemIdReads(), 0);
    BOOST_CHECK_EQUAL(m_controller->getLastFrameStats().nodesVisited, 0);
}

BOOST_AUTO_TEST_CASE(TestAllPartitionsTraversed) {
    m_resolver->addItem(100, true);
    auto root = m_client->addRoot(std::make_shared<MockSceneNode>());
    auto dynamicChild = root->addChild(ChildPartition::Dynamic, std::make_shared<MockSceneNode>(100));
    auto staticChild = root->addChild(ChildPartition::Static, std::make_shared<MockSceneNode>(100));
    auto nestedParent = root->addChild(ChildPartition::Nested, std::make_shared<MockSceneNode>());
    auto deepChild = nestedParent->addChild(ChildPartition::Static, std::make_shared<MockSceneNode>(100));

    m_controller->processFrame(1);

    BOOST_CHECK_EQUAL(dynamicChild->getOpacity(), 150);
    BOOST_CHECK_EQUAL(staticChild->getOpacity(), 150);
    BOOST_CHECK_EQUAL(deepChild->getOpacity(), 150);
    BOOST_CHECK_EQUAL(root->writeCount(), 0);
    BOOST_CHECK_EQUAL(m_controller->getLastFrameStats().nodesVisited, 5);
    BOOST_CHECK_EQUAL(m_controller->getLastFrameStats().itemNodes, 3);
}

BOOST_AUTO_TEST_CASE(TestNullEntriesAndPartitionsTolerated) {
    m_resolver->addItem(100, true);
    m_client->addNullRoot();
    auto root = m_client->addRoot(std::make_shared<MockSceneNode>());
    root->addNullChild(ChildPartition::Dynamic);
    auto child = root->addChild(ChildPartition::Dynamic, std::make_shared<MockSceneNode>(100));
    root->addNullChild(ChildPartition::Nested);

    BOOST_CHECK_NO_THROW(m_controller->processFrame(1));
    BOOST_CHECK_EQUAL(child->getOpacity(), 150);
}

BOOST_AUTO_TEST_CASE(TestNoRootsIsNoOp) {
    m_client->setRootsLoaded(false);
    BOOST_CHECK_NO_THROW(m_controller->processFrame(1));
    BOOST_CHECK(!m_controller->getLastFrameStats().skipped);
    BOOST_CHECK_EQUAL(m_controller->getLastFrameStats().nodesVisited, 0);
}

BOOST_AUTO_TEST_CASE(TestNonItemNodesIgnored) {
    auto empty = addItemRoot(-1);
    auto zero = addItemRoot(0, 0);

    m_controller->processFrame(1);

    BOOST_CHECK_EQUAL(empty->writeCount(), 0);
    BOOST_CHECK_EQUAL(zero->writeCount(), 0);
    BOOST_CHECK_EQUAL(m_resolver->totalCanonicalizeCalls(), 0);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// CONFIGURATION TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(ConfigurationTests, ItemDimControllerTestFixture)

BOOST_AUTO_TEST_CASE(TestDefaults) {
    BOOST_CHECK(m_controller->isEnabled());
    BOOST_CHECK_EQUAL(m_controller->getDimOpacity(), ItemDimController::DEFAULT_DIM_OPACITY);
}

BOOST_AUTO_TEST_CASE(TestDimOpacityClamped) {
    m_controller->setDimOpacity(300);
    BOOST_CHECK_EQUAL(m_controller->getDimOpacity(), 255);

    m_controller->setDimOpacity(-20);
    BOOST_CHECK_EQUAL(m_controller->getDimOpacity(), 0);

    m_controller->setDimOpacity(90);
    BOOST_CHECK_EQUAL(m_controller->getDimOpacity(), 90);
}

BOOST_AUTO_TEST_CASE(TestConfiguredOpacityApplied) {
    m_resolver->addItem(100, true);
    auto node = addItemRoot(100);

    m_controller->setDimOpacity(200);
    m_controller->processFrame(1);
    BOOST_CHECK_EQUAL(node->getOpacity(), 200);

    m_controller->setDimOpacity(80);
    m_controller->processFrame(2);
    BOOST_CHECK_EQUAL(node->getOpacity(), 80);
}

BOOST_AUTO_TEST_CASE(TestSettingsReadOnSubscribe) {
    auto& settings = SettingsManager::Instance();
    settings.set(ItemDimController::SETTINGS_CATEGORY, ItemDimController::SETTING_ENABLED, false);
    settings.set(ItemDimController::SETTINGS_CATEGORY, ItemDimController::SETTING_DIM_OPACITY, 400);

    m_controller->subscribe();

    BOOST_CHECK(!m_controller->isEnabled());
    BOOST_CHECK_EQUAL(m_controller->getDimOpacity(), 255);
}

BOOST_AUTO_TEST_CASE(TestFractionalSettingsReadOnSubscribe) {
    auto& settings = SettingsManager::Instance();
    settings.set(ItemDimController::SETTINGS_CATEGORY, ItemDimController::SETTING_DIM_OPACITY, -3.5f);
    m_controller->subscribe();
    BOOST_CHECK_EQUAL(m_controller->getDimOpacity(), 0);

    // Listener path clamps the same way
    m_controller->setDimOpacity(150);
    settings.set(ItemDimController::SETTINGS_CATEGORY, ItemDimController::SETTING_DIM_OPACITY, -3.5f);
    BOOST_CHECK_EQUAL(m_controller->getDimOpacity(), 0);

    m_controller->unsubscribe();
    settings.set(ItemDimController::SETTINGS_CATEGORY, ItemDimController::SETTING_DIM_OPACITY, 99.6f);
    m_controller->subscribe();
    BOOST_CHECK_EQUAL(m_controller->getDimOpacity(), 100);
}

BOOST_AUTO_TEST_CASE(TestFractionalSettingsFileReadOnSubscribe) {
    BOOST_REQUIRE(SettingsManager::Instance().loadFromString(
        R"({"item_dimmer": {"dim_opacity": 300.5}})"));
    m_controller->subscribe();
    BOOST_CHECK_EQUAL(m_controller->getDimOpacity(), 255);
}

BOOST_AUTO_TEST_CASE(TestSettingsChangesApplied) {
    auto& settings = SettingsManager::Instance();
    m_controller->subscribe();

    settings.set(ItemDimController::SETTINGS_CATEGORY, ItemDimController::SETTING_DIM_OPACITY, 64);
    BOOST_CHECK_EQUAL(m_controller->getDimOpacity(), 64);

    settings.set(ItemDimController::SETTINGS_CATEGORY, ItemDimController::SETTING_DIM_OPACITY, 99.6f);
    BOOST_CHECK_EQUAL(m_controller->getDimOpacity(), 100);

    settings.set(ItemDimController::SETTINGS_CATEGORY, ItemDimController::SETTING_ENABLED, false);
    BOOST_CHECK(!m_controller->isEnabled());

    // Wrong type is ignored
    settings.set(ItemDimController::SETTINGS_CATEGORY, ItemDimController::SETTING_ENABLED,
                 std::string("yes"));
    BOOST_CHECK(!m_controller->isEnabled());

    // Other categories don't reach the controller
    settings.set("graphics", ItemDimController::SETTING_DIM_OPACITY, 10);
    BOOST_CHECK_EQUAL(m_controller->getDimOpacity(), 100);
}

BOOST_AUTO_TEST_CASE(TestSettingsFileLoadApplied) {
    m_controller->subscribe();

    BOOST_REQUIRE(SettingsManager::Instance().loadFromString(
        R"({"item_dimmer": {"enabled": true, "dim_opacity": 175}})"));
    BOOST_CHECK(m_controller->isEnabled());
    BOOST_CHECK_EQUAL(m_controller->getDimOpacity(), 175);
}

BOOST_AUTO_TEST_CASE(TestSettingsIgnoredAfterUnsubscribe) {
    m_controller->subscribe();
    m_controller->unsubscribe();

    SettingsManager::Instance().set(ItemDimController::SETTINGS_CATEGORY,
                                    ItemDimController::SETTING_DIM_OPACITY, 12);
    BOOST_CHECK_EQUAL(m_controller->getDimOpacity(), ItemDimController::DEFAULT_DIM_OPACITY);
}

BOOST_AUTO_TEST_CASE(TestConcurrentConfigurationWrites) {
    m_resolver->addItem(100, true);
    auto node = addItemRoot(100);

    std::atomic<bool> running{true};
    std::thread writer([this, &running]() {
        int value = 0;
        while (running.load()) {
            m_controller->setDimOpacity(value);
            value = (value + 37) % 512;
        }
    });

    for (uint64_t frame = 1; frame <= 200; ++frame) {
        m_controller->processFrame(frame);
        BOOST_CHECK_GE(node->getOpacity(), 0);
        BOOST_CHECK_LE(node->getOpacity(), 255);
    }

    running.store(false);
    writer.join();
}

BOOST_AUTO_TEST_CASE(TestSettingsWriterDuringControllerTeardown) {
    auto& settings = SettingsManager::Instance();
    const size_t baseListeners = settings.getListenerCount();

    std::atomic<bool> running{true};
    std::thread writer([&settings, &running]() {
        int value = 0;
        while (running.load()) {
            settings.set(ItemDimController::SETTINGS_CATEGORY,
                         ItemDimController::SETTING_DIM_OPACITY, value);
            value = (value + 1) % 256;
        }
    });

    // Each controller must be unreachable from the writer once destroyed
    for (int i = 0; i < 500; ++i) {
        auto controller = std::make_unique<ItemDimController>(m_client, m_resolver, m_oracle);
        controller->subscribe();
        controller.reset();
    }

    running.store(false);
    writer.join();

    BOOST_CHECK_EQUAL(settings.getListenerCount(), baseListeners);
}

BOOST_AUTO_TEST_CASE(TestTradeableCacheReadDuringFrames) {
    m_resolver->addItem(100, true);
    m_resolver->addItem(200, false);
    addItemRoot(100);
    addItemRoot(200);

    m_controller->processFrame(1);
    BOOST_REQUIRE_EQUAL(m_controller->getTradeableCacheSize(), 2);

    std::atomic<bool> running{true};
    std::atomic<bool> inconsistent{false};
    std::atomic<int> reads{0};
    std::thread reader([this, &running, &inconsistent, &reads]() {
        while (running.load()) {
            const auto tradeable = m_controller->getCachedTradeable(100);
            const auto untradeable = m_controller->getCachedTradeable(200);
            if (!tradeable || !*tradeable || !untradeable || *untradeable ||
                m_controller->getTradeableCacheSize() != 2) {
                inconsistent.store(true);
            }
            reads.fetch_add(1);
        }
    });

    for (uint64_t frame = 2; frame <= 500; ++frame) {
        m_controller->processFrame(frame);
    }
    // Make sure the reader overlapped at least some frames
    while (reads.load() == 0) {
        std::this_thread::yield();
    }

    running.store(false);
    reader.join();

    BOOST_CHECK(!inconsistent.load());
    BOOST_CHECK_EQUAL(m_resolver->compositionCalls(100), 1);
    BOOST_CHECK_EQUAL(m_resolver->compositionCalls(200), 1);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// EVENT INTEGRATION TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(EventIntegrationTests, ItemDimControllerTestFixture)

BOOST_AUTO_TEST_CASE(TestBeforeRenderDrivesFrame) {
    m_resolver->addItem(100, true);
    auto node = addItemRoot(100);
    m_controller->subscribe();

    BOOST_CHECK(EventManager::Instance().triggerBeforeRender(7));

    BOOST_CHECK_EQUAL(node->getOpacity(), 150);
    BOOST_CHECK_EQUAL(m_controller->getLastFrameStats().frameNumber, 7);
    BOOST_CHECK_EQUAL(m_controller->getFramesProcessed(), 1);
}

BOOST_AUTO_TEST_CASE(TestDeferredBeforeRenderRunsOnUpdate) {
    m_resolver->addItem(100, true);
    auto node = addItemRoot(100);
    m_controller->subscribe();

    BOOST_CHECK(EventManager::Instance().triggerBeforeRender(3, EventManager::DispatchMode::Deferred));
    BOOST_CHECK_EQUAL(node->writeCount(), 0);

    EventManager::Instance().update();
    BOOST_CHECK_EQUAL(node->getOpacity(), 150);
}

BOOST_AUTO_TEST_CASE(TestClientStateChangeHandled) {
    m_controller->subscribe();

    BOOST_CHECK(EventManager::Instance().triggerClientStateChanged(
        ClientState::LoggedIn, ClientState::Loading, EventManager::DispatchMode::Immediate));
    BOOST_CHECK(EventManager::Instance().triggerClientStateChanged(
        ClientState::Hopping, ClientState::LoggedIn, EventManager::DispatchMode::Immediate));
}

BOOST_AUTO_TEST_CASE(TestNoFrameAfterUnsubscribe) {
    m_resolver->addItem(100, true);
    auto node = addItemRoot(100);
    m_controller->subscribe();
    m_controller->unsubscribe();

    BOOST_CHECK(!EventManager::Instance().triggerBeforeRender(1));
    BOOST_CHECK_EQUAL(node->writeCount(), 0);
}

BOOST_AUTO_TEST_SUITE_END()
