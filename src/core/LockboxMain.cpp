/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "controllers/ui/ItemDimController.hpp"
#include "core/Logger.hpp"
#include "items/ItemCatalog.hpp"
#include "items/UnlockedItemStore.hpp"
#include "managers/EventManager.hpp"
#include "managers/SettingsManager.hpp"
#include "ui/WidgetTree.hpp"
#include <SDL3/SDL.h>
#include <charconv>
#include <cstring>
#include <format>
#include <iterator>
#include <memory>
#include <string>

namespace {

constexpr uint64_t DEFAULT_FRAME_COUNT{6};
constexpr uint32_t FRAME_DELAY_MS{16};
// Item the demo unlocks mid-run to show icons returning to full opacity
constexpr int DEMO_UNLOCK_ITEM_ID{4151};
constexpr uint64_t DEMO_UNLOCK_FRAME{4};

uint64_t parseFrameCount(int argc, char* argv[]) {
  if (argc < 2) {
    return DEFAULT_FRAME_COUNT;
  }
  uint64_t frames = 0;
  const char* begin = argv[1];
  const char* end = begin + std::strlen(begin);
  auto [ptr, ec] = std::from_chars(begin, end, frames);
  if (ec != std::errc() || ptr != end || frames == 0) {
    DEMO_WARN(std::format("Invalid frame count '{}', using {}", begin, DEFAULT_FRAME_COUNT));
    return DEFAULT_FRAME_COUNT;
  }
  return frames;
}

// Inventory (28 slots in the Static partition) and a bank with a
// placeholder, a noted item and a hidden tab holding more items.
void buildInterface(WidgetTree& tree) {
  auto inventory = tree.addRoot(std::make_shared<UIWidget>("inventory"));
  const int inventoryItems[] = {4151, 4151, 995, 11802, 2, 6570, 1215, 11832};
  for (int itemId : inventoryItems) {
    inventory->addChild(ChildPartition::Static,
                        std::make_shared<UIWidget>("inventory_slot", itemId, 1));
  }
  for (int slot = static_cast<int>(std::size(inventoryItems)); slot < 28; ++slot) {
    inventory->addChild(ChildPartition::Static, std::make_shared<UIWidget>("inventory_slot"));
  }

  auto bank = tree.addRoot(std::make_shared<UIWidget>("bank"));
  auto bankItems = bank->addChild(ChildPartition::Dynamic, std::make_shared<UIWidget>("bank_items"));
  bankItems->addChild(ChildPartition::Dynamic, std::make_shared<UIWidget>("bank_slot", 11832, 1));
  bankItems->addChild(ChildPartition::Dynamic, std::make_shared<UIWidget>("bank_slot", 4152, 120));
  // Empty slot the host already draws faded
  auto placeholder = bankItems->addChild(ChildPartition::Dynamic,
                                         std::make_shared<UIWidget>("bank_slot", 14516, 0));
  placeholder->setOpacity(120);
  bankItems->addNullChild(ChildPartition::Dynamic);

  auto hiddenTab = bank->addChild(ChildPartition::Nested, std::make_shared<UIWidget>("bank_tab_2"));
  hiddenTab->setHidden(true);
  hiddenTab->addChild(ChildPartition::Dynamic, std::make_shared<UIWidget>("bank_slot", 11802, 1));

  tree.addNullRoot();
}

} // namespace

int main(int argc, char* argv[]) {
  using namespace LockboxEngine;

  DEMO_INFO(std::format("Starting {}", LOCKBOX_APP_NAME));

  if (!SDL_Init(0)) {
    DEMO_CRITICAL(std::format("SDL_Init failed: {}", SDL_GetError()));
    return -1;
  }

  const uint64_t frameCount = parseFrameCount(argc, argv);

  auto& eventMgr = EventManager::Instance();
  if (!eventMgr.init()) {
    DEMO_CRITICAL("Failed to initialize EventManager");
    SDL_Quit();
    return -1;
  }

  auto& settings = SettingsManager::Instance();
  if (!settings.loadFromFile("res/settings.json")) {
    DEMO_WARN("Failed to load settings.json - using defaults");
  }

  auto catalog = std::make_shared<ItemCatalog>();
  if (!catalog->loadFromJson("res/items.json")) {
    // Unknown items classify as untradeable, so nothing dims
    DEMO_ERROR("Item catalog incomplete, affected items will not be dimmed");
  }

  auto unlocks = std::make_shared<UnlockedItemStore>();
  if (!unlocks->loadFromJson("res/unlocks.json")) {
    DEMO_WARN("Unlock data unavailable, all items treated as unlocked");
  }

  auto client = std::make_shared<WidgetTree>();
  buildInterface(*client);

  {
    ItemDimController dimmer(client, catalog, unlocks);
    dimmer.subscribe();

    client->setClientState(ClientState::LoginScreen);
    client->setClientState(ClientState::Loading);
    client->setClientState(ClientState::LoggedIn);
    eventMgr.update();

    const uint64_t perfFrequency = SDL_GetPerformanceFrequency();

    for (uint64_t frame = 1; frame <= frameCount; ++frame) {
      if (frame == DEMO_UNLOCK_FRAME && unlocks->unlock(DEMO_UNLOCK_ITEM_ID)) {
        DEMO_INFO(std::format("Frame {}: unlocked item {}", frame, DEMO_UNLOCK_ITEM_ID));
      }

      eventMgr.update();

      const uint64_t start = SDL_GetPerformanceCounter();
      if (!eventMgr.triggerBeforeRender(frame)) {
        DEMO_WARN(std::format("Frame {}: no BeforeRender handlers", frame));
      }
      const uint64_t elapsed = SDL_GetPerformanceCounter() - start;
      const double elapsedUs = perfFrequency > 0
          ? static_cast<double>(elapsed) * 1'000'000.0 / static_cast<double>(perfFrequency)
          : 0.0;

      const DimFrameStats& stats = dimmer.getLastFrameStats();
      DEMO_INFO(std::format(
          "Frame {}: visited {} nodes, {} item nodes, {} verdicts ({} cached), "
          "{} opacity writes, {} placeholders skipped, {:.1f}us",
          stats.frameNumber, stats.nodesVisited, stats.itemNodes, stats.verdictsComputed,
          stats.verdictCacheHits, stats.opacityWrites, stats.placeholdersSkipped, elapsedUs));

      SDL_Delay(FRAME_DELAY_MS);
    }

    DEMO_INFO(std::format("Processed {} frames, {} canonical items classified",
                          dimmer.getFramesProcessed(), dimmer.getTradeableCacheSize()));

    client->setClientState(ClientState::LoginScreen);
    eventMgr.update();
  }

  eventMgr.clean();
  SDL_Quit();

  DEMO_INFO("Shutdown complete");
  return 0;
}
