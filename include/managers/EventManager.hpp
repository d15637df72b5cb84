/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef EVENT_MANAGER_HPP
#define EVENT_MANAGER_HPP

/**
 * @file EventManager.hpp
 * @brief Type-indexed event dispatcher for host lifecycle events
 *
 * - Handlers are stored per EventTypeId, no string lookups on dispatch
 * - Token-based removal so controllers can unsubscribe individually
 * - Immediate dispatch runs handlers on the calling thread before returning
 * - Deferred dispatch queues the event until the next update()
 * - Handler exceptions are contained and logged, never propagated
 */

#include "events/EventTypeId.hpp"
#include "ui/SceneNode.hpp"
#include <array>
#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

class Event;

using EventPtr = std::shared_ptr<Event>;

/**
 * @brief Event payload handed to handlers
 */
struct EventData {
  EventPtr event;
  uint32_t flags{0};
  uint32_t priority{0};
  EventTypeId typeId{EventTypeId::Custom};

  static constexpr uint32_t FLAG_ACTIVE = 1 << 0;

  bool isActive() const { return flags & FLAG_ACTIVE; }
  void setActive(bool active) {
    if (active) flags |= FLAG_ACTIVE; else flags &= ~FLAG_ACTIVE;
  }
};

/**
 * @brief Event priority constants for deferred processing order
 */
struct EventPriority {
  static constexpr uint32_t CRITICAL = 1000;
  static constexpr uint32_t HIGH = 800;
  static constexpr uint32_t NORMAL = 500;
  static constexpr uint32_t LOW = 200;
  static constexpr uint32_t DEFERRED = 0;
};

using FastEventHandler = std::function<void(const EventData &)>;

class EventManager {
public:
  static EventManager &Instance();

  enum class DispatchMode : uint8_t { Deferred = 0, Immediate = 1 };

  bool init();
  bool isInitialized() const;
  bool isShutdown() const;

  /**
   * @brief Drops all handlers and queued events
   */
  void clean();

  /**
   * @brief Drains the deferred dispatch queue
   */
  void update();

  // Handler registration (type-safe)
  struct HandlerToken {
    EventTypeId typeId;
    uint64_t id;
  };
  HandlerToken registerHandlerWithToken(EventTypeId typeId,
                                        FastEventHandler handler);
  void registerHandler(EventTypeId typeId, FastEventHandler handler);
  bool removeHandler(const HandlerToken &token);
  void removeHandlers(EventTypeId typeId);
  void clearAllHandlers();
  size_t getHandlerCount(EventTypeId typeId) const;

  /**
   * @brief Dispatch an already-built payload
   * @return true if dispatched (Immediate) or queued (Deferred); false when
   *         no handler listens (Immediate) or the manager is not initialized
   */
  bool dispatchEvent(const EventPtr &event,
                     DispatchMode mode = DispatchMode::Deferred) const;

  // Host lifecycle triggers (no registration)
  bool triggerBeforeRender(uint64_t frameNumber,
                           DispatchMode mode = DispatchMode::Immediate) const;
  bool triggerClientStateChanged(ClientState newState, ClientState oldState,
                                 DispatchMode mode = DispatchMode::Deferred) const;

  size_t getPendingDispatchCount() const;

private:
  EventManager() = default;
  ~EventManager();
  EventManager(const EventManager &) = delete;
  EventManager &operator=(const EventManager &) = delete;

  struct HandlerEntry {
    FastEventHandler callable;
    uint64_t id{0};

    HandlerEntry() = default;
    HandlerEntry(FastEventHandler fn, uint64_t handlerId)
        : callable(std::move(fn)), id(handlerId) {}
    explicit operator bool() const { return static_cast<bool>(callable); }
  };

  struct PendingDispatch {
    EventTypeId typeId;
    EventData data;
  };

  bool dispatchData(EventTypeId typeId, const EventData &eventData,
                    DispatchMode mode, const char *errorContext) const;
  void invokeHandlers(EventTypeId typeId, const EventData &eventData,
                      const char *errorContext) const;
  void enqueueDispatch(EventTypeId typeId, const EventData &data) const;

  std::array<std::vector<HandlerEntry>, static_cast<size_t>(EventTypeId::COUNT)>
      m_handlersByType;
  std::atomic<uint64_t> m_nextHandlerId{1};
  mutable std::shared_mutex m_handlersMutex;

  mutable std::mutex m_dispatchMutex;
  mutable std::deque<PendingDispatch> m_pendingDispatch;
  static constexpr size_t MAX_DISPATCH_QUEUE = 1024;

  std::atomic<bool> m_initialized{false};
  bool m_isShutdown{false};
};

#endif // EVENT_MANAGER_HPP
