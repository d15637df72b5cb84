/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/EventManager.hpp"
#include "core/Logger.hpp"
#include "events/Event.hpp"
#include "events/FrameEvent.hpp"

#include <algorithm>

EventManager &EventManager::Instance()
{
  static EventManager instance;
  return instance;
}

EventManager::~EventManager()
{
  if (!m_isShutdown) {
    clean();
  }
}

bool EventManager::init() {
  if (m_initialized.load()) {
    EVENT_WARN("EventManager already initialized");
    return true;
  }

  // Allow re-initialization after clean()
  m_isShutdown = false;

  {
    std::unique_lock<std::shared_mutex> lock(m_handlersMutex);
    for (auto &handlerContainer : m_handlersByType) {
      handlerContainer.clear();
      constexpr size_t HANDLER_CONTAINER_CAPACITY = 16;
      handlerContainer.reserve(HANDLER_CONTAINER_CAPACITY);
    }
  }

  {
    std::lock_guard<std::mutex> lock(m_dispatchMutex);
    m_pendingDispatch.clear();
  }

  m_initialized.store(true);
  EVENT_INFO("EventManager initialized");
  return true;
}

bool EventManager::isInitialized() const
{
  return m_initialized.load();
}

bool EventManager::isShutdown() const
{
  return m_isShutdown;
}

void EventManager::clean() {
  if (!m_initialized.load(std::memory_order_acquire) || m_isShutdown) {
    return;
  }

  // Set shutdown flags early to prevent new work
  m_isShutdown = true;
  m_initialized.store(false, std::memory_order_release);

  clearAllHandlers();

  {
    std::lock_guard<std::mutex> lock(m_dispatchMutex);
    m_pendingDispatch.clear();
  }
  // Skip logging here: clean() may run during static destruction
}

void EventManager::update() {
  if (!m_initialized.load() || m_isShutdown) {
    return;
  }

  std::vector<PendingDispatch> local;
  {
    std::lock_guard<std::mutex> lock(m_dispatchMutex);
    local.reserve(m_pendingDispatch.size());
    while (!m_pendingDispatch.empty()) {
      local.push_back(std::move(m_pendingDispatch.front()));
      m_pendingDispatch.pop_front();
    }
  }

  // Higher priority first, FIFO within the same priority
  std::stable_sort(local.begin(), local.end(),
                   [](const PendingDispatch &a, const PendingDispatch &b) {
                     return a.data.priority > b.data.priority;
                   });

  for (const auto &pd : local) {
    invokeHandlers(pd.typeId, pd.data, "deferred dispatch");
  }
}

void EventManager::registerHandler(EventTypeId typeId,
                                   FastEventHandler handler) {
  (void)registerHandlerWithToken(typeId, std::move(handler));
}

EventManager::HandlerToken
EventManager::registerHandlerWithToken(EventTypeId typeId, FastEventHandler handler) {
  std::unique_lock<std::shared_mutex> lock(m_handlersMutex);
  const size_t idx = static_cast<size_t>(typeId);
  uint64_t id = m_nextHandlerId.fetch_add(1, std::memory_order_relaxed);

  m_handlersByType[idx].emplace_back(std::move(handler), id);
  return HandlerToken{typeId, id};
}

bool EventManager::removeHandler(const HandlerToken &token) {
  std::unique_lock<std::shared_mutex> lock(m_handlersMutex);
  const size_t idx = static_cast<size_t>(token.typeId);
  if (idx >= m_handlersByType.size()) return false;

  auto &entries = m_handlersByType[idx];
  auto it = std::find_if(entries.begin(), entries.end(),
                         [&token](const HandlerEntry &entry) {
                           return entry.id == token.id;
                         });
  if (it == entries.end()) {
    return false;
  }
  entries.erase(it);
  return true;
}

void EventManager::removeHandlers(EventTypeId typeId) {
  std::unique_lock<std::shared_mutex> lock(m_handlersMutex);
  m_handlersByType[static_cast<size_t>(typeId)].clear();
}

void EventManager::clearAllHandlers() {
  std::unique_lock<std::shared_mutex> lock(m_handlersMutex);
  for (auto &handlers : m_handlersByType) {
    handlers.clear();
  }
}

size_t EventManager::getHandlerCount(EventTypeId typeId) const {
  std::shared_lock<std::shared_mutex> lock(m_handlersMutex);
  return m_handlersByType[static_cast<size_t>(typeId)].size();
}

bool EventManager::dispatchEvent(const EventPtr &event, DispatchMode mode) const {
  if (!event) {
    return false;
  }

  EventData data;
  data.typeId = event->getTypeId();
  data.setActive(event->isActive());
  data.priority = static_cast<uint32_t>(std::max(0, event->getPriority()));
  data.event = event;
  return dispatchData(data.typeId, data, mode, "dispatchEvent");
}

bool EventManager::triggerBeforeRender(uint64_t frameNumber, DispatchMode mode) const {
  EventData data;
  data.typeId = EventTypeId::BeforeRender;
  data.priority = EventPriority::CRITICAL;
  data.setActive(true);
  data.event = std::make_shared<BeforeRenderEvent>(frameNumber);
  return dispatchData(EventTypeId::BeforeRender, data, mode, "triggerBeforeRender");
}

bool EventManager::triggerClientStateChanged(ClientState newState, ClientState oldState,
                                             DispatchMode mode) const {
  EventData data;
  data.typeId = EventTypeId::ClientStateChanged;
  data.priority = EventPriority::HIGH;
  data.setActive(true);
  data.event = std::make_shared<ClientStateChangedEvent>(newState, oldState);
  return dispatchData(EventTypeId::ClientStateChanged, data, mode,
                      "triggerClientStateChanged");
}

size_t EventManager::getPendingDispatchCount() const {
  std::lock_guard<std::mutex> lock(m_dispatchMutex);
  return m_pendingDispatch.size();
}

bool EventManager::dispatchData(EventTypeId typeId, const EventData &eventData,
                                DispatchMode mode, const char *errorContext) const {
  if (!m_initialized.load(std::memory_order_acquire)) {
    return false;
  }

  if (mode == DispatchMode::Immediate) {
    {
      std::shared_lock<std::shared_mutex> lock(m_handlersMutex);
      if (m_handlersByType[static_cast<size_t>(typeId)].empty()) {
        return false;
      }
    }
    invokeHandlers(typeId, eventData, errorContext);
    return true;
  }

  enqueueDispatch(typeId, eventData);
  return true;
}

void EventManager::invokeHandlers(EventTypeId typeId, const EventData &eventData,
                                  const char *errorContext) const {
  // Copy out so handlers may (un)register without deadlocking
  std::vector<FastEventHandler> handlers;
  {
    std::shared_lock<std::shared_mutex> lock(m_handlersMutex);
    const auto &entries = m_handlersByType[static_cast<size_t>(typeId)];
    handlers.reserve(entries.size());
    for (const auto &entry : entries) {
      if (entry) {
        handlers.push_back(entry.callable);
      }
    }
  }

  for (const auto &handler : handlers) {
    try {
      handler(eventData);
    } catch (const std::exception &e) {
      EVENT_ERROR(std::string("Handler exception in ") + errorContext + ": " + e.what());
    } catch (...) {
      EVENT_ERROR(std::string("Unknown handler exception in ") + errorContext);
    }
  }
}

void EventManager::enqueueDispatch(EventTypeId typeId, const EventData &data) const {
  std::lock_guard<std::mutex> lock(m_dispatchMutex);
  if (m_pendingDispatch.size() >= MAX_DISPATCH_QUEUE) {
    EVENT_WARN("Deferred dispatch queue full, dropping oldest event");
    m_pendingDispatch.pop_front();
  }
  m_pendingDispatch.push_back(PendingDispatch{typeId, data});
}
