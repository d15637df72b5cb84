/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CONTROLLER_BASE_HPP
#define CONTROLLER_BASE_HPP

/**
 * @file ControllerBase.hpp
 * @brief Base class for event-driven controllers
 *
 * Controllers react to EventManager events and act on host-owned state.
 * They do NOT own the data they act on.
 *
 * Key characteristics:
 * - Owned by the host integration (not singletons)
 * - Auto-unsubscribe on destruction
 * - Handler tokens tracked for individual removal
 */

#include "managers/EventManager.hpp"
#include <string_view>
#include <vector>

class ControllerBase
{
public:
    /**
     * @brief Virtual destructor auto-unsubscribes from all events
     */
    virtual ~ControllerBase() { unsubscribe(); }

    // Non-copyable (event handlers capture 'this')
    ControllerBase(const ControllerBase&) = delete;
    ControllerBase& operator=(const ControllerBase&) = delete;

    /**
     * @brief Subscribe to the controller's events
     * @note Must be idempotent
     */
    virtual void subscribe() = 0;

    /**
     * @brief Controller name for logging and debugging
     */
    [[nodiscard]] virtual std::string_view getName() const = 0;

    /**
     * @brief Unsubscribe from all registered event handlers
     * @note Safe to call multiple times
     */
    virtual void unsubscribe()
    {
        if (!m_subscribed) {
            return;
        }

        auto& eventMgr = EventManager::Instance();
        for (const auto& token : m_handlerTokens) {
            eventMgr.removeHandler(token);
        }
        m_handlerTokens.clear();
        m_subscribed = false;
    }

    [[nodiscard]] bool isSubscribed() const { return m_subscribed; }

protected:
    ControllerBase() = default;

    /**
     * @brief Register a handler token for automatic cleanup
     * @param token The handler token from EventManager::registerHandlerWithToken
     */
    void addHandlerToken(const EventManager::HandlerToken& token)
    {
        m_handlerTokens.push_back(token);
    }

    void setSubscribed(bool subscribed) { m_subscribed = subscribed; }

    [[nodiscard]] bool checkAlreadySubscribed() const { return m_subscribed; }

private:
    bool m_subscribed{false};
    std::vector<EventManager::HandlerToken> m_handlerTokens;
};

#endif // CONTROLLER_BASE_HPP
