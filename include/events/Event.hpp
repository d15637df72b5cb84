/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef EVENT_HPP
#define EVENT_HPP

/**
 * @file Event.hpp
 * @brief Base class for all event payloads delivered through EventManager
 */

#include <memory>
#include <string>
#include "events/EventTypeId.hpp"

class Event;

using EventPtr = std::shared_ptr<Event>;
using EventWeakPtr = std::weak_ptr<Event>;

class Event {
public:
    virtual ~Event() = default;

    // Event identification
    virtual std::string getName() const = 0;
    virtual std::string getTypeName() const = 0;
    virtual EventTypeId getTypeId() const = 0;

    virtual bool isActive() const { return m_active; }
    virtual void setActive(bool active) { m_active = active; }

    // Higher values = higher priority
    virtual int getPriority() const { return m_priority; }
    virtual void setPriority(int priority) { m_priority = priority; }

protected:
    bool m_active{true};
    int m_priority{0};
};

#endif // EVENT_HPP
