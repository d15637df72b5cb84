/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef FRAME_EVENT_HPP
#define FRAME_EVENT_HPP

/**
 * @file FrameEvent.hpp
 * @brief Host frame lifecycle events
 *
 * BeforeRenderEvent is the last hook of a frame before the scene is
 * composited. Anything written during its dispatch survives into the
 * rendered frame. Always dispatch it in Immediate mode.
 */

#include "events/Event.hpp"
#include "ui/SceneNode.hpp"
#include <cstdint>
#include <string>

class BeforeRenderEvent : public Event
{
public:
    explicit BeforeRenderEvent(uint64_t frameNumber)
        : m_frameNumber(frameNumber) {}

    uint64_t getFrameNumber() const { return m_frameNumber; }

    std::string getName() const override { return "BeforeRenderEvent"; }
    std::string getTypeName() const override { return "BeforeRenderEvent"; }
    EventTypeId getTypeId() const override { return EventTypeId::BeforeRender; }

private:
    uint64_t m_frameNumber;
};

class ClientStateChangedEvent : public Event
{
public:
    ClientStateChangedEvent(ClientState newState, ClientState oldState)
        : m_newState(newState), m_oldState(oldState) {}

    ClientState getNewState() const { return m_newState; }
    ClientState getOldState() const { return m_oldState; }

    std::string getName() const override { return "ClientStateChangedEvent"; }
    std::string getTypeName() const override { return "ClientStateChangedEvent"; }
    EventTypeId getTypeId() const override { return EventTypeId::ClientStateChanged; }

private:
    ClientState m_newState;
    ClientState m_oldState;
};

#endif // FRAME_EVENT_HPP
