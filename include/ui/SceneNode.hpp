/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SCENE_NODE_HPP
#define SCENE_NODE_HPP

/**
 * @file SceneNode.hpp
 * @brief Host-facing view of the UI scene forest
 *
 * Nodes are owned and structurally mutated by the host. Subsystems that walk
 * the forest may read every attribute but only write opacity.
 *
 * Each node keeps three disjoint child partitions. Any partition may be
 * absent (nullptr) and any entry within a partition may be null.
 */

#include <cstdint>
#include <memory>
#include <vector>

enum class ChildPartition : uint8_t
{
    Dynamic = 0,
    Static = 1,
    Nested = 2,
    COUNT = 3
};

/**
 * @brief Host client lifecycle states
 *
 * Only LoggedIn means the item UI is live and safe to mutate.
 */
enum class ClientState : uint8_t
{
    Starting = 0,
    LoginScreen = 1,
    Loading = 2,
    LoggedIn = 3,
    Hopping = 4
};

inline const char* clientStateToString(ClientState state)
{
    switch (state) {
        case ClientState::Starting:    return "Starting";
        case ClientState::LoginScreen: return "LoginScreen";
        case ClientState::Loading:     return "Loading";
        case ClientState::LoggedIn:    return "LoggedIn";
        case ClientState::Hopping:     return "Hopping";
        default:                       return "Unknown";
    }
}

class SceneNode;

using SceneNodePtr = std::shared_ptr<SceneNode>;
using SceneNodeList = std::vector<SceneNodePtr>;

class SceneNode
{
public:
    virtual ~SceneNode() = default;

    virtual bool isHidden() const = 0;

    /**
     * @brief Item bound to this node
     * @return Item id, or a value <= 0 when no item is bound
     */
    virtual int getItemId() const = 0;
    virtual int getItemQuantity() const = 0;

    // Opacity 0 (opaque) .. 255 (fully transparent)
    virtual int getOpacity() const = 0;
    virtual void setOpacity(int opacity) = 0;

    /**
     * @brief Child partition accessor
     * @return Pointer to the partition, or nullptr when it is absent
     */
    virtual const SceneNodeList* getChildren(ChildPartition partition) const = 0;
};

/**
 * @brief Host client services consumed by frame-hook subsystems
 */
class IGameClient
{
public:
    virtual ~IGameClient() = default;

    virtual ClientState getClientState() const = 0;

    /**
     * @brief Root nodes of the current frame's UI forest
     * @return Pointer to the roots, or nullptr when no interface is loaded
     */
    virtual const SceneNodeList* getWidgetRoots() const = 0;
};

#endif // SCENE_NODE_HPP
