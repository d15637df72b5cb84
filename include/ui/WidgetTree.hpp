/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WIDGET_TREE_HPP
#define WIDGET_TREE_HPP

/**
 * @file WidgetTree.hpp
 * @brief In-process host model of the UI forest
 *
 * UIWidget and WidgetTree are the concrete SceneNode / IGameClient used by
 * the demo executable and the tests. A real client integration supplies its
 * own implementations of the same interfaces.
 */

#include "ui/SceneNode.hpp"
#include <array>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

class UIWidget : public SceneNode
{
public:
    explicit UIWidget(std::string name = "", int itemId = -1, int quantity = 0);
    ~UIWidget() override = default;

    // --- SceneNode ---
    bool isHidden() const override { return m_hidden; }
    int getItemId() const override { return m_itemId; }
    int getItemQuantity() const override { return m_quantity; }
    int getOpacity() const override { return m_opacity; }
    void setOpacity(int opacity) override;
    const SceneNodeList* getChildren(ChildPartition partition) const override;

    void setHidden(bool hidden) { m_hidden = hidden; }
    void setItem(int itemId, int quantity);
    const std::string& getName() const { return m_name; }

    /**
     * @brief Append a child, creating the partition on first use
     * @return The added child, for chaining
     */
    std::shared_ptr<UIWidget> addChild(ChildPartition partition,
                                       std::shared_ptr<UIWidget> child);

    /**
     * @brief Append an empty slot to a partition (creates the partition)
     */
    void addNullChild(ChildPartition partition);

    void clearChildren(ChildPartition partition);

    size_t getOpacityWriteCount() const { return m_opacityWrites; }

private:
    SceneNodeList& ensurePartition(ChildPartition partition);

    std::string m_name;
    int m_itemId{-1};
    int m_quantity{0};
    int m_opacity{0};
    bool m_hidden{false};
    size_t m_opacityWrites{0};

    std::array<std::unique_ptr<SceneNodeList>, static_cast<size_t>(ChildPartition::COUNT)>
        m_children{};
};

class WidgetTree : public IGameClient
{
public:
    WidgetTree() = default;
    ~WidgetTree() override = default;

    WidgetTree(const WidgetTree&) = delete;
    WidgetTree& operator=(const WidgetTree&) = delete;

    // --- IGameClient ---
    ClientState getClientState() const override;
    const SceneNodeList* getWidgetRoots() const override;

    /**
     * @brief Transition the client state
     *
     * Queues a ClientStateChanged event (processed on the next
     * EventManager::update()) when the state actually changes.
     */
    void setClientState(ClientState state);

    std::shared_ptr<UIWidget> addRoot(std::shared_ptr<UIWidget> root);
    void addNullRoot();
    void clearRoots();

    /**
     * @brief Simulates an unloaded interface: getWidgetRoots() returns nullptr
     */
    void setInterfaceLoaded(bool loaded) { m_interfaceLoaded = loaded; }

private:
    std::atomic<ClientState> m_state{ClientState::Starting};
    SceneNodeList m_roots;
    bool m_interfaceLoaded{true};
};

#endif // WIDGET_TREE_HPP
