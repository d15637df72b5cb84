/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ui/WidgetTree.hpp"
#include "core/Logger.hpp"
#include "managers/EventManager.hpp"
#include <format>

UIWidget::UIWidget(std::string name, int itemId, int quantity)
    : m_name(std::move(name))
    , m_itemId(itemId)
    , m_quantity(quantity)
{
}

void UIWidget::setOpacity(int opacity)
{
    m_opacity = opacity;
    ++m_opacityWrites;
}

const SceneNodeList* UIWidget::getChildren(ChildPartition partition) const
{
    const auto index = static_cast<size_t>(partition);
    if (index >= m_children.size()) {
        return nullptr;
    }
    return m_children[index].get();
}

void UIWidget::setItem(int itemId, int quantity)
{
    m_itemId = itemId;
    m_quantity = quantity;
}

std::shared_ptr<UIWidget> UIWidget::addChild(ChildPartition partition,
                                             std::shared_ptr<UIWidget> child)
{
    ensurePartition(partition).push_back(child);
    return child;
}

void UIWidget::addNullChild(ChildPartition partition)
{
    ensurePartition(partition).push_back(nullptr);
}

void UIWidget::clearChildren(ChildPartition partition)
{
    m_children[static_cast<size_t>(partition)].reset();
}

SceneNodeList& UIWidget::ensurePartition(ChildPartition partition)
{
    auto& slot = m_children[static_cast<size_t>(partition)];
    if (!slot) {
        slot = std::make_unique<SceneNodeList>();
    }
    return *slot;
}

ClientState WidgetTree::getClientState() const
{
    return m_state.load(std::memory_order_acquire);
}

const SceneNodeList* WidgetTree::getWidgetRoots() const
{
    return m_interfaceLoaded ? &m_roots : nullptr;
}

void WidgetTree::setClientState(ClientState state)
{
    const ClientState previous = m_state.exchange(state, std::memory_order_acq_rel);
    if (previous == state) {
        return;
    }

    HOST_INFO(std::format("Client state {} -> {}", clientStateToString(previous),
                          clientStateToString(state)));
    // Deferred so handlers run on the thread that pumps EventManager::update()
    if (!EventManager::Instance().triggerClientStateChanged(state, previous,
                                                            EventManager::DispatchMode::Deferred)) {
        HOST_DEBUG("ClientStateChanged dispatch rejected by EventManager, state change not announced");
    }
}

std::shared_ptr<UIWidget> WidgetTree::addRoot(std::shared_ptr<UIWidget> root)
{
    m_roots.push_back(root);
    return root;
}

void WidgetTree::addNullRoot()
{
    m_roots.push_back(nullptr);
}

void WidgetTree::clearRoots()
{
    m_roots.clear();
}
