/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "items/ItemCatalog.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <format>
#include <mutex>

namespace LockboxEngine {

std::optional<int> ItemCatalog::canonicalize(int rawItemId) const
{
    std::shared_lock<std::shared_mutex> lock(m_itemsMutex);

    auto it = m_items.find(rawItemId);
    if (it == m_items.end()) {
        return std::nullopt;
    }

    const ItemComposition& comp = it->second;
    if (comp.isNoted() && comp.linkedNoteId > 0) {
        return comp.linkedNoteId;
    }
    if (comp.isPlaceholder() && comp.placeholderId > 0) {
        return comp.placeholderId;
    }
    return rawItemId;
}

CompositionLookup ItemCatalog::getComposition(int itemId) const
{
    std::shared_lock<std::shared_mutex> lock(m_itemsMutex);

    auto it = m_items.find(itemId);
    if (it == m_items.end()) {
        return CompositionLookup::makeMissing();
    }
    return CompositionLookup::makeFound(it->second);
}

bool ItemCatalog::registerItem(const ItemComposition& composition)
{
    if (composition.id <= 0) {
        CATALOG_WARN(std::format("Rejected item with invalid id {}", composition.id));
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(m_itemsMutex);
    m_items.insert_or_assign(composition.id, composition);
    return true;
}

bool ItemCatalog::removeItem(int itemId)
{
    std::unique_lock<std::shared_mutex> lock(m_itemsMutex);
    return m_items.erase(itemId) > 0;
}

void ItemCatalog::clear()
{
    std::unique_lock<std::shared_mutex> lock(m_itemsMutex);
    m_items.clear();
}

bool ItemCatalog::loadFromJson(const std::string& filename)
{
    JsonReader reader;
    if (!reader.loadFromFile(filename)) {
        CATALOG_ERROR("ItemCatalog::loadFromJson - Failed to load " + filename +
                      ": " + reader.getLastError());
        return false;
    }
    return loadFromRoot(reader.getRoot(), filename);
}

bool ItemCatalog::loadFromJsonString(std::string_view jsonString)
{
    JsonReader reader;
    if (!reader.parse(jsonString)) {
        CATALOG_ERROR("ItemCatalog::loadFromJsonString - Failed to parse JSON: " +
                      reader.getLastError());
        return false;
    }
    return loadFromRoot(reader.getRoot(), "<memory>");
}

bool ItemCatalog::loadFromRoot(const JsonValue& root, const std::string& source)
{
    if (!root.isObject()) {
        CATALOG_ERROR("ItemCatalog - Root JSON is not an object: " + source);
        return false;
    }

    const JsonArray* itemsArray = root["items"].tryAsArray();
    if (itemsArray == nullptr) {
        CATALOG_ERROR("ItemCatalog - Missing or invalid 'items' array: " + source);
        return false;
    }

    size_t loadedCount = 0;
    size_t failedCount = 0;

    for (size_t i = 0; i < itemsArray->size(); ++i) {
        auto composition = parseItem((*itemsArray)[i]);
        if (composition && registerItem(*composition)) {
            ++loadedCount;
            CATALOG_DEBUG(std::format("Loaded item {} ({})", composition->id,
                                      composition->name));
        } else {
            ++failedCount;
            CATALOG_WARN(std::format("Invalid item definition at index {} in {}",
                                     i, source));
        }
    }

    CATALOG_INFO(std::format("Loaded {} items from {} ({} failed)", loadedCount,
                             source, failedCount));

    // Only a fully clean file counts as success
    return failedCount == 0;
}

std::optional<ItemComposition> ItemCatalog::parseItem(const JsonValue& itemJson)
{
    if (!itemJson.isObject()) {
        return std::nullopt;
    }

    auto id = itemJson["id"].tryAsInt();
    if (!id || *id <= 0) {
        return std::nullopt;
    }

    ItemComposition comp;
    comp.id = *id;
    comp.name = itemJson["name"].tryAsString().value_or("");
    comp.tradeable = itemJson["tradeable"].tryAsBool().value_or(false);
    comp.noteTemplateId =
        itemJson["noted_template"].tryAsInt().value_or(ItemComposition::NO_TEMPLATE);
    comp.linkedNoteId = itemJson["linked_note_id"].tryAsInt().value_or(-1);
    comp.placeholderTemplateId =
        itemJson["placeholder_template"].tryAsInt().value_or(ItemComposition::NO_TEMPLATE);
    comp.placeholderId = itemJson["placeholder_id"].tryAsInt().value_or(-1);
    return comp;
}

size_t ItemCatalog::getItemCount() const
{
    std::shared_lock<std::shared_mutex> lock(m_itemsMutex);
    return m_items.size();
}

bool ItemCatalog::hasItem(int itemId) const
{
    std::shared_lock<std::shared_mutex> lock(m_itemsMutex);
    return m_items.find(itemId) != m_items.end();
}

} // namespace LockboxEngine
