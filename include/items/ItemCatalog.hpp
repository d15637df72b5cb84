/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ITEM_CATALOG_HPP
#define ITEM_CATALOG_HPP

#include "items/IItemIdentityResolver.hpp"
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace LockboxEngine {

class JsonValue;

/**
 * @brief In-memory item definitions backing IItemIdentityResolver
 *
 * JSON layout:
 * @code
 * { "items": [
 *     { "id": 100, "name": "Rune scimitar", "tradeable": true },
 *     { "id": 101, "name": "Rune scimitar", "tradeable": true,
 *       "noted_template": 799, "linked_note_id": 100 },
 *     { "id": 102, "name": "Rune scimitar", "tradeable": false,
 *       "placeholder_template": 14401, "placeholder_id": 100 }
 * ] }
 * @endcode
 *
 * Canonicalization: noted forms map to their unnoted item, placeholders to
 * the item they stand for, everything else to itself. Unknown ids fail.
 */
class ItemCatalog : public IItemIdentityResolver
{
public:
    ItemCatalog() = default;
    ~ItemCatalog() override = default;

    ItemCatalog(const ItemCatalog&) = delete;
    ItemCatalog& operator=(const ItemCatalog&) = delete;

    // --- IItemIdentityResolver ---
    std::optional<int> canonicalize(int rawItemId) const override;
    CompositionLookup getComposition(int itemId) const override;

    /**
     * @brief Register or replace one item definition
     * @return false if the id is not positive
     */
    bool registerItem(const ItemComposition& composition);
    bool removeItem(int itemId);
    void clear();

    bool loadFromJson(const std::string& filename);
    bool loadFromJsonString(std::string_view jsonString);

    size_t getItemCount() const;
    bool hasItem(int itemId) const;

private:
    bool loadFromRoot(const JsonValue& root, const std::string& source);
    static std::optional<ItemComposition> parseItem(const JsonValue& itemJson);

    std::unordered_map<int, ItemComposition> m_items;
    mutable std::shared_mutex m_itemsMutex;
};

} // namespace LockboxEngine

#endif // ITEM_CATALOG_HPP
