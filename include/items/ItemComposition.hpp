/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ITEM_COMPOSITION_HPP
#define ITEM_COMPOSITION_HPP

#include <cstdint>
#include <string>

namespace LockboxEngine {

/**
 * @brief Static metadata for one item id
 *
 * Template fields use -1 for "not a variant of that kind". Link fields use
 * 0 or -1 for "no linked id".
 */
struct ItemComposition
{
    static constexpr int NO_TEMPLATE = -1;

    int id{0};
    std::string name{};
    bool tradeable{false};

    // Noted form: noteTemplateId != -1, linkedNoteId is the unnoted item
    int noteTemplateId{NO_TEMPLATE};
    int linkedNoteId{-1};

    // Bank placeholder: placeholderTemplateId != -1, placeholderId is the real item
    int placeholderTemplateId{NO_TEMPLATE};
    int placeholderId{-1};

    bool isNoted() const { return noteTemplateId != NO_TEMPLATE; }
    bool isPlaceholder() const { return placeholderTemplateId != NO_TEMPLATE; }
};

enum class LookupStatus : uint8_t
{
    Found = 0,   // composition holds valid data
    Missing = 1, // lookup worked, the id has no metadata
    Failed = 2   // provider error, nothing is known
};

struct CompositionLookup
{
    LookupStatus status{LookupStatus::Failed};
    ItemComposition composition{};

    bool found() const { return status == LookupStatus::Found; }

    static CompositionLookup makeFound(ItemComposition comp)
    {
        return CompositionLookup{LookupStatus::Found, std::move(comp)};
    }
    static CompositionLookup makeMissing() { return CompositionLookup{LookupStatus::Missing, {}}; }
    static CompositionLookup makeFailed() { return CompositionLookup{LookupStatus::Failed, {}}; }
};

} // namespace LockboxEngine

#endif // ITEM_COMPOSITION_HPP
