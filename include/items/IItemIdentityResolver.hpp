/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef I_ITEM_IDENTITY_RESOLVER_HPP
#define I_ITEM_IDENTITY_RESOLVER_HPP

#include "items/ItemComposition.hpp"
#include <optional>

namespace LockboxEngine {

/**
 * @brief Item metadata provider: canonicalization and composition lookup
 *
 * Implementations must not throw; failures are reported through the
 * return values.
 */
class IItemIdentityResolver
{
public:
    virtual ~IItemIdentityResolver() = default;

    /**
     * @brief Map a raw (variant) item id onto its canonical id
     * @return Canonical id, or std::nullopt when canonicalization failed
     */
    virtual std::optional<int> canonicalize(int rawItemId) const = 0;

    virtual CompositionLookup getComposition(int itemId) const = 0;
};

} // namespace LockboxEngine

#endif // I_ITEM_IDENTITY_RESOLVER_HPP
