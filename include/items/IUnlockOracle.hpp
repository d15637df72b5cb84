/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef I_UNLOCK_ORACLE_HPP
#define I_UNLOCK_ORACLE_HPP

#include <optional>

namespace LockboxEngine {

/**
 * @brief Set-membership query over the user's unlocked items
 */
class IUnlockOracle
{
public:
    virtual ~IUnlockOracle() = default;

    /**
     * @return Membership, or std::nullopt when the store cannot answer
     */
    virtual std::optional<bool> isUnlocked(int itemId) const = 0;
};

} // namespace LockboxEngine

#endif // I_UNLOCK_ORACLE_HPP
