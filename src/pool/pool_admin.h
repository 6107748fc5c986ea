// Copyright (c) 2025 The StakePool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEPOOL_POOL_ADMIN_H
#define STAKEPOOL_POOL_ADMIN_H

#include "amount.h"

#include <map>
#include <set>
#include <stdint.h>
#include <string>

class CPoolValidationState;
class CRateOracle;
struct PoolState;

/** The two roles gating administrative operations */
enum class PoolRole : uint8_t {
    ADMIN = 0,  // deposit cap, treasury withdrawal, role management
    PAUSER = 1, // pause / unpause
};

std::string PoolRoleName(PoolRole role);
/** Parse "admin" / "pauser" (case-sensitive) */
bool ParsePoolRole(const std::string& str, PoolRole& role);

/**
 * CPoolRoles - Role membership
 *
 * Not thread-safe: owned by CStakePool and accessed under cs_pool.
 */
class CPoolRoles
{
private:
    std::map<PoolRole, std::set<std::string>> mapMembers;

public:
    bool HasRole(PoolRole role, const std::string& strAccount) const;
    /** @return false if the account already held the role */
    bool Grant(PoolRole role, const std::string& strAccount);
    /** @return false if the account did not hold the role */
    bool Revoke(PoolRole role, const std::string& strAccount);
    size_t CountMembers(PoolRole role) const;
    std::set<std::string> GetMembers(PoolRole role) const;
    void Clear() { mapMembers.clear(); }
};

/**
 * CheckSetDepositCap - A cap must be positive and cover the current pool value
 */
bool CheckSetDepositCap(const PoolState& state, CAmount nNewCap, CPoolValidationState& vstate);

/**
 * CheckPoolPause - Reject pausing a paused pool (fPause) or unpausing a running one
 */
bool CheckPoolPause(const PoolState& state, bool fPause, CPoolValidationState& vstate);

struct PoolAdminWithdrawResult
{
    CAmount nShares{0}; // treasury shares sent to the destination
};

/**
 * ApplyAdminWithdraw - Debit treasury shares worth nAmount
 *
 * Touches treasuryShares only, never user accounting. The share transfer is
 * left to the caller.
 */
bool ApplyAdminWithdraw(PoolState& state, const CRateOracle& oracle, CAmount nAmount, const std::string& strDestination,
                        PoolAdminWithdrawResult& result, CPoolValidationState& vstate);

#endif // STAKEPOOL_POOL_ADMIN_H
