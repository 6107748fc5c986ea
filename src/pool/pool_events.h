// Copyright (c) 2025 The StakePool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEPOOL_POOL_EVENTS_H
#define STAKEPOOL_POOL_EVENTS_H

#include "amount.h"

#include <stdint.h>
#include <string>

enum class PoolEventType {
    DEPOSITED,
    WITHDRAWN,
    REWARDS_ASSIGNED,
    DEPOSIT_CAP_UPDATED,
    EMERGENCY_WITHDRAWN,
    PAUSED,
    UNPAUSED,
    TREASURY_WITHDRAWN,
};

/** Lower-case event name as published to observers, e.g. "deposited" */
std::string PoolEventTypeName(PoolEventType type);

/**
 * CPoolEvent - Notification of a committed pool operation
 *
 * Carries the literal amounts computed by the operation. Fields that do not
 * apply to an event type are left at zero / empty.
 *
 *   DEPOSITED, WITHDRAWN, EMERGENCY_WITHDRAWN: strAccount, nAmount, nShares
 *   REWARDS_ASSIGNED:                          nShares (skimmed), nTotalShares, nTime
 *   DEPOSIT_CAP_UPDATED:                       nOldCap, nNewCap
 *   PAUSED, UNPAUSED:                          strAccount (caller)
 *   TREASURY_WITHDRAWN:                        strAccount (destination), nAmount, nShares
 */
struct CPoolEvent
{
    PoolEventType type;
    std::string strAccount;
    CAmount nAmount{0};
    CAmount nShares{0};
    CAmount nTotalShares{0};
    int64_t nTime{0};
    CAmount nOldCap{0};
    CAmount nNewCap{0};

    explicit CPoolEvent(PoolEventType typeIn) : type(typeIn) {}

    static CPoolEvent Deposited(const std::string& account, CAmount amount, CAmount shares);
    static CPoolEvent Withdrawn(const std::string& account, CAmount amount, CAmount shares);
    static CPoolEvent RewardsAssigned(CAmount sharesYield, CAmount totalShares, int64_t nTime);
    static CPoolEvent DepositCapUpdated(CAmount oldCap, CAmount newCap);
    static CPoolEvent EmergencyWithdrawn(const std::string& account, CAmount amount, CAmount shares);
    static CPoolEvent Paused(const std::string& caller);
    static CPoolEvent Unpaused(const std::string& caller);
    static CPoolEvent TreasuryWithdrawn(const std::string& destination, CAmount amount, CAmount shares);

    std::string ToString() const;
};

/** Observer of committed pool operations. Called under the pool lock. */
class CPoolEventListener
{
public:
    virtual ~CPoolEventListener() {}
    virtual void PoolEvent(const CPoolEvent& event) = 0;
};

#endif // STAKEPOOL_POOL_EVENTS_H
