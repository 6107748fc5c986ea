// Copyright (c) 2025 The StakePool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEPOOL_POOL_STATE_H
#define STAKEPOOL_POOL_STATE_H

#include "amount.h"
#include "logging.h"
#include "serialize.h"

#include <stdint.h>
#include <string>

/**
 * PoolState - Aggregate counters of one staking pool
 *
 * Two parallel integer ledgers track the pool:
 * - shares: the external asset's native unit, held by the pool
 * - scaled balance: the internal unit used to apportion poolValue across
 *   depositors who joined at different points of the yield curve
 *
 * A participant's claim in value units is
 *   scaledBalance * poolValue / accumulatedScaledBalance
 *
 * INVARIANTS:
 * - every counter is within MoneyRange
 * - accumulatedScaledBalance == sum of all UserAccount.scaledBalance
 *   (checked by CStakePool::CheckInvariants, which sees the accounts)
 * - poolValue == value(totalShares) right after any operation that mutates
 *   totalShares or skims yield
 */
struct PoolState
{
    CAmount totalShares;              // Shares owned by depositors (treasury excluded)
    CAmount treasuryShares;           // Shares skimmed from positive yield
    CAmount poolValue;                // value(totalShares) at the last synchronization
    CAmount accumulatedScaledBalance; // Sum of every scaledBalance
    int64_t lastRewardTimestamp;      // Last skim, informational only

    CAmount maxTotalDeposit;          // Deposit cap in value units
    bool fPaused;                     // Suspended mode: only emergency exit allowed

    PoolState()
    {
        SetNull();
    }

    void SetNull()
    {
        totalShares = 0;
        treasuryShares = 0;
        poolValue = 0;
        accumulatedScaledBalance = 0;
        lastRewardTimestamp = 0;
        maxTotalDeposit = 0;
        fPaused = false;
    }

    bool IsNull() const
    {
        return totalShares == 0 && treasuryShares == 0 && poolValue == 0 &&
               accumulatedScaledBalance == 0 && lastRewardTimestamp == 0;
    }

    /**
     * CheckInvariants - Verify the per-state rules
     *
     * RULES:
     * 1. All counters non-negative and within MoneyRange
     * 2. totalShares + treasuryShares stays within MoneyRange
     *
     * @return true if all rules hold, false otherwise
     */
    bool CheckInvariants() const;

    std::string ToString() const;

    SERIALIZE_METHODS(PoolState, obj)
    {
        READWRITE(obj.totalShares);
        READWRITE(obj.treasuryShares);
        READWRITE(obj.poolValue);
        READWRITE(obj.accumulatedScaledBalance);
        READWRITE(obj.lastRewardTimestamp);
        READWRITE(obj.maxTotalDeposit);
        READWRITE(obj.fPaused);
    }
};

/**
 * UserAccount - One participant's claim
 *
 * Created on first deposit, never deleted: a full exit leaves a zeroed record.
 */
struct UserAccount
{
    CAmount scaledBalance; // Claim in scaled units
    CAmount shares;        // Upper bound on the shares this participant may pull out

    UserAccount()
    {
        SetNull();
    }

    void SetNull()
    {
        scaledBalance = 0;
        shares = 0;
    }

    bool IsNull() const
    {
        return scaledBalance == 0 && shares == 0;
    }

    std::string ToString() const;

    SERIALIZE_METHODS(UserAccount, obj)
    {
        READWRITE(obj.scaledBalance);
        READWRITE(obj.shares);
    }
};

/**
 * CalculateClaim - Value units a scaled balance is currently worth
 *
 * claim = scaledBalance * poolValue / accumulatedScaledBalance (rounded down)
 *
 * @param[in]  scaledBalance            Participant's scaled balance
 * @param[in]  poolValue                Pool value the claim is measured against
 * @param[in]  accumulatedScaledBalance Sum of all scaled balances
 * @param[out] claim                    Result (0 when nothing was ever deposited)
 * @return false on overflow or negative input
 */
bool CalculateClaim(CAmount scaledBalance, CAmount poolValue, CAmount accumulatedScaledBalance, CAmount& claim);

#endif // STAKEPOOL_POOL_STATE_H
