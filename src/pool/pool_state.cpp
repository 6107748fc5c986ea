// Copyright (c) 2025 The StakePool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pool/pool_state.h"

#include "pool/pool_math.h"
#include "utilmoneystr.h"

bool PoolState::CheckInvariants() const
{
    bool range_ok = MoneyRange(totalShares) && MoneyRange(treasuryShares) &&
                    MoneyRange(poolValue) && MoneyRange(accumulatedScaledBalance) &&
                    MoneyRange(maxTotalDeposit) && lastRewardTimestamp >= 0;

    // Treasury and user shares are both held by the pool
    bool shares_ok = range_ok && MoneyRange(totalShares + treasuryShares);

    if (!range_ok || !shares_ok) {
        LogPrintf("POOL INVARIANT VIOLATION: %s\n", ToString());
    }

    return range_ok && shares_ok;
}

std::string PoolState::ToString() const
{
    return strprintf("PoolState(totalShares=%s, treasuryShares=%s, poolValue=%s, accumulatedScaledBalance=%s, "
                     "lastRewardTimestamp=%d, maxTotalDeposit=%s, paused=%d)",
                     FormatMoney(totalShares), FormatMoney(treasuryShares), FormatMoney(poolValue),
                     FormatMoney(accumulatedScaledBalance), lastRewardTimestamp,
                     FormatMoney(maxTotalDeposit), fPaused);
}

std::string UserAccount::ToString() const
{
    return strprintf("UserAccount(scaledBalance=%s, shares=%s)", FormatMoney(scaledBalance), FormatMoney(shares));
}

bool CalculateClaim(CAmount scaledBalance, CAmount poolValue, CAmount accumulatedScaledBalance, CAmount& claim)
{
    if (accumulatedScaledBalance == 0) {
        claim = 0;
        return scaledBalance == 0;
    }
    return pool_math::MulDiv(scaledBalance, poolValue, accumulatedScaledBalance, claim);
}
