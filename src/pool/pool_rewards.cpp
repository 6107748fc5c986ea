// Copyright (c) 2025 The StakePool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pool/pool_rewards.h"

#include "logging.h"
#include "pool/pool_errors.h"
#include "pool/pool_math.h"
#include "pool/pool_oracle.h"
#include "pool/pool_state.h"
#include "utilmoneystr.h"

namespace pool_rewards {

bool CalculateYield(const PoolState& state, const CRateOracle& oracle, CAmount& nYield)
{
    const CAmount nCurrentValue = oracle.GetValue(state.totalShares);
    if (!MoneyRange(nCurrentValue) || !MoneyRange(state.poolValue)) {
        return false;
    }
    // Both sides are within MoneyRange, the difference cannot overflow
    nYield = nCurrentValue - state.poolValue;
    return true;
}

bool AssignRewards(PoolState& state, const CRateOracle& oracle, int64_t nTime,
                   RewardAssignment& result, CPoolValidationState& vstate)
{
    result = RewardAssignment();

    if (state.poolValue == 0) {
        return true;
    }

    CAmount nYield = 0;
    if (!CalculateYield(state, oracle, nYield)) {
        return vstate.Invalid(error("%s: oracle value out of range for %s shares", __func__,
                                    FormatMoney(state.totalShares)),
                              PoolError::OVERFLOW, "bad-rewards-overflow");
    }
    result.nYield = nYield;

    if (nYield <= 0) {
        // Loss is shared by every holder, only the snapshot moves
        state.poolValue += nYield;
        LogPrint(BCLog::REWARDS, "%s: no positive yield (%d), nothing skimmed\n", __func__, nYield);
        return true;
    }

    const CAmount nSharesYield = oracle.GetShares(nYield);
    CAmount nNewTotalShares = 0;
    CAmount nNewTreasuryShares = 0;
    if (nSharesYield < 0 || !pool_math::CheckedSub(state.totalShares, nSharesYield, nNewTotalShares)) {
        return vstate.Invalid(error("%s: yield of %s shares exceeds totalShares %s", __func__,
                                    FormatMoney(nSharesYield), FormatMoney(state.totalShares)),
                              PoolError::INVARIANT_VIOLATION, "bad-rewards-shares");
    }
    if (!pool_math::CheckedAdd(state.treasuryShares, nSharesYield, nNewTreasuryShares)) {
        return vstate.Invalid(error("%s: treasury overflow", __func__),
                              PoolError::OVERFLOW, "bad-rewards-overflow");
    }

    state.totalShares = nNewTotalShares;
    state.treasuryShares = nNewTreasuryShares;
    state.poolValue = oracle.GetValue(state.totalShares);
    state.lastRewardTimestamp = nTime;

    result.fAssigned = true;
    result.nSharesYield = nSharesYield;

    LogPrint(BCLog::REWARDS, "%s: yield=%s skimmed %s shares, totalShares=%s treasuryShares=%s poolValue=%s\n",
             __func__, FormatMoney(nYield), FormatMoney(nSharesYield), FormatMoney(state.totalShares),
             FormatMoney(state.treasuryShares), FormatMoney(state.poolValue));
    return true;
}

} // namespace pool_rewards
