// Copyright (c) 2025 The StakePool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pool/pool_emergency.h"

#include "logging.h"
#include "pool/pool_errors.h"
#include "pool/pool_math.h"
#include "pool/pool_oracle.h"
#include "pool/pool_state.h"
#include "utilmoneystr.h"

bool CheckPoolEmergencyWithdraw(const PoolState& state, const std::string& strAccount, CPoolValidationState& vstate)
{
    if (strAccount.empty()) {
        return vstate.Invalid(PoolError::ZERO_ADDRESS, "bad-emergency-zero-address");
    }
    if (!state.fPaused) {
        return vstate.Invalid(PoolError::NOT_PAUSED, "bad-emergency-not-paused");
    }
    return true;
}

bool ApplyPoolEmergencyWithdraw(PoolState& state, UserAccount& account, const CRateOracle& oracle,
                                PoolEmergencyResult& result, CPoolValidationState& vstate)
{
    result = PoolEmergencyResult();

    if (state.accumulatedScaledBalance == 0) {
        return vstate.Invalid(PoolError::ZERO_AMOUNT, "bad-emergency-zero-amount");
    }

    // Live rate, no skim
    const CAmount nPooledValue = oracle.GetValue(state.totalShares);
    CAmount nCurrentAmount = 0;
    if (!MoneyRange(nPooledValue) ||
        !CalculateClaim(account.scaledBalance, nPooledValue, state.accumulatedScaledBalance, nCurrentAmount)) {
        return vstate.Invalid(error("%s: claim overflow", __func__), PoolError::OVERFLOW, "bad-emergency-overflow");
    }
    if (nCurrentAmount == 0) {
        return vstate.Invalid(PoolError::NOTHING_TO_WITHDRAW, "bad-emergency-nothing");
    }

    const CAmount nSharesToWithdraw = oracle.GetShares(nCurrentAmount);
    CAmount nNewAccumulated = 0, nNewTotalShares = 0;
    if (nSharesToWithdraw < 0 ||
        !pool_math::CheckedSub(state.accumulatedScaledBalance, account.scaledBalance, nNewAccumulated) ||
        !pool_math::CheckedSub(state.totalShares, nSharesToWithdraw, nNewTotalShares)) {
        return vstate.Invalid(error("%s: exit exceeds pool (shares=%d scaled=%d)", __func__,
                                    nSharesToWithdraw, account.scaledBalance),
                              PoolError::INVARIANT_VIOLATION, "bad-emergency-invariant");
    }

    result.nCurrentAmount = nCurrentAmount;
    result.nSharesToWithdraw = nSharesToWithdraw;
    result.nScaledDebit = account.scaledBalance;

    state.accumulatedScaledBalance = nNewAccumulated;
    state.totalShares = nNewTotalShares;
    account.SetNull();
    return true;
}
