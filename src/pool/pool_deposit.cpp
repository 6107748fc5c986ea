// Copyright (c) 2025 The StakePool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pool/pool_deposit.h"

#include "logging.h"
#include "pool/pool_errors.h"
#include "pool/pool_math.h"
#include "pool/pool_oracle.h"
#include "pool/pool_state.h"
#include "utilmoneystr.h"

bool CheckPoolDeposit(const PoolState& state, const std::string& strAccount, CAmount nAmount,
                      CPoolValidationState& vstate)
{
    if (strAccount.empty()) {
        return vstate.Invalid(PoolError::ZERO_ADDRESS, "bad-deposit-zero-address");
    }
    if (nAmount <= 0) {
        return vstate.Invalid(PoolError::ZERO_AMOUNT, "bad-deposit-zero-amount");
    }
    if (!MoneyRange(nAmount)) {
        return vstate.Invalid(PoolError::OVERFLOW, "bad-deposit-amount-range",
                              strprintf("amount %d out of range", nAmount));
    }
    if (state.fPaused) {
        return vstate.Invalid(PoolError::PAUSED, "bad-deposit-paused");
    }
    return true;
}

bool ApplyPoolDeposit(PoolState& state, UserAccount& account, const CRateOracle& oracle, CAmount nAmount,
                      PoolDepositResult& result, CPoolValidationState& vstate)
{
    result = PoolDepositResult();

    // 1. Double conversion: credit exactly what the oracle registers for the shares
    const CAmount nDepositShares = oracle.GetShares(nAmount);
    if (nDepositShares <= 0) {
        return vstate.Invalid(PoolError::DEPOSIT_FAILED, "bad-deposit-zero-shares",
                              strprintf("%s converts to no shares", FormatMoney(nAmount)));
    }
    const CAmount nFinalAmount = oracle.GetValue(nDepositShares);
    if (!MoneyRange(nFinalAmount)) {
        return vstate.Invalid(error("%s: oracle value %d out of range", __func__, nFinalAmount),
                              PoolError::OVERFLOW, "bad-deposit-overflow");
    }

    // 2. Deposit cap
    CAmount nNewPoolValue = 0;
    if (!pool_math::CheckedAdd(state.poolValue, nFinalAmount, nNewPoolValue) ||
        nNewPoolValue > state.maxTotalDeposit) {
        return vstate.Invalid(PoolError::DEPOSIT_CAP_EXCEEDED, "bad-deposit-cap-exceeded",
                              strprintf("poolValue %s + deposit %s > cap %s", FormatMoney(state.poolValue),
                                        FormatMoney(nFinalAmount), FormatMoney(state.maxTotalDeposit)));
    }

    // 3. Buy in at the prevailing ratio
    const CAmount nMultiplier = state.accumulatedScaledBalance > 0 ? state.accumulatedScaledBalance : 1;
    const CAmount nDivisor = state.poolValue > 0 ? state.poolValue : 1;
    CAmount nScaledAmount = 0;
    if (!pool_math::MulDiv(nFinalAmount, nMultiplier, nDivisor, nScaledAmount)) {
        return vstate.Invalid(error("%s: scaling overflow (%d * %d / %d)", __func__, nFinalAmount, nMultiplier, nDivisor),
                              PoolError::OVERFLOW, "bad-deposit-overflow");
    }
    if (nScaledAmount == 0) {
        // Would hand the shares to the existing holders
        return vstate.Invalid(PoolError::DEPOSIT_FAILED, "bad-deposit-zero-scaled",
                              strprintf("%s buys no scaled units at %d/%d", FormatMoney(nFinalAmount), nMultiplier, nDivisor));
    }

    // 4. Credit
    CAmount nNewScaled = 0, nNewShares = 0, nNewTotalShares = 0, nNewAccumulated = 0;
    if (!pool_math::CheckedAdd(account.scaledBalance, nScaledAmount, nNewScaled) ||
        !pool_math::CheckedAdd(account.shares, nDepositShares, nNewShares) ||
        !pool_math::CheckedAdd(state.totalShares, nDepositShares, nNewTotalShares) ||
        !pool_math::CheckedAdd(state.accumulatedScaledBalance, nScaledAmount, nNewAccumulated)) {
        return vstate.Invalid(error("%s: credit overflow", __func__), PoolError::OVERFLOW, "bad-deposit-overflow");
    }

    account.scaledBalance = nNewScaled;
    account.shares = nNewShares;
    state.totalShares = nNewTotalShares;
    state.accumulatedScaledBalance = nNewAccumulated;

    result.nDepositShares = nDepositShares;
    result.nFinalAmount = nFinalAmount;
    result.nScaledAmount = nScaledAmount;
    return true;
}
