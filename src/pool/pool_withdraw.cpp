// Copyright (c) 2025 The StakePool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pool/pool_withdraw.h"

#include "logging.h"
#include "pool/pool_errors.h"
#include "pool/pool_math.h"
#include "pool/pool_oracle.h"
#include "pool/pool_state.h"
#include "utilmoneystr.h"

bool CheckPoolWithdraw(const PoolState& state, const std::string& strAccount, CAmount nAmount,
                       CPoolValidationState& vstate)
{
    if (strAccount.empty()) {
        return vstate.Invalid(PoolError::ZERO_ADDRESS, "bad-withdraw-zero-address");
    }
    if (nAmount <= 0) {
        return vstate.Invalid(PoolError::ZERO_AMOUNT, "bad-withdraw-zero-amount");
    }
    if (!MoneyRange(nAmount)) {
        return vstate.Invalid(PoolError::OVERFLOW, "bad-withdraw-amount-range",
                              strprintf("amount %d out of range", nAmount));
    }
    if (state.fPaused) {
        return vstate.Invalid(PoolError::PAUSED, "bad-withdraw-paused");
    }
    return true;
}

bool ApplyPoolWithdraw(PoolState& state, UserAccount& account, const CRateOracle& oracle, CAmount nAmount,
                       PoolWithdrawResult& result, CPoolValidationState& vstate)
{
    result = PoolWithdrawResult();

    if (account.scaledBalance == 0 && account.shares != 0) {
        return vstate.Invalid(error("%s: account holds %s shares without scaled balance", __func__,
                                    FormatMoney(account.shares)),
                              PoolError::INVARIANT_VIOLATION, "bad-withdraw-invariant");
    }

    // 1. Proportional claim
    CAmount nUserMaxAmount = 0;
    if (state.accumulatedScaledBalance == 0) {
        return vstate.Invalid(PoolError::NOTHING_TO_WITHDRAW, "bad-withdraw-nothing");
    }
    if (!CalculateClaim(account.scaledBalance, state.poolValue, state.accumulatedScaledBalance, nUserMaxAmount)) {
        return vstate.Invalid(error("%s: claim overflow", __func__), PoolError::OVERFLOW, "bad-withdraw-overflow");
    }
    if (nUserMaxAmount == 0) {
        return vstate.Invalid(PoolError::NOTHING_TO_WITHDRAW, "bad-withdraw-nothing");
    }
    if (nAmount > nUserMaxAmount) {
        return vstate.Invalid(PoolError::NOT_ENOUGH_BALANCE, "bad-withdraw-not-enough-balance",
                              strprintf("requested %s, claim %s", FormatMoney(nAmount), FormatMoney(nUserMaxAmount)));
    }

    // 2. Double conversion
    const CAmount nSharesToWithdraw = oracle.GetShares(nAmount);
    if (nSharesToWithdraw > account.shares) {
        return vstate.Invalid(PoolError::INSUFFICIENT_SHARES, "bad-withdraw-insufficient-shares",
                              strprintf("need %s shares, account holds %s", FormatMoney(nSharesToWithdraw),
                                        FormatMoney(account.shares)));
    }
    if (nSharesToWithdraw <= 0) {
        return vstate.Invalid(PoolError::TRANSFER_FAILED, "bad-withdraw-zero-shares",
                              strprintf("%s converts to no shares", FormatMoney(nAmount)));
    }
    const CAmount nFinalAmount = oracle.GetValue(nSharesToWithdraw);

    // 3. Scaled debit (poolValue > 0 since the claim is non-zero). Rounds up so
    // a withdrawal always costs at least one scaled unit; nFinalAmount <= claim
    // keeps the debit within the account's scaled balance.
    CAmount nAmountToDebit = 0;
    if (!pool_math::MulDivUp(nFinalAmount, state.accumulatedScaledBalance, state.poolValue, nAmountToDebit)) {
        return vstate.Invalid(error("%s: debit overflow", __func__), PoolError::OVERFLOW, "bad-withdraw-overflow");
    }

    CAmount nSharesDebit = 0;
    if (!pool_math::MulDiv(account.shares, nAmountToDebit, account.scaledBalance, nSharesDebit)) {
        return vstate.Invalid(error("%s: share debit overflow", __func__), PoolError::OVERFLOW, "bad-withdraw-overflow");
    }

    CAmount nNewTotalShares = 0, nNewAccumulated = 0, nNewScaled = 0, nNewShares = 0;
    if (!pool_math::CheckedSub(state.totalShares, nSharesToWithdraw, nNewTotalShares) ||
        !pool_math::CheckedSub(state.accumulatedScaledBalance, nAmountToDebit, nNewAccumulated) ||
        !pool_math::CheckedSub(account.scaledBalance, nAmountToDebit, nNewScaled) ||
        !pool_math::CheckedSub(account.shares, nSharesDebit, nNewShares)) {
        return vstate.Invalid(error("%s: debit exceeds balance (shares=%d debit=%d scaled=%d)", __func__,
                                    nSharesToWithdraw, nAmountToDebit, account.scaledBalance),
                              PoolError::INVARIANT_VIOLATION, "bad-withdraw-invariant");
    }

    state.totalShares = nNewTotalShares;
    state.accumulatedScaledBalance = nNewAccumulated;
    account.scaledBalance = nNewScaled;
    account.shares = nNewShares;

    result.nUserMaxAmount = nUserMaxAmount;
    result.nSharesToWithdraw = nSharesToWithdraw;
    result.nFinalAmount = nFinalAmount;
    result.nAmountToDebit = nAmountToDebit;
    result.nSharesDebit = nSharesDebit;
    return true;
}
