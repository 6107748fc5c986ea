// Copyright (c) 2025 The StakePool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEPOOL_POOL_WITHDRAW_H
#define STAKEPOOL_POOL_WITHDRAW_H

#include "amount.h"

#include <string>

class CPoolValidationState;
class CRateOracle;
struct PoolState;
struct UserAccount;

/**
 * WITHDRAW (pool claim -> asset shares)
 *
 *   userMaxAmount    = scaledBalance * poolValue / accumulatedScaledBalance
 *   sharesToWithdraw = shares(amount)
 *   finalAmount      = value(sharesToWithdraw)
 *   amountToDebit    = ceil(finalAmount * accumulatedScaledBalance / poolValue)
 *
 * The account's shares shrink in the same proportion as its scaled balance:
 *   shares -= shares * amountToDebit / scaledBalance
 */
struct PoolWithdrawResult
{
    CAmount nUserMaxAmount{0};    // claim before the withdrawal
    CAmount nSharesToWithdraw{0}; // shares sent to the account
    CAmount nFinalAmount{0};      // value withdrawn, returned to the caller
    CAmount nAmountToDebit{0};    // scaled units debited
    CAmount nSharesDebit{0};      // reduction of the account's share bound
};

/**
 * CheckPoolWithdraw - Preconditions that do not depend on the exchange rate
 *
 * 1. account is not empty
 * 2. amount > 0
 * 3. pool is not paused
 */
bool CheckPoolWithdraw(const PoolState& state, const std::string& strAccount, CAmount nAmount,
                       CPoolValidationState& vstate);

/**
 * ApplyPoolWithdraw - Debit a withdrawal from the pool and the account
 *
 * Runs after reward assignment. Never lets the account take out more than
 * its proportional claim at the time of the call. Mutates state and account
 * only on success; the share transfer itself is left to the caller.
 *
 * Fails closed with INVARIANT_VIOLATION if the account holds shares but no
 * scaled balance.
 */
bool ApplyPoolWithdraw(PoolState& state, UserAccount& account, const CRateOracle& oracle, CAmount nAmount,
                       PoolWithdrawResult& result, CPoolValidationState& vstate);

#endif // STAKEPOOL_POOL_WITHDRAW_H
