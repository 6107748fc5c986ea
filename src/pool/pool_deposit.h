// Copyright (c) 2025 The StakePool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEPOOL_POOL_DEPOSIT_H
#define STAKEPOOL_POOL_DEPOSIT_H

#include "amount.h"

#include <string>

class CPoolValidationState;
class CRateOracle;
struct PoolState;
struct UserAccount;

/**
 * DEPOSIT (asset shares -> pool claim)
 *
 * The depositor buys in at the prevailing scaled-to-value ratio, so a deposit
 * made after yield accrued does not dilute earlier depositors:
 *
 *   depositShares = shares(amount)
 *   finalAmount   = value(depositShares)
 *   scaledAmount  = finalAmount * max(accumulatedScaledBalance, 1) / max(poolValue, 1)
 *
 * The first depositor sets a 1:1 scaled-to-value ratio.
 */
struct PoolDepositResult
{
    CAmount nDepositShares{0}; // shares pulled from the depositor
    CAmount nFinalAmount{0};   // value credited, returned to the caller
    CAmount nScaledAmount{0};  // scaled units credited
};

/**
 * CheckPoolDeposit - Preconditions that do not depend on the exchange rate
 *
 * 1. account is not empty
 * 2. amount > 0
 * 3. pool is not paused
 */
bool CheckPoolDeposit(const PoolState& state, const std::string& strAccount, CAmount nAmount,
                      CPoolValidationState& vstate);

/**
 * ApplyPoolDeposit - Credit a deposit to the pool and the account
 *
 * Runs after reward assignment. Mutates state and account only on success;
 * the share transfer itself is left to the caller.
 *
 * @param[in,out] state    Pool state (totalShares, accumulatedScaledBalance)
 * @param[in,out] account  Depositor's account (scaledBalance, shares)
 * @param[in]     oracle   Rate oracle (conversions only)
 * @param[in]     nAmount  Requested deposit in value units
 * @param[out]    result   Computed amounts
 * @param[out]    vstate   Failure details
 * @return true if the deposit fits under the cap and was credited
 */
bool ApplyPoolDeposit(PoolState& state, UserAccount& account, const CRateOracle& oracle, CAmount nAmount,
                      PoolDepositResult& result, CPoolValidationState& vstate);

#endif // STAKEPOOL_POOL_DEPOSIT_H
