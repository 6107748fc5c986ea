// Copyright (c) 2025 The StakePool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEPOOL_POOL_EMERGENCY_H
#define STAKEPOOL_POOL_EMERGENCY_H

#include "amount.h"

#include <string>

class CPoolValidationState;
class CRateOracle;
struct PoolState;
struct UserAccount;

/**
 * EMERGENCY WITHDRAW (paused pool, full exit)
 *
 *   pooledValue      = value(totalShares)
 *   currentAmount    = scaledBalance * pooledValue / accumulatedScaledBalance
 *   sharesToWithdraw = shares(currentAmount)
 *
 * No reward assignment runs and poolValue is left as last synchronized.
 * The account is zeroed, there is no partial emergency exit.
 */
struct PoolEmergencyResult
{
    CAmount nCurrentAmount{0};    // full claim at the live rate
    CAmount nSharesToWithdraw{0}; // shares to send
    CAmount nScaledDebit{0};      // the account's whole scaled balance
};

/**
 * CheckPoolEmergencyWithdraw - account is not empty and the pool is paused
 */
bool CheckPoolEmergencyWithdraw(const PoolState& state, const std::string& strAccount, CPoolValidationState& vstate);

/**
 * ApplyPoolEmergencyWithdraw - Remove the account's whole claim
 *
 * Fails with ZERO_AMOUNT if nothing was ever deposited and with
 * NOTHING_TO_WITHDRAW if the account's claim is zero (e.g. second call).
 */
bool ApplyPoolEmergencyWithdraw(PoolState& state, UserAccount& account, const CRateOracle& oracle,
                                PoolEmergencyResult& result, CPoolValidationState& vstate);

#endif // STAKEPOOL_POOL_EMERGENCY_H
