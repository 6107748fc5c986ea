// Copyright (c) 2025 The StakePool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEPOOL_POOL_REWARDS_H
#define STAKEPOOL_POOL_REWARDS_H

#include "amount.h"

#include <stdint.h>

class CPoolValidationState;
class CRateOracle;
struct PoolState;

/**
 * Reward assignment (yield skim)
 *
 * Positive yield observed since the last synchronization is moved out of the
 * depositors' shares into the treasury:
 *
 *   currentValue = value(totalShares)
 *   yield        = currentValue - poolValue
 *   if yield > 0:
 *     sharesYield     = shares(yield)
 *     totalShares    -= sharesYield
 *     treasuryShares += sharesYield
 *     poolValue       = value(totalShares)
 *
 * A negative yield (principal loss) moves no shares: poolValue is lowered to
 * value(totalShares), which spreads the loss over every holder. UserAccount records are never written,
 * the dilution is implicit because accumulatedScaledBalance is left unchanged.
 */
namespace pool_rewards {

struct RewardAssignment
{
    bool fAssigned{false};   // true if positive yield was skimmed
    CAmount nYield{0};       // yield in value units (negative on loss)
    CAmount nSharesYield{0}; // shares moved to the treasury
};

/**
 * CalculateYield - Signed yield of the pool since the last synchronization
 *
 * @param[in]  state   Pool state
 * @param[in]  oracle  Rate oracle
 * @param[out] nYield  value(totalShares) - poolValue
 * @return false if the oracle value is out of range
 */
bool CalculateYield(const PoolState& state, const CRateOracle& oracle, CAmount& nYield);

/**
 * AssignRewards - Skim positive yield into treasury shares
 *
 * No-op when poolValue is zero or yield is zero.
 *
 * @param[in,out] state   Pool state (mutated only when yield != 0)
 * @param[in]     oracle  Rate oracle (conversions only)
 * @param[in]     nTime   Timestamp recorded as lastRewardTimestamp
 * @param[out]    result  What was skimmed
 * @param[out]    vstate  Failure details
 * @return false on arithmetic failure, state untouched in that case
 */
bool AssignRewards(PoolState& state, const CRateOracle& oracle, int64_t nTime,
                   RewardAssignment& result, CPoolValidationState& vstate);

} // namespace pool_rewards

#endif // STAKEPOOL_POOL_REWARDS_H
