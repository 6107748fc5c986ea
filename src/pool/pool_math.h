// Copyright (c) 2025 The StakePool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEPOOL_POOL_MATH_H
#define STAKEPOOL_POOL_MATH_H

#include "amount.h"

#include <boost/multiprecision/cpp_int.hpp>

namespace pool_math {

using int128_t = boost::multiprecision::int128_t;

/**
 * MulDiv - floor(a * b / d) with a 128-bit intermediate product
 *
 * Every conversion between value units, shares and scaled units in the
 * ledger goes through here, except the withdrawal debit which uses MulDivUp.
 * Rounds toward zero (down for the non-negative
 * inputs the ledger uses), so a participant is never credited more than
 * the exact quotient.
 *
 * @param[in]  a       First factor (>= 0)
 * @param[in]  b       Second factor (>= 0)
 * @param[in]  d       Divisor (> 0)
 * @param[out] result  Quotient, only written on success
 * @return false on negative input, zero divisor, or a result outside CAmount
 */
bool MulDiv(CAmount a, CAmount b, CAmount d, CAmount& result);

/** ceil(a * b / d); same input and range checks as MulDiv */
bool MulDivUp(CAmount a, CAmount b, CAmount d, CAmount& result);

/** Checked a + b for non-negative amounts; false when the sum leaves MoneyRange */
bool CheckedAdd(CAmount a, CAmount b, CAmount& result);

/** Checked a - b; false when b > a or either side is negative */
bool CheckedSub(CAmount a, CAmount b, CAmount& result);

} // namespace pool_math

#endif // STAKEPOOL_POOL_MATH_H
