// Copyright (c) 2025 The StakePool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEPOOL_AMOUNT_H
#define STAKEPOOL_AMOUNT_H

#include <stdint.h>

/** Amount in base units (can be negative) */
typedef int64_t CAmount;

static const CAmount COIN = 100000000;

/** No amount larger than this (in base units) is valid.
 *
 * Shares and value units share the same bound; it keeps every product of two
 * amounts inside 128 bits.
 */
static const CAmount MAX_MONEY = 21000000000LL * COIN;
inline bool MoneyRange(const CAmount& nValue) { return (nValue >= 0 && nValue <= MAX_MONEY); }

#endif // STAKEPOOL_AMOUNT_H
