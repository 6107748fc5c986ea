// Copyright (c) 2025 The StakePool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEPOOL_POOL_ORACLE_H
#define STAKEPOOL_POOL_ORACLE_H

#include "amount.h"

#include <string>

/**
 * CRateOracle - Yield-bearing asset consumed by the pool
 *
 * Converts between shares (the asset's native unit) and value units at the
 * current exchange rate, and moves shares in and out of the pool's holdings.
 * The exchange rate may move in either direction between any two calls.
 *
 * Transfers are external calls: an implementation may call back into the
 * pool, which rejects the nested call.
 */
class CRateOracle
{
public:
    virtual ~CRateOracle() {}

    /** Value units currently worth nShares (monotonic in nShares) */
    virtual CAmount GetValue(CAmount nShares) const = 0;

    /** Shares currently worth nValue value units */
    virtual CAmount GetShares(CAmount nValue) const = 0;

    /** Shares currently held by strAddress */
    virtual CAmount GetBalance(const std::string& strAddress) const = 0;

    /**
     * Send nShares out of the pool's holdings to strTo.
     * @return shares actually sent, zero on failure
     */
    virtual CAmount TransferShares(const std::string& strTo, CAmount nShares) = 0;

    /**
     * Pull nShares from strFrom into strTo (the pool's own address).
     * @return shares actually sent, zero on failure
     */
    virtual CAmount TransferSharesFrom(const std::string& strFrom, const std::string& strTo, CAmount nShares) = 0;
};

#endif // STAKEPOOL_POOL_ORACLE_H
