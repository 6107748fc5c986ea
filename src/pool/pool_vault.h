// Copyright (c) 2025 The StakePool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEPOOL_POOL_VAULT_H
#define STAKEPOOL_POOL_VAULT_H

#include "pool/pool_oracle.h"
#include "sync.h"

#include <map>
#include <string>

/**
 * CInMemoryVault - Rebasing share vault kept in memory
 *
 * Holds per-address share balances against a pooled value. Conversions round
 * down and are 1:1 while the vault is empty:
 *   value  = shares * nPooledValue / nTotalShares
 *   shares = value * nTotalShares / nPooledValue
 *
 * A rebase changes nPooledValue without moving any shares, which is how
 * staking yield (or principal loss) reaches every holder.
 */
class CInMemoryVault : public CRateOracle
{
private:
    mutable RecursiveMutex cs_vault;
    std::map<std::string, CAmount> mapBalances;
    CAmount nTotalShares{0};
    CAmount nPooledValue{0};
    std::string strHolder;

    CAmount ValueOf(CAmount nShares) const;
    CAmount SharesOf(CAmount nValue) const;

public:
    CAmount GetValue(CAmount nShares) const override;
    CAmount GetShares(CAmount nValue) const override;
    CAmount TransferShares(const std::string& strTo, CAmount nShares) override;
    CAmount TransferSharesFrom(const std::string& strFrom, const std::string& strTo, CAmount nShares) override;

    /**
     * Mint - Stake nValue value units on behalf of strTo
     *
     * @return shares credited to strTo, zero if nValue is out of range
     */
    CAmount Mint(const std::string& strTo, CAmount nValue);

    /**
     * Rebase - Set the total pooled value
     *
     * Larger than the current value is yield, smaller is principal loss.
     * @return false if the vault holds shares and nNewPooledValue is not positive
     */
    bool Rebase(CAmount nNewPooledValue);

    CAmount GetBalance(const std::string& strAddress) const override;
    CAmount GetTotalShares() const;
    CAmount GetPooledValue() const;

    std::map<std::string, CAmount> GetBalances() const;

    /**
     * Restore - Replace the vault contents with a stored copy
     *
     * @return false (vault unchanged) if the balances do not add up to
     *         nTotalSharesIn or a figure is out of range
     */
    bool Restore(CAmount nTotalSharesIn, CAmount nPooledValueIn, const std::map<std::string, CAmount>& balances);

    /** Address whose outgoing transfers TransferShares debits */
    void SetHolder(const std::string& strHolderIn);
    std::string GetHolder() const;
};

#endif // STAKEPOOL_POOL_VAULT_H
