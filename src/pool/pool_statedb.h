// Copyright (c) 2025 The StakePool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEPOOL_POOL_STATEDB_H
#define STAKEPOOL_POOL_STATEDB_H

#include "dbwrapper.h"
#include "pool/pool_admin.h"
#include "pool/pool_state.h"

#include <map>
#include <stdint.h>
#include <string>
#include <utility>
#include <vector>

class CInMemoryVault;

/**
 * CPoolStateDB - LevelDB persistence layer for a pool
 *
 * Database keys:
 * - 'P' + 'S'                  -> PoolState
 * - 'P' + 'A' + address        -> UserAccount
 * - 'P' + 'R' + role + address -> true (role membership)
 * - 'V' + 'T'                  -> (totalShares, pooledValue) of the in-memory vault
 * - 'V' + 'B' + address        -> vault share balance
 *
 * Every committed operation is written as one batch, so the pool state and
 * the accounts it touched never diverge on disk.
 */
class CPoolStateDB : public CDBWrapper
{
public:
    CPoolStateDB(const fs::path& path, size_t nCacheSize, bool fWipe = false);
    virtual ~CPoolStateDB() {}

private:
    CPoolStateDB(const CPoolStateDB&);
    void operator=(const CPoolStateDB&);

public:
    bool WritePoolState(const PoolState& state);
    bool ReadPoolState(PoolState& state);
    bool ExistsPoolState();

    bool WriteAccount(const std::string& strAddress, const UserAccount& account);
    bool ReadAccount(const std::string& strAddress, UserAccount& account);

    /**
     * WriteOperation - Persist one committed operation atomically
     *
     * @param state     Pool state after the operation
     * @param accounts  Accounts the operation touched
     * @param vErased   Accounts to drop (rolled back first deposits)
     * @return false if LevelDB rejected the batch
     */
    virtual bool WriteOperation(const PoolState& state, const std::vector<std::pair<std::string, UserAccount>>& accounts,
                                const std::vector<std::string>& vErased = {});

    /** Persist a role grant (fGrant) or revocation */
    virtual bool WriteRoleChange(PoolRole role, const std::string& strAddress, bool fGrant);

    /** Persist every balance and the totals of the vault as one batch */
    bool WriteVault(const CInMemoryVault& vault);
    bool ExistsVault();
    /**
     * ReadVault - Restore a stored vault
     *
     * @return false if nothing is stored, a record fails to deserialize or
     *         the balances are inconsistent with the totals
     */
    bool ReadVault(CInMemoryVault& vault);

    /**
     * LoadAllAccounts - Read every stored account
     *
     * @return false if a record fails to deserialize
     */
    bool LoadAllAccounts(std::map<std::string, UserAccount>& accounts);

    /** Read every stored role membership */
    bool LoadRoles(CPoolRoles& roles);
};

#endif // STAKEPOOL_POOL_STATEDB_H
