// Copyright (c) 2025 The StakePool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pool/pool_statedb.h"

#include "logging.h"
#include "pool/pool_vault.h"

#include <memory>

static const char DB_POOL = 'P';
static const char DB_POOL_STATE = 'S';
static const char DB_POOL_ACCOUNT = 'A';
static const char DB_POOL_ROLE = 'R';
static const char DB_VAULT = 'V';
static const char DB_VAULT_TOTALS = 'T';
static const char DB_VAULT_BALANCE = 'B';

namespace {

typedef std::pair<char, char> PrefixKey;
typedef std::pair<PrefixKey, std::string> AccountKey;
typedef std::pair<PrefixKey, std::pair<uint8_t, std::string>> RoleKey;

PrefixKey StateKey()
{
    return std::make_pair(DB_POOL, DB_POOL_STATE);
}

AccountKey MakeAccountKey(const std::string& strAddress)
{
    return std::make_pair(std::make_pair(DB_POOL, DB_POOL_ACCOUNT), strAddress);
}

RoleKey MakeRoleKey(PoolRole role, const std::string& strAddress)
{
    return std::make_pair(std::make_pair(DB_POOL, DB_POOL_ROLE), std::make_pair(static_cast<uint8_t>(role), strAddress));
}

PrefixKey VaultTotalsKey()
{
    return std::make_pair(DB_VAULT, DB_VAULT_TOTALS);
}

AccountKey MakeVaultBalanceKey(const std::string& strAddress)
{
    return std::make_pair(std::make_pair(DB_VAULT, DB_VAULT_BALANCE), strAddress);
}

} // namespace

CPoolStateDB::CPoolStateDB(const fs::path& path, size_t nCacheSize, bool fWipe) :
    CDBWrapper(path, nCacheSize, fWipe)
{
}

bool CPoolStateDB::WritePoolState(const PoolState& state)
{
    return Write(StateKey(), state, true);
}

bool CPoolStateDB::ReadPoolState(PoolState& state)
{
    return Read(StateKey(), state);
}

bool CPoolStateDB::ExistsPoolState()
{
    return Exists(StateKey());
}

bool CPoolStateDB::WriteAccount(const std::string& strAddress, const UserAccount& account)
{
    return Write(MakeAccountKey(strAddress), account, true);
}

bool CPoolStateDB::ReadAccount(const std::string& strAddress, UserAccount& account)
{
    return Read(MakeAccountKey(strAddress), account);
}

bool CPoolStateDB::WriteOperation(const PoolState& state, const std::vector<std::pair<std::string, UserAccount>>& accounts,
                                  const std::vector<std::string>& vErased)
{
    CDBBatch batch;
    batch.Write(StateKey(), state);
    for (const auto& entry : accounts) {
        batch.Write(MakeAccountKey(entry.first), entry.second);
    }
    for (const std::string& strAddress : vErased) {
        batch.Erase(MakeAccountKey(strAddress));
    }

    LogPrint(BCLog::DB, "%s: writing state and %u account(s), erasing %u, ~%u bytes\n", __func__, accounts.size(),
             vErased.size(), batch.SizeEstimate());

    try {
        return WriteBatch(batch, true);
    } catch (const dbwrapper_error& e) {
        return error("%s: %s", __func__, e.what());
    }
}

bool CPoolStateDB::WriteRoleChange(PoolRole role, const std::string& strAddress, bool fGrant)
{
    CDBBatch batch;
    if (fGrant) {
        batch.Write(MakeRoleKey(role, strAddress), true);
    } else {
        batch.Erase(MakeRoleKey(role, strAddress));
    }

    try {
        return WriteBatch(batch, true);
    } catch (const dbwrapper_error& e) {
        return error("%s: %s", __func__, e.what());
    }
}

bool CPoolStateDB::LoadAllAccounts(std::map<std::string, UserAccount>& accounts)
{
    std::unique_ptr<CDBIterator> pcursor(NewIterator());
    pcursor->Seek(MakeAccountKey(std::string()));

    while (pcursor->Valid()) {
        AccountKey key;
        if (!pcursor->GetKey(key) || key.first != std::make_pair(DB_POOL, DB_POOL_ACCOUNT)) {
            break;
        }

        UserAccount account;
        if (!pcursor->GetValue(account)) {
            return error("%s: unable to read account %s", __func__, key.second);
        }
        accounts[key.second] = account;
        pcursor->Next();
    }

    LogPrint(BCLog::DB, "%s: loaded %u account(s)\n", __func__, accounts.size());
    return true;
}

bool CPoolStateDB::LoadRoles(CPoolRoles& roles)
{
    std::unique_ptr<CDBIterator> pcursor(NewIterator());
    pcursor->Seek(std::make_pair(DB_POOL, DB_POOL_ROLE));

    while (pcursor->Valid()) {
        RoleKey key;
        if (!pcursor->GetKey(key) || key.first != std::make_pair(DB_POOL, DB_POOL_ROLE)) {
            break;
        }

        const uint8_t nRole = key.second.first;
        if (nRole > static_cast<uint8_t>(PoolRole::PAUSER)) {
            return error("%s: unknown role %d for %s", __func__, nRole, key.second.second);
        }
        roles.Grant(static_cast<PoolRole>(nRole), key.second.second);
        pcursor->Next();
    }
    return true;
}

bool CPoolStateDB::WriteVault(const CInMemoryVault& vault)
{
    CDBBatch batch;
    batch.Write(VaultTotalsKey(), std::make_pair(vault.GetTotalShares(), vault.GetPooledValue()));
    const std::map<std::string, CAmount> balances = vault.GetBalances();
    for (const auto& entry : balances) {
        batch.Write(MakeVaultBalanceKey(entry.first), entry.second);
    }

    try {
        return WriteBatch(batch, true);
    } catch (const dbwrapper_error& e) {
        return error("%s: %s", __func__, e.what());
    }
}

bool CPoolStateDB::ExistsVault()
{
    return Exists(VaultTotalsKey());
}

bool CPoolStateDB::ReadVault(CInMemoryVault& vault)
{
    std::pair<CAmount, CAmount> totals;
    if (!Read(VaultTotalsKey(), totals)) {
        return false;
    }

    std::map<std::string, CAmount> balances;
    std::unique_ptr<CDBIterator> pcursor(NewIterator());
    pcursor->Seek(MakeVaultBalanceKey(std::string()));

    while (pcursor->Valid()) {
        AccountKey key;
        if (!pcursor->GetKey(key) || key.first != std::make_pair(DB_VAULT, DB_VAULT_BALANCE)) {
            break;
        }

        CAmount nBalance = 0;
        if (!pcursor->GetValue(nBalance)) {
            return error("%s: unable to read vault balance of %s", __func__, key.second);
        }
        balances[key.second] = nBalance;
        pcursor->Next();
    }

    LogPrint(BCLog::DB, "%s: loaded %u vault balance(s)\n", __func__, balances.size());
    return vault.Restore(totals.first, totals.second, balances);
}
