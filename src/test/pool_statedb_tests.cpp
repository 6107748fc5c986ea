// Copyright (c) 2025 The StakePool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

//
// Unit tests for pool persistence in LevelDB
//

#include "test/test_stakepool.h"

#include "pool/pool_statedb.h"
#include "util/system.h"

#include <map>
#include <memory>

#include <boost/test/unit_test.hpp>

namespace {

/** Pool database whose batch writes can be made to fail */
class CFailingStateDB : public CPoolStateDB
{
public:
    bool fFailWrites{false};

    CFailingStateDB(const fs::path& path, size_t nCacheSize, bool fWipe) : CPoolStateDB(path, nCacheSize, fWipe) {}

    bool WriteOperation(const PoolState& state, const std::vector<std::pair<std::string, UserAccount>>& accounts,
                        const std::vector<std::string>& vErased = {}) override
    {
        return !fFailWrites && CPoolStateDB::WriteOperation(state, accounts, vErased);
    }

    bool WriteRoleChange(PoolRole role, const std::string& strAddress, bool fGrant) override
    {
        return !fFailWrites && CPoolStateDB::WriteRoleChange(role, strAddress, fGrant);
    }
};

struct PoolDBTestingSetup : public BasicTestingSetup {
    static const CAmount DB_TEST_CAP = 1000 * COIN;

    fs::path pathDB;
    std::unique_ptr<CInMemoryVault> vault;
    std::unique_ptr<CFailingStateDB> db;
    std::unique_ptr<CStakePool> pool;

    PoolDBTestingSetup() : pathDB(GetDataDir() / "pool"), vault(new CInMemoryVault())
    {
        vault->SetHolder(PoolParams().PoolAddress());
        Reopen();
    }

    ~PoolDBTestingSetup()
    {
        pool.reset();
        db.reset();
    }

    /**
     * Close and reopen the database with a new pool on top, not yet
     * initialized. fFreshVault replaces the vault with an empty one, as a
     * daemon restart does before the stored vault is read back.
     */
    void Reopen(bool fWipe = false, bool fFreshVault = false)
    {
        pool.reset();
        db.reset();
        if (fFreshVault) {
            vault.reset(new CInMemoryVault());
            vault->SetHolder(PoolParams().PoolAddress());
        }
        db.reset(new CFailingStateDB(pathDB, 1 << 20, fWipe));
        pool.reset(new CStakePool(*vault, PoolParams().PoolAddress(), db.get()));
    }

    bool InitPool(CPoolValidationState& vstate)
    {
        return pool->Init(DB_TEST_CAP, "admin", "pauser", vstate);
    }

    void Deposit(const std::string& strAccount, CAmount nValue)
    {
        BOOST_REQUIRE(vault->Mint(strAccount, nValue) > 0);
        CAmount nCredited = 0;
        CPoolValidationState vstate;
        BOOST_REQUIRE_MESSAGE(pool->Deposit(strAccount, nValue, nCredited, vstate), vstate.ToString());
    }
};

const CAmount PoolDBTestingSetup::DB_TEST_CAP;

} // namespace

BOOST_FIXTURE_TEST_SUITE(pool_statedb_tests, PoolDBTestingSetup)

/**
 * Test 1: Record round trip
 */
BOOST_AUTO_TEST_CASE(statedb_records)
{
    PoolState state;
    state.totalShares = 18181818181;
    state.treasuryShares = 909090909;
    state.poolValue = 19999999999;
    state.accumulatedScaledBalance = 19999999999;
    state.lastRewardTimestamp = TEST_MOCK_TIME;
    state.maxTotalDeposit = DB_TEST_CAP;
    state.fPaused = true;

    BOOST_CHECK(!db->ExistsPoolState());
    BOOST_CHECK(db->WritePoolState(state));
    BOOST_CHECK(db->ExistsPoolState());

    PoolState loaded;
    BOOST_CHECK(db->ReadPoolState(loaded));
    BOOST_CHECK_EQUAL(loaded.totalShares, state.totalShares);
    BOOST_CHECK_EQUAL(loaded.treasuryShares, state.treasuryShares);
    BOOST_CHECK_EQUAL(loaded.poolValue, state.poolValue);
    BOOST_CHECK_EQUAL(loaded.accumulatedScaledBalance, state.accumulatedScaledBalance);
    BOOST_CHECK_EQUAL(loaded.lastRewardTimestamp, state.lastRewardTimestamp);
    BOOST_CHECK_EQUAL(loaded.maxTotalDeposit, state.maxTotalDeposit);
    BOOST_CHECK(loaded.fPaused);

    UserAccount account;
    account.scaledBalance = 9999999999;
    account.shares = 9090909090;
    BOOST_CHECK(db->WriteAccount("bob", account));

    UserAccount loadedAccount;
    BOOST_CHECK(db->ReadAccount("bob", loadedAccount));
    BOOST_CHECK_EQUAL(loadedAccount.scaledBalance, account.scaledBalance);
    BOOST_CHECK_EQUAL(loadedAccount.shares, account.shares);
    BOOST_CHECK(!db->ReadAccount("alice", loadedAccount));
}

/**
 * Test 2: Key spaces do not overlap
 *
 * Accounts, roles and the state record share the 'P' prefix; iterating one
 * space must not pick up records from another.
 */
BOOST_AUTO_TEST_CASE(statedb_key_spaces)
{
    UserAccount account;
    account.scaledBalance = COIN;
    account.shares = COIN;

    PoolState state;
    BOOST_CHECK(db->WriteOperation(state, {{"alice", account}, {"bob", account}}));
    BOOST_CHECK(db->WriteRoleChange(PoolRole::ADMIN, "admin", true));
    BOOST_CHECK(db->WriteRoleChange(PoolRole::PAUSER, "pauser", true));
    BOOST_CHECK(db->WriteRoleChange(PoolRole::PAUSER, "bob", true));
    BOOST_CHECK(db->WriteRoleChange(PoolRole::PAUSER, "bob", false));

    std::map<std::string, UserAccount> accounts;
    BOOST_CHECK(db->LoadAllAccounts(accounts));
    BOOST_CHECK_EQUAL(accounts.size(), 2U);
    BOOST_CHECK(accounts.count("alice") && accounts.count("bob"));

    CPoolRoles roles;
    BOOST_CHECK(db->LoadRoles(roles));
    BOOST_CHECK(roles.HasRole(PoolRole::ADMIN, "admin"));
    BOOST_CHECK(roles.HasRole(PoolRole::PAUSER, "pauser"));
    BOOST_CHECK(!roles.HasRole(PoolRole::PAUSER, "bob"));
    BOOST_CHECK_EQUAL(roles.CountMembers(PoolRole::ADMIN), 1U);
}

/**
 * Test 3: Pool survives a restart
 *
 * Verify that:
 * - A fresh pool is written on first start
 * - State, accounts, roles and the pause flag are reloaded
 * - Startup defaults do not override stored values
 */
BOOST_AUTO_TEST_CASE(statedb_restart)
{
    CPoolValidationState vstate;
    BOOST_REQUIRE(InitPool(vstate));
    BOOST_CHECK(db->ExistsPoolState());

    BOOST_REQUIRE(vault->Mint("bob", 100 * COIN) > 0);
    Deposit("alice", 100 * COIN);
    BOOST_REQUIRE(vault->Rebase(220 * COIN));
    CAmount nOut = 0;
    BOOST_REQUIRE(pool->Deposit("bob", 100 * COIN, nOut, vstate));
    BOOST_REQUIRE(pool->Withdraw("alice", 10 * COIN, nOut, vstate));
    BOOST_REQUIRE(pool->GrantRole("admin", PoolRole::ADMIN, "carol", vstate));
    BOOST_REQUIRE(pool->RevokeRole("admin", PoolRole::PAUSER, "pauser", vstate));
    BOOST_REQUIRE(pool->GrantRole("admin", PoolRole::PAUSER, "dave", vstate));
    BOOST_REQUIRE(pool->Pause("dave", vstate));

    const PoolState before = pool->GetState();
    const std::map<std::string, UserAccount> accountsBefore = pool->GetAccounts();

    Reopen();
    BOOST_REQUIRE(pool->Init(5 * COIN, "other", "other", vstate));

    const PoolState after = pool->GetState();
    BOOST_CHECK_EQUAL(after.totalShares, before.totalShares);
    BOOST_CHECK_EQUAL(after.treasuryShares, before.treasuryShares);
    BOOST_CHECK_EQUAL(after.poolValue, before.poolValue);
    BOOST_CHECK_EQUAL(after.accumulatedScaledBalance, before.accumulatedScaledBalance);
    BOOST_CHECK_EQUAL(after.lastRewardTimestamp, TEST_MOCK_TIME);
    BOOST_CHECK_EQUAL(after.maxTotalDeposit, DB_TEST_CAP);
    BOOST_CHECK(after.fPaused);

    const std::map<std::string, UserAccount> accountsAfter = pool->GetAccounts();
    BOOST_REQUIRE_EQUAL(accountsAfter.size(), accountsBefore.size());
    for (const auto& entry : accountsBefore) {
        BOOST_CHECK_EQUAL(accountsAfter.at(entry.first).scaledBalance, entry.second.scaledBalance);
        BOOST_CHECK_EQUAL(accountsAfter.at(entry.first).shares, entry.second.shares);
    }

    BOOST_CHECK(pool->HasRole(PoolRole::ADMIN, "admin"));
    BOOST_CHECK(pool->HasRole(PoolRole::ADMIN, "carol"));
    BOOST_CHECK(!pool->HasRole(PoolRole::ADMIN, "other"));
    BOOST_CHECK(!pool->HasRole(PoolRole::PAUSER, "pauser"));
    BOOST_CHECK(pool->HasRole(PoolRole::PAUSER, "dave"));

    // The reloaded pool keeps working
    BOOST_CHECK(pool->Unpause("dave", vstate));
    BOOST_CHECK(pool->CheckInvariants(vstate));
}

/**
 * Test 4: Inconsistent state is refused
 *
 * A stored accumulatedScaledBalance without matching accounts must not be
 * loaded.
 */
BOOST_AUTO_TEST_CASE(statedb_refuses_inconsistent_state)
{
    PoolState state;
    state.totalShares = 5;
    state.poolValue = 5;
    state.accumulatedScaledBalance = 5;
    state.maxTotalDeposit = DB_TEST_CAP;
    BOOST_REQUIRE(db->WritePoolState(state));

    CPoolValidationState vstate;
    BOOST_CHECK(!InitPool(vstate));
    BOOST_CHECK(vstate.GetError() == PoolError::INVARIANT_VIOLATION);
    BOOST_CHECK_EQUAL(vstate.GetRejectReason(), "bad-scaled-sum");

    state.poolValue = -1;
    BOOST_REQUIRE(db->WritePoolState(state));
    vstate.Reset();
    BOOST_CHECK(!InitPool(vstate));
    BOOST_CHECK(vstate.GetError() == PoolError::INVARIANT_VIOLATION);
    BOOST_CHECK_EQUAL(vstate.GetRejectReason(), "bad-state-invariant");
}

BOOST_AUTO_TEST_CASE(statedb_wipe)
{
    CPoolValidationState vstate;
    BOOST_REQUIRE(InitPool(vstate));
    Deposit("alice", 10 * COIN);

    Reopen(true);
    BOOST_CHECK(!db->ExistsPoolState());
    BOOST_REQUIRE(InitPool(vstate));
    BOOST_CHECK(pool->GetState().IsNull());
    BOOST_CHECK(pool->GetAccounts().empty());
}

/**
 * Test 5: Vault holdings are checked on load
 *
 * Verify that:
 * - A pool over a vault that does not hold its shares is refused
 * - The stored vault restores balances, totals and the rate
 * - The restored pool pays out the claims it had before the restart
 */
BOOST_AUTO_TEST_CASE(statedb_vault_restart)
{
    CPoolValidationState vstate;
    BOOST_REQUIRE(InitPool(vstate));
    BOOST_CHECK(!db->ExistsVault());

    Deposit("alice", 100 * COIN);
    BOOST_REQUIRE(vault->Rebase(110 * COIN));
    BOOST_REQUIRE(pool->AssignRewards(vstate));
    BOOST_REQUIRE(db->WriteVault(*vault));
    BOOST_CHECK(db->ExistsVault());

    CAmount nClaimBefore = 0;
    BOOST_REQUIRE(pool->GetClaim("alice", nClaimBefore));
    const PoolState before = pool->GetState();

    // An empty vault holds none of the pool's shares
    Reopen(false, true);
    BOOST_CHECK(!InitPool(vstate));
    BOOST_CHECK(vstate.GetError() == PoolError::INVARIANT_VIOLATION);
    BOOST_CHECK_EQUAL(vstate.GetRejectReason(), "bad-vault-holdings");

    Reopen(false, true);
    BOOST_REQUIRE(db->ReadVault(*vault));
    BOOST_CHECK_EQUAL(vault->GetTotalShares(), 100 * COIN);
    BOOST_CHECK_EQUAL(vault->GetPooledValue(), 110 * COIN);
    BOOST_CHECK_EQUAL(vault->GetBalance(pool->GetPoolAddress()), before.totalShares + before.treasuryShares);

    vstate.Reset();
    BOOST_REQUIRE_MESSAGE(InitPool(vstate), vstate.ToString());
    CAmount nClaimAfter = 0;
    BOOST_REQUIRE(pool->GetClaim("alice", nClaimAfter));
    BOOST_CHECK_EQUAL(nClaimAfter, nClaimBefore);

    CAmount nOut = 0;
    BOOST_CHECK(pool->Withdraw("alice", nClaimAfter / 2, nOut, vstate));
    BOOST_CHECK(nOut > 0);
    BOOST_CHECK(pool->CheckInvariants(vstate));
}

BOOST_AUTO_TEST_CASE(statedb_vault_restore_checks)
{
    CInMemoryVault other;
    BOOST_CHECK(!db->ReadVault(other));

    std::map<std::string, CAmount> balances;
    balances["alice"] = 4;
    balances["bob"] = 5;
    BOOST_CHECK(!other.Restore(10, 10, balances));
    BOOST_CHECK_EQUAL(other.GetTotalShares(), 0);
    BOOST_CHECK_EQUAL(other.GetBalance("alice"), 0);

    balances["bob"] = -1;
    BOOST_CHECK(!other.Restore(3, 3, balances));

    balances["bob"] = 6;
    BOOST_CHECK(other.Restore(10, 12, balances));
    BOOST_CHECK_EQUAL(other.GetBalance("bob"), 6);
    BOOST_CHECK_EQUAL(other.GetValue(5), 6);
}

/**
 * Test 6: A failed database write aborts the operation
 *
 * Nothing is committed in memory, no share moves and no event is published.
 * Once the database accepts writes again the same call is credited once.
 */
BOOST_AUTO_TEST_CASE(statedb_write_failure_aborts)
{
    CPoolValidationState vstate;
    BOOST_REQUIRE(InitPool(vstate));
    Deposit("alice", 100 * COIN);
    BOOST_REQUIRE(vault->Mint("bob", 50 * COIN) > 0);

    CRecordingListener listener;
    pool->RegisterListener(&listener);
    const PoolState before = pool->GetState();
    db->fFailWrites = true;

    CAmount nOut = 0;
    BOOST_CHECK(!pool->Deposit("bob", 50 * COIN, nOut, vstate));
    BOOST_CHECK(vstate.GetError() == PoolError::DB_ERROR);
    BOOST_CHECK_EQUAL(vstate.GetRejectReason(), "bad-db-write");
    BOOST_CHECK(!pool->HasAccount("bob"));
    BOOST_CHECK_EQUAL(vault->GetBalance("bob"), 50 * COIN);

    BOOST_CHECK(!pool->Withdraw("alice", 10 * COIN, nOut, vstate));
    BOOST_CHECK(vstate.GetError() == PoolError::DB_ERROR);
    BOOST_CHECK_EQUAL(pool->GetAccount("alice").scaledBalance, 100 * COIN);
    BOOST_CHECK_EQUAL(vault->GetBalance("alice"), 0);

    BOOST_CHECK(!pool->Pause("pauser", vstate));
    BOOST_CHECK(vstate.GetError() == PoolError::DB_ERROR);
    BOOST_CHECK(!pool->GetState().fPaused);

    BOOST_CHECK(!pool->SetDepositCap("admin", 500 * COIN, vstate));
    BOOST_CHECK(vstate.GetError() == PoolError::DB_ERROR);
    BOOST_CHECK_EQUAL(pool->GetState().maxTotalDeposit, DB_TEST_CAP);

    BOOST_CHECK(!pool->GrantRole("admin", PoolRole::PAUSER, "dave", vstate));
    BOOST_CHECK(vstate.GetError() == PoolError::DB_ERROR);
    BOOST_CHECK(!pool->HasRole(PoolRole::PAUSER, "dave"));

    BOOST_CHECK(!pool->RevokeRole("admin", PoolRole::PAUSER, "pauser", vstate));
    BOOST_CHECK(vstate.GetError() == PoolError::DB_ERROR);
    BOOST_CHECK(pool->HasRole(PoolRole::PAUSER, "pauser"));

    const PoolState after = pool->GetState();
    BOOST_CHECK_EQUAL(after.totalShares, before.totalShares);
    BOOST_CHECK_EQUAL(after.treasuryShares, before.treasuryShares);
    BOOST_CHECK_EQUAL(after.poolValue, before.poolValue);
    BOOST_CHECK_EQUAL(after.accumulatedScaledBalance, before.accumulatedScaledBalance);
    BOOST_CHECK_EQUAL(vault->GetBalance(pool->GetPoolAddress()), 100 * COIN);
    BOOST_CHECK(listener.events.empty());

    db->fFailWrites = false;
    vstate.Reset();
    BOOST_REQUIRE_MESSAGE(pool->Deposit("bob", 50 * COIN, nOut, vstate), vstate.ToString());
    pool->UnregisterListener(&listener);
    BOOST_CHECK_EQUAL(listener.events.size(), 1U);

    Reopen();
    BOOST_REQUIRE(InitPool(vstate));
    BOOST_CHECK_EQUAL(pool->GetAccount("bob").scaledBalance, 50 * COIN);
    BOOST_CHECK_EQUAL(pool->GetAccount("bob").shares, 50 * COIN);
    BOOST_CHECK_EQUAL(pool->GetState().totalShares, 150 * COIN);
    BOOST_CHECK(pool->HasRole(PoolRole::PAUSER, "pauser"));
    BOOST_CHECK(!pool->HasRole(PoolRole::PAUSER, "dave"));
}

/**
 * Test 7: A refused first deposit leaves no account on disk
 */
BOOST_AUTO_TEST_CASE(statedb_failed_transfer_erases_account)
{
    CPoolValidationState vstate;
    BOOST_REQUIRE(InitPool(vstate));
    Deposit("alice", 10 * COIN);

    // eve holds no shares, so the vault refuses to move them
    CAmount nOut = 0;
    BOOST_CHECK(!pool->Deposit("eve", COIN, nOut, vstate));
    BOOST_CHECK(vstate.GetError() == PoolError::DEPOSIT_FAILED);
    BOOST_CHECK(!pool->HasAccount("eve"));

    Reopen();
    vstate.Reset();
    BOOST_REQUIRE_MESSAGE(InitPool(vstate), vstate.ToString());
    BOOST_CHECK(!pool->HasAccount("eve"));
    BOOST_CHECK_EQUAL(pool->GetAccounts().size(), 1U);
    BOOST_CHECK_EQUAL(pool->GetState().totalShares, 10 * COIN);
    BOOST_CHECK_EQUAL(pool->GetState().accumulatedScaledBalance, 10 * COIN);
}

BOOST_AUTO_TEST_SUITE_END()
