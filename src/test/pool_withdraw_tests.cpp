// Copyright (c) 2025 The StakePool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

//
// Unit tests for withdrawals: proportional claims, the per-account share
// bound and rounding in favour of the pool.
//

#include "test/test_stakepool.h"

#include "pool/pool_state.h"
#include "pool/pool_withdraw.h"

#include <string>
#include <vector>

#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(pool_withdraw_tests, PoolTestingSetup)

/**
 * Test 1: Conservation at a constant rate
 *
 * Deposit then withdraw everything in two steps: the participant gets
 * every share back and the pool returns to empty.
 */
BOOST_AUTO_TEST_CASE(withdraw_roundtrip_constant_rate)
{
    FundAndDeposit("alice", 100 * COIN);
    listener.events.clear();

    CAmount nWithdrawn = 0;
    CPoolValidationState vstate;
    BOOST_CHECK(pool->Withdraw("alice", 40 * COIN, nWithdrawn, vstate));
    BOOST_CHECK_EQUAL(nWithdrawn, 40 * COIN);
    BOOST_CHECK_EQUAL(vault->GetBalance("alice"), 40 * COIN);
    BOOST_CHECK_EQUAL(pool->GetAccount("alice").scaledBalance, 60 * COIN);
    BOOST_CHECK_EQUAL(pool->GetAccount("alice").shares, 60 * COIN);
    BOOST_CHECK_EQUAL(pool->GetState().poolValue, 60 * COIN);

    BOOST_CHECK(pool->Withdraw("alice", 60 * COIN, nWithdrawn, vstate));
    BOOST_CHECK_EQUAL(nWithdrawn, 60 * COIN);
    BOOST_CHECK_EQUAL(vault->GetBalance("alice"), 100 * COIN);
    BOOST_CHECK_EQUAL(vault->GetBalance(pool->GetPoolAddress()), 0);

    PoolState state = pool->GetState();
    BOOST_CHECK_EQUAL(state.totalShares, 0);
    BOOST_CHECK_EQUAL(state.poolValue, 0);
    BOOST_CHECK_EQUAL(state.accumulatedScaledBalance, 0);

    // The account survives a full exit, zeroed
    BOOST_CHECK(pool->HasAccount("alice"));
    BOOST_CHECK(pool->GetAccount("alice").IsNull());

    BOOST_REQUIRE_EQUAL(listener.events.size(), 2U);
    BOOST_CHECK(listener.events[1].type == PoolEventType::WITHDRAWN);
    BOOST_CHECK_EQUAL(listener.events[1].strAccount, "alice");
    BOOST_CHECK_EQUAL(listener.events[1].nAmount, 60 * COIN);
    BOOST_CHECK_EQUAL(listener.events[1].nShares, 60 * COIN);
}

/**
 * Test 2: No over-withdrawal
 *
 * Verify that:
 * - Asking for more than the claim is refused without side effects
 * - A participant that never deposited has nothing to withdraw
 */
BOOST_AUTO_TEST_CASE(withdraw_above_claim)
{
    CAmount nWithdrawn = 0;
    CPoolValidationState vstate;
    BOOST_CHECK(!pool->Withdraw("alice", COIN, nWithdrawn, vstate));
    BOOST_CHECK(vstate.GetError() == PoolError::NOTHING_TO_WITHDRAW);

    FundAndDeposit("alice", 100 * COIN);
    const PoolState before = pool->GetState();

    BOOST_CHECK(!pool->Withdraw("alice", 100 * COIN + 1, nWithdrawn, vstate));
    BOOST_CHECK(vstate.GetError() == PoolError::NOT_ENOUGH_BALANCE);
    BOOST_CHECK_EQUAL(vstate.GetRejectReason(), "bad-withdraw-not-enough-balance");
    BOOST_CHECK_EQUAL(pool->GetState().totalShares, before.totalShares);
    BOOST_CHECK_EQUAL(pool->GetAccount("alice").scaledBalance, 100 * COIN);
    BOOST_CHECK_EQUAL(vault->GetBalance("alice"), 0);

    BOOST_CHECK(!pool->Withdraw("carol", COIN, nWithdrawn, vstate));
    BOOST_CHECK(vstate.GetError() == PoolError::NOTHING_TO_WITHDRAW);
}

BOOST_AUTO_TEST_CASE(withdraw_input_validation)
{
    FundAndDeposit("alice", 100 * COIN);
    CAmount nWithdrawn = 0;
    CPoolValidationState vstate;

    BOOST_CHECK(!pool->Withdraw("", COIN, nWithdrawn, vstate));
    BOOST_CHECK(vstate.GetError() == PoolError::ZERO_ADDRESS);
    BOOST_CHECK(!pool->Withdraw("alice", 0, nWithdrawn, vstate));
    BOOST_CHECK(vstate.GetError() == PoolError::ZERO_AMOUNT);
    BOOST_CHECK(!pool->Withdraw("alice", MAX_MONEY + 1, nWithdrawn, vstate));
    BOOST_CHECK(vstate.GetError() == PoolError::OVERFLOW);

    BOOST_REQUIRE(pool->Pause("pauser", vstate));
    BOOST_CHECK(!pool->Withdraw("alice", COIN, nWithdrawn, vstate));
    BOOST_CHECK(vstate.GetError() == PoolError::PAUSED);
}

/**
 * Test 3: Loss sharing
 *
 * After a 25% loss each of two equal depositors can take out 75, not 100.
 * The first exit leaves the second claim intact.
 */
BOOST_AUTO_TEST_CASE(withdraw_after_loss)
{
    FundAndDeposit("alice", 100 * COIN);
    FundAndDeposit("bob", 100 * COIN);
    BOOST_REQUIRE(vault->Rebase(150 * COIN));

    CAmount nWithdrawn = 0;
    CPoolValidationState vstate;
    BOOST_CHECK(!pool->Withdraw("alice", 100 * COIN, nWithdrawn, vstate));
    BOOST_CHECK(vstate.GetError() == PoolError::NOT_ENOUGH_BALANCE);

    vstate.Reset();
    BOOST_REQUIRE(pool->AssignRewards(vstate));
    BOOST_CHECK_EQUAL(ClaimOf("alice"), 75 * COIN);
    BOOST_CHECK_EQUAL(ClaimOf("bob"), 75 * COIN);

    BOOST_CHECK(pool->Withdraw("alice", 75 * COIN, nWithdrawn, vstate));
    BOOST_CHECK_EQUAL(nWithdrawn, 75 * COIN);
    BOOST_CHECK_EQUAL(vault->GetBalance("alice"), 100 * COIN);
    BOOST_CHECK(pool->GetAccount("alice").IsNull());

    BOOST_CHECK_EQUAL(ClaimOf("bob"), 75 * COIN);
    BOOST_CHECK_EQUAL(pool->GetState().poolValue, 75 * COIN);
    BOOST_CHECK(pool->CheckInvariants(vstate));
}

/**
 * Test 4: Full claim after yield
 *
 * The share conversion rounds down, so withdrawing the whole claim at a
 * non-unit rate leaves one unit of dust in the pool.
 */
BOOST_AUTO_TEST_CASE(withdraw_full_claim_after_yield)
{
    BOOST_REQUIRE(vault->Mint("bob", 100 * COIN) > 0);
    FundAndDeposit("alice", 100 * COIN);
    BOOST_REQUIRE(vault->Rebase(220 * COIN));

    CAmount nCredited = 0;
    CPoolValidationState vstate;
    BOOST_REQUIRE(pool->Deposit("bob", 100 * COIN, nCredited, vstate));
    BOOST_REQUIRE_EQUAL(ClaimOf("alice"), 100 * COIN);

    CAmount nWithdrawn = 0;
    BOOST_CHECK(pool->Withdraw("alice", 100 * COIN, nWithdrawn, vstate));
    BOOST_CHECK_EQUAL(nWithdrawn, 9999999999);
    BOOST_CHECK_EQUAL(vault->GetBalance("alice"), 9090909090);
    BOOST_CHECK_EQUAL(pool->GetAccount("alice").scaledBalance, 1);
    BOOST_CHECK_EQUAL(pool->GetAccount("alice").shares, 1);

    BOOST_CHECK_EQUAL(ClaimOf("bob"), 9999999999);
    BOOST_CHECK(pool->CheckInvariants(vstate));

    // Less than one share's worth converts to nothing
    BOOST_CHECK(!pool->Withdraw("bob", 1, nWithdrawn, vstate));
    BOOST_CHECK(vstate.GetError() == PoolError::TRANSFER_FAILED);
    BOOST_CHECK_EQUAL(vstate.GetRejectReason(), "bad-withdraw-zero-shares");
}

/**
 * Test 5: Dust bound
 *
 * Across deposits, withdrawals, yield and loss at odd rates, claims never
 * add up to more than the pool value and fall short of it by less than
 * one unit per account.
 */
BOOST_AUTO_TEST_CASE(withdraw_dust_bound)
{
    BOOST_REQUIRE(vault->Mint("alice", 3333333333) > 0);
    BOOST_REQUIRE(vault->Mint("bob", 7777777777) > 0);
    BOOST_REQUIRE(vault->Mint("carol", 1234567891) > 0);

    CAmount nOut = 0;
    CPoolValidationState vstate;
    BOOST_REQUIRE(pool->Deposit("alice", 3333333333, nOut, vstate));
    BOOST_REQUIRE(vault->Rebase(vault->GetPooledValue() * 107 / 100));
    BOOST_REQUIRE(pool->Deposit("bob", 7777777777, nOut, vstate));
    BOOST_REQUIRE(vault->Rebase(vault->GetPooledValue() * 103 / 100));
    BOOST_REQUIRE(pool->Deposit("carol", 1234567891, nOut, vstate));
    BOOST_REQUIRE(pool->Withdraw("alice", 10 * COIN, nOut, vstate));
    BOOST_REQUIRE(vault->Rebase(vault->GetPooledValue() * 95 / 100));
    BOOST_REQUIRE(pool->AssignRewards(vstate));

    const PoolState state = pool->GetState();
    CAmount nClaims = 0;
    for (const auto& entry : pool->GetAccounts()) {
        nClaims += ClaimOf(entry.first);
    }
    BOOST_CHECK(nClaims <= state.poolValue);
    BOOST_CHECK(state.poolValue - nClaims < (CAmount)pool->GetAccounts().size());

    // The pool always holds the shares it accounts for
    BOOST_CHECK_EQUAL(vault->GetBalance(pool->GetPoolAddress()), state.totalShares + state.treasuryShares);
    BOOST_CHECK(pool->CheckInvariants(vstate));
}

/**
 * Test 6: Share bound
 *
 * An account whose share bound is below what its claim converts to is
 * refused with InsufficientShares.
 */
BOOST_AUTO_TEST_CASE(withdraw_insufficient_shares)
{
    CInMemoryVault oracle; // 1:1

    PoolState state;
    state.totalShares = 100;
    state.poolValue = 100;
    state.accumulatedScaledBalance = 100;

    UserAccount account;
    account.scaledBalance = 100;
    account.shares = 50;

    PoolWithdrawResult result;
    CPoolValidationState vstate;
    BOOST_CHECK(!ApplyPoolWithdraw(state, account, oracle, 60, result, vstate));
    BOOST_CHECK(vstate.GetError() == PoolError::INSUFFICIENT_SHARES);
    BOOST_CHECK_EQUAL(account.shares, 50);
    BOOST_CHECK_EQUAL(state.totalShares, 100);

    // Within the bound the debit is proportional
    vstate.Reset();
    BOOST_CHECK(ApplyPoolWithdraw(state, account, oracle, 40, result, vstate));
    BOOST_CHECK_EQUAL(result.nSharesToWithdraw, 40);
    BOOST_CHECK_EQUAL(result.nAmountToDebit, 40);
    BOOST_CHECK_EQUAL(result.nSharesDebit, 20);
    BOOST_CHECK_EQUAL(account.scaledBalance, 60);
    BOOST_CHECK_EQUAL(account.shares, 30);
}

BOOST_AUTO_TEST_CASE(withdraw_shares_without_scaled_balance)
{
    CInMemoryVault oracle;

    PoolState state;
    state.totalShares = 100;
    state.poolValue = 100;
    state.accumulatedScaledBalance = 100;

    UserAccount account;
    account.shares = 10;

    PoolWithdrawResult result;
    CPoolValidationState vstate;
    BOOST_CHECK(!ApplyPoolWithdraw(state, account, oracle, 10, result, vstate));
    BOOST_CHECK(vstate.GetError() == PoolError::INVARIANT_VIOLATION);
    BOOST_CHECK(vstate.IsError());
}

/**
 * Test 7: Minimum withdrawals above a unit rate
 *
 * At poolValue / accumulatedScaledBalance = 1.5 a one-unit withdrawal is
 * worth less than one scaled unit. Every withdrawal must still debit at
 * least one, so repeating it cannot take out more than the claim or eat
 * into another holder's claim.
 */
BOOST_AUTO_TEST_CASE(withdraw_repeated_minimum_above_unit_rate)
{
    CInMemoryVault oracle; // 1:1

    PoolState state;
    state.totalShares = 150;
    state.poolValue = 150;
    state.accumulatedScaledBalance = 100;

    UserAccount alice, bob;
    alice.scaledBalance = 50;
    alice.shares = 75;
    bob.scaledBalance = 50;
    bob.shares = 75;

    CAmount nAliceClaim = 0, nBobClaim = 0;
    BOOST_REQUIRE(CalculateClaim(alice.scaledBalance, state.poolValue, state.accumulatedScaledBalance, nAliceClaim));
    BOOST_REQUIRE(CalculateClaim(bob.scaledBalance, state.poolValue, state.accumulatedScaledBalance, nBobClaim));
    BOOST_REQUIRE_EQUAL(nAliceClaim, 75);

    PoolWithdrawResult result;
    CPoolValidationState vstate;
    CAmount nWithdrawn = 0;
    int nCalls = 0;
    while (ApplyPoolWithdraw(state, alice, oracle, 1, result, vstate)) {
        BOOST_REQUIRE(result.nAmountToDebit >= 1);
        nWithdrawn += result.nFinalAmount;
        state.poolValue = oracle.GetValue(state.totalShares);
        BOOST_REQUIRE(++nCalls <= 150);
    }
    BOOST_CHECK(vstate.GetError() == PoolError::NOTHING_TO_WITHDRAW);
    BOOST_CHECK(alice.IsNull());
    BOOST_CHECK_EQUAL(nWithdrawn, 50);
    BOOST_CHECK(nWithdrawn <= nAliceClaim);

    CAmount nBobAfter = 0;
    BOOST_REQUIRE(CalculateClaim(bob.scaledBalance, state.poolValue, state.accumulatedScaledBalance, nBobAfter));
    BOOST_CHECK(nBobAfter >= nBobClaim);
    BOOST_CHECK_EQUAL(nWithdrawn + nBobAfter, 150);
}

/**
 * Test 8: Conservation with several participants
 *
 * With no yield and a non-unit vault rate, interleaved deposits and
 * withdrawals keep the claims equal to what was credited minus what was
 * paid out, give or take one unit per operation.
 */
BOOST_AUTO_TEST_CASE(withdraw_interleaved_conservation)
{
    BOOST_REQUIRE(vault->Mint("whale", 3333333333) > 0);
    BOOST_REQUIRE(vault->Rebase(3666666667));

    const std::vector<std::string> accounts = {"alice", "bob", "carol", "dave"};
    for (const std::string& account : accounts) {
        BOOST_REQUIRE(vault->Mint(account, 1000 * COIN) > 0);
    }

    CAmount nCredited = 0, nPaid = 0;
    int64_t nOps = 0;
    CPoolValidationState vstate;

    auto checkConservation = [&]() {
        CAmount nClaims = 0;
        for (const std::string& account : accounts) {
            nClaims += ClaimOf(account);
        }
        const CAmount nDiff = nCredited - nPaid - nClaims;
        BOOST_CHECK_MESSAGE(nDiff <= nOps && -nDiff <= nOps, "claims off by " << nDiff << " after " << nOps << " operations");
        BOOST_CHECK(nClaims <= pool->GetState().poolValue);
        BOOST_CHECK_MESSAGE(pool->CheckInvariants(vstate), vstate.ToString());
    };

    for (int round = 0; round < 5; ++round) {
        for (size_t i = 0; i < accounts.size(); ++i) {
            const CAmount nAmount = (CAmount)(i + 1) * 1234567 * (round + 3) + 7 * round + (CAmount)i;
            CAmount nOut = 0;
            BOOST_REQUIRE_MESSAGE(pool->Deposit(accounts[i], nAmount, nOut, vstate), vstate.ToString());
            nCredited += nOut;
            ++nOps;
            checkConservation();
        }
        for (size_t i = 0; i < accounts.size(); ++i) {
            if ((i + round) % 2 != 0) continue;
            const CAmount nAmount = ClaimOf(accounts[i]) * (CAmount)(i + 1) / 5;
            if (nAmount <= 0) continue;
            CAmount nOut = 0;
            BOOST_REQUIRE_MESSAGE(pool->Withdraw(accounts[i], nAmount, nOut, vstate), vstate.ToString());
            nPaid += nOut;
            ++nOps;
            checkConservation();
        }
    }

    BOOST_CHECK_EQUAL(listener.Count(PoolEventType::REWARDS_ASSIGNED), 0U);
    BOOST_CHECK_EQUAL(pool->GetState().treasuryShares, 0);
}

BOOST_AUTO_TEST_SUITE_END()
