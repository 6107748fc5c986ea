// Copyright (c) 2025 The StakePool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pool/pool_ledger.h"

#include "logging.h"
#include "pool/pool_deposit.h"
#include "pool/pool_emergency.h"
#include "pool/pool_math.h"
#include "pool/pool_oracle.h"
#include "pool/pool_rewards.h"
#include "pool/pool_statedb.h"
#include "pool/pool_withdraw.h"
#include "util/time.h"
#include "utilmoneystr.h"

#include <algorithm>

CStakePool::CStakePool(CRateOracle& oracleIn, const std::string& strPoolAddressIn, CPoolStateDB* pdbIn) :
    oracle(oracleIn), strPoolAddress(strPoolAddressIn), pdb(pdbIn)
{
}

bool CStakePool::Init(CAmount nDefaultCap, const std::string& strAdmin, const std::string& strPauser, CPoolValidationState& vstate)
{
    LOCK(cs_pool);

    state.SetNull();
    mapAccounts.clear();
    roles.Clear();

    try {
        if (pdb && pdb->ExistsPoolState()) {
            if (!pdb->ReadPoolState(state) || !pdb->LoadAllAccounts(mapAccounts) || !pdb->LoadRoles(roles)) {
                return vstate.Invalid(error("%s: unable to load pool state", __func__), PoolError::DB_ERROR, "bad-db-read");
            }
            if (!CheckInvariants(vstate)) {
                return error("%s: stored pool state is inconsistent: %s", __func__, vstate.ToString());
            }
            if (!CheckHoldings(vstate)) {
                return error("%s: stored pool state does not match the vault: %s", __func__, vstate.ToString());
            }
            LogPrintf("Loaded pool %s: %s, %u account(s)\n", strPoolAddress, state.ToString(), mapAccounts.size());
            return true;
        }
    } catch (const dbwrapper_error& e) {
        return vstate.Invalid(error("%s: %s", __func__, e.what()), PoolError::DB_ERROR, "bad-db-read");
    }

    if (strAdmin.empty()) {
        return vstate.Invalid(PoolError::ZERO_ADDRESS, "bad-init-zero-admin");
    }
    if (!CheckSetDepositCap(state, nDefaultCap, vstate)) {
        return false;
    }

    state.maxTotalDeposit = nDefaultCap;
    roles.Grant(PoolRole::ADMIN, strAdmin);
    if (!strPauser.empty()) {
        roles.Grant(PoolRole::PAUSER, strPauser);
    }

    if (pdb) {
        bool fOk = pdb->WriteOperation(state, {}) && pdb->WriteRoleChange(PoolRole::ADMIN, strAdmin, true);
        if (fOk && !strPauser.empty()) {
            fOk = pdb->WriteRoleChange(PoolRole::PAUSER, strPauser, true);
        }
        if (!fOk) {
            return vstate.Invalid(error("%s: unable to write fresh pool", __func__), PoolError::DB_ERROR, "bad-db-write");
        }
    }

    LogPrintf("Created pool %s: cap=%s admin=%s pauser=%s\n", strPoolAddress, FormatMoney(nDefaultCap), strAdmin, strPauser);
    return true;
}

bool CStakePool::CheckNotEntered(const char* pszOperation, CPoolValidationState& vstate) const
{
    AssertLockHeld(cs_pool);
    if (fEntered) {
        return vstate.Invalid(error("%s: nested call rejected", pszOperation), PoolError::REENTRANCY, "bad-reentrant-call");
    }
    return true;
}

bool CStakePool::RequireRole(PoolRole role, const std::string& strCaller, const char* pszOperation, CPoolValidationState& vstate) const
{
    AssertLockHeld(cs_pool);
    if (!roles.HasRole(role, strCaller)) {
        return vstate.Invalid(PoolError::UNAUTHORIZED, "bad-unauthorized",
                              strprintf("%s requires %s, %s does not hold it", pszOperation, PoolRoleName(role), strCaller));
    }
    return true;
}

bool CStakePool::CheckHoldings(CPoolValidationState& vstate) const
{
    AssertLockHeld(cs_pool);

    CAmount nBooked = 0;
    if (!pool_math::CheckedAdd(state.totalShares, state.treasuryShares, nBooked)) {
        return vstate.Invalid(PoolError::INVARIANT_VIOLATION, "bad-state-invariant", state.ToString());
    }
    const CAmount nHeld = oracle.GetBalance(strPoolAddress);
    if (nHeld != nBooked) {
        return vstate.Invalid(error("%s: vault holds %s shares for %s, the books account for %s", __func__,
                                    FormatMoney(nHeld), strPoolAddress, FormatMoney(nBooked)),
                              PoolError::INVARIANT_VIOLATION, "bad-vault-holdings");
    }
    return true;
}

UserAccount CStakePool::LookupAccount(const std::string& strAddress) const
{
    auto it = mapAccounts.find(strAddress);
    return it == mapAccounts.end() ? UserAccount() : it->second;
}

CStakePool::AccountSnapshot CStakePool::TakeSnapshot(const std::string& strAddress) const
{
    AccountSnapshot snapshot;
    snapshot.strAddress = strAddress;
    auto it = mapAccounts.find(strAddress);
    snapshot.fExisted = it != mapAccounts.end();
    if (snapshot.fExisted) {
        snapshot.account = it->second;
    }
    return snapshot;
}

void CStakePool::RestoreSnapshot(const AccountSnapshot& snapshot)
{
    if (snapshot.fExisted) {
        mapAccounts[snapshot.strAddress] = snapshot.account;
    } else {
        mapAccounts.erase(snapshot.strAddress);
    }
}

bool CStakePool::RunRewards(PoolState& next, std::vector<CPoolEvent>& events, CPoolValidationState& vstate) const
{
    pool_rewards::RewardAssignment rewards;
    if (!pool_rewards::AssignRewards(next, oracle, GetTime(), rewards, vstate)) {
        return false;
    }
    if (rewards.fAssigned) {
        events.push_back(CPoolEvent::RewardsAssigned(rewards.nSharesYield, next.totalShares, next.lastRewardTimestamp));
    }
    return true;
}

bool CStakePool::Persist(const PoolState& stateIn, const std::vector<std::pair<std::string, UserAccount>>& accounts,
                         CPoolValidationState& vstate)
{
    if (!pdb) return true;

    if (!pdb->WriteOperation(stateIn, accounts)) {
        return vstate.Invalid(error("%s: pool state not persisted", __func__), PoolError::DB_ERROR, "bad-db-write");
    }
    return true;
}

void CStakePool::RollBack(const PoolState& snapshot, const AccountSnapshot* pAccountSnapshot)
{
    state = snapshot;

    std::vector<std::pair<std::string, UserAccount>> accounts;
    std::vector<std::string> vErased;
    if (pAccountSnapshot) {
        RestoreSnapshot(*pAccountSnapshot);
        if (pAccountSnapshot->fExisted) {
            accounts.emplace_back(pAccountSnapshot->strAddress, pAccountSnapshot->account);
        } else {
            vErased.push_back(pAccountSnapshot->strAddress);
        }
    }

    // If this fails the disk keeps shares the vault never moved, and the
    // holdings check refuses the pool on the next start
    if (pdb && !pdb->WriteOperation(state, accounts, vErased)) {
        error("%s: rolled back state of pool %s not written", __func__, strPoolAddress);
    }
}

void CStakePool::Emit(const std::vector<CPoolEvent>& events)
{
    for (const CPoolEvent& event : events) {
        LogPrint(BCLog::POOL, "event %s\n", event.ToString());
        for (CPoolEventListener* listener : vListeners) {
            listener->PoolEvent(event);
        }
    }
}

bool CStakePool::AssignRewards(CPoolValidationState& vstate)
{
    LOCK(cs_pool);
    if (!CheckNotEntered(__func__, vstate)) return false;
    if (state.fPaused) {
        return vstate.Invalid(PoolError::PAUSED, "bad-rewards-paused");
    }
    EntryGuard guard(fEntered);

    PoolState next = state;
    std::vector<CPoolEvent> events;
    if (!RunRewards(next, events, vstate)) {
        return false;
    }
    if (!Persist(next, {}, vstate)) {
        return false;
    }
    state = next;

    Emit(events);
    return true;
}

bool CStakePool::Deposit(const std::string& strAccount, CAmount nAmount, CAmount& nCredited, CPoolValidationState& vstate)
{
    LOCK(cs_pool);
    if (!CheckNotEntered(__func__, vstate)) return false;
    if (!CheckPoolDeposit(state, strAccount, nAmount, vstate)) {
        LogPrint(BCLog::POOL, "%s: %s rejected: %s\n", __func__, strAccount, vstate.ToString());
        return false;
    }
    EntryGuard guard(fEntered);

    const PoolState snapshot = state;
    const AccountSnapshot accountSnapshot = TakeSnapshot(strAccount);

    PoolState next = state;
    std::vector<CPoolEvent> events;
    if (!RunRewards(next, events, vstate)) {
        return false;
    }

    UserAccount account = LookupAccount(strAccount);
    PoolDepositResult result;
    if (!ApplyPoolDeposit(next, account, oracle, nAmount, result, vstate)) {
        LogPrint(BCLog::POOL, "%s: %s rejected: %s\n", __func__, strAccount, vstate.ToString());
        return false;
    }
    // Transfers do not move the rate, so this is the value once the shares land
    next.poolValue = oracle.GetValue(next.totalShares);

    // Internal state is final and on disk before the external call
    if (!Persist(next, {{strAccount, account}}, vstate)) {
        return false;
    }
    state = next;
    mapAccounts[strAccount] = account;

    const CAmount nSent = oracle.TransferSharesFrom(strAccount, strPoolAddress, result.nDepositShares);
    if (nSent != result.nDepositShares) {
        RollBack(snapshot, &accountSnapshot);
        return vstate.Invalid(error("%s: vault moved %d of %d shares from %s", __func__, nSent, result.nDepositShares, strAccount),
                              PoolError::DEPOSIT_FAILED, "bad-deposit-transfer-failed");
    }

    nCredited = result.nFinalAmount;

    LogPrint(BCLog::POOL, "%s: %s deposited %s (%s shares, %s scaled), poolValue=%s\n", __func__, strAccount,
             FormatMoney(result.nFinalAmount), FormatMoney(result.nDepositShares), FormatMoney(result.nScaledAmount),
             FormatMoney(state.poolValue));

    events.push_back(CPoolEvent::Deposited(strAccount, result.nFinalAmount, result.nDepositShares));
    Emit(events);
    return true;
}

bool CStakePool::Withdraw(const std::string& strAccount, CAmount nAmount, CAmount& nWithdrawn, CPoolValidationState& vstate)
{
    LOCK(cs_pool);
    if (!CheckNotEntered(__func__, vstate)) return false;
    if (!CheckPoolWithdraw(state, strAccount, nAmount, vstate)) {
        LogPrint(BCLog::POOL, "%s: %s rejected: %s\n", __func__, strAccount, vstate.ToString());
        return false;
    }
    EntryGuard guard(fEntered);

    const PoolState snapshot = state;
    const AccountSnapshot accountSnapshot = TakeSnapshot(strAccount);

    PoolState next = state;
    std::vector<CPoolEvent> events;
    if (!RunRewards(next, events, vstate)) {
        return false;
    }

    UserAccount account = LookupAccount(strAccount);
    PoolWithdrawResult result;
    if (!ApplyPoolWithdraw(next, account, oracle, nAmount, result, vstate)) {
        LogPrint(BCLog::POOL, "%s: %s rejected: %s\n", __func__, strAccount, vstate.ToString());
        return false;
    }
    next.poolValue = oracle.GetValue(next.totalShares);

    if (!Persist(next, {{strAccount, account}}, vstate)) {
        return false;
    }
    state = next;
    mapAccounts[strAccount] = account;

    const CAmount nSent = oracle.TransferShares(strAccount, result.nSharesToWithdraw);
    if (nSent != result.nSharesToWithdraw) {
        RollBack(snapshot, &accountSnapshot);
        return vstate.Invalid(error("%s: vault sent %d of %d shares to %s", __func__, nSent, result.nSharesToWithdraw, strAccount),
                              PoolError::TRANSFER_FAILED, "bad-withdraw-transfer-failed");
    }

    nWithdrawn = result.nFinalAmount;

    LogPrint(BCLog::POOL, "%s: %s withdrew %s (%s shares, %s scaled), poolValue=%s\n", __func__, strAccount,
             FormatMoney(result.nFinalAmount), FormatMoney(result.nSharesToWithdraw), FormatMoney(result.nAmountToDebit),
             FormatMoney(state.poolValue));

    events.push_back(CPoolEvent::Withdrawn(strAccount, result.nFinalAmount, result.nSharesToWithdraw));
    Emit(events);
    return true;
}

bool CStakePool::EmergencyWithdraw(const std::string& strAccount, CAmount& nWithdrawn, CPoolValidationState& vstate)
{
    LOCK(cs_pool);
    if (!CheckNotEntered(__func__, vstate)) return false;
    if (!CheckPoolEmergencyWithdraw(state, strAccount, vstate)) {
        return false;
    }
    EntryGuard guard(fEntered);

    const PoolState snapshot = state;
    const AccountSnapshot accountSnapshot = TakeSnapshot(strAccount);

    PoolState next = state;
    UserAccount account = LookupAccount(strAccount);
    PoolEmergencyResult result;
    if (!ApplyPoolEmergencyWithdraw(next, account, oracle, result, vstate)) {
        return false;
    }

    // poolValue keeps the last synchronized view while paused
    if (!Persist(next, {{strAccount, account}}, vstate)) {
        return false;
    }
    state = next;
    mapAccounts[strAccount] = account;

    const CAmount nSent = oracle.TransferShares(strAccount, result.nSharesToWithdraw);
    if (nSent != result.nSharesToWithdraw || nSent == 0) {
        RollBack(snapshot, &accountSnapshot);
        return vstate.Invalid(error("%s: vault sent %d of %d shares to %s", __func__, nSent, result.nSharesToWithdraw, strAccount),
                              PoolError::TRANSFER_FAILED, "bad-emergency-transfer-failed");
    }

    nWithdrawn = oracle.GetValue(nSent);

    LogPrint(BCLog::POOL, "%s: %s exited with %s (%s shares, claim %s)\n", __func__, strAccount,
             FormatMoney(nWithdrawn), FormatMoney(nSent), FormatMoney(result.nCurrentAmount));

    Emit({CPoolEvent::EmergencyWithdrawn(strAccount, nWithdrawn, nSent)});
    return true;
}

bool CStakePool::SetDepositCap(const std::string& strCaller, CAmount nNewCap, CPoolValidationState& vstate)
{
    LOCK(cs_pool);
    if (!CheckNotEntered(__func__, vstate)) return false;
    if (!RequireRole(PoolRole::ADMIN, strCaller, __func__, vstate)) return false;
    if (!CheckSetDepositCap(state, nNewCap, vstate)) return false;
    EntryGuard guard(fEntered);

    const CAmount nOldCap = state.maxTotalDeposit;
    PoolState next = state;
    next.maxTotalDeposit = nNewCap;
    if (!Persist(next, {}, vstate)) {
        return false;
    }
    state = next;

    LogPrint(BCLog::POOL, "%s: %s set cap %s -> %s\n", __func__, strCaller, FormatMoney(nOldCap), FormatMoney(nNewCap));
    Emit({CPoolEvent::DepositCapUpdated(nOldCap, nNewCap)});
    return true;
}

bool CStakePool::Pause(const std::string& strCaller, CPoolValidationState& vstate)
{
    LOCK(cs_pool);
    if (!CheckNotEntered(__func__, vstate)) return false;
    if (!RequireRole(PoolRole::PAUSER, strCaller, __func__, vstate)) return false;
    if (!CheckPoolPause(state, true, vstate)) return false;
    EntryGuard guard(fEntered);

    PoolState next = state;
    next.fPaused = true;
    if (!Persist(next, {}, vstate)) {
        return false;
    }
    state = next;

    LogPrintf("Pool %s paused by %s\n", strPoolAddress, strCaller);
    Emit({CPoolEvent::Paused(strCaller)});
    return true;
}

bool CStakePool::Unpause(const std::string& strCaller, CPoolValidationState& vstate)
{
    LOCK(cs_pool);
    if (!CheckNotEntered(__func__, vstate)) return false;
    if (!RequireRole(PoolRole::PAUSER, strCaller, __func__, vstate)) return false;
    if (!CheckPoolPause(state, false, vstate)) return false;
    EntryGuard guard(fEntered);

    PoolState next = state;
    next.fPaused = false;
    if (!Persist(next, {}, vstate)) {
        return false;
    }
    state = next;

    LogPrintf("Pool %s unpaused by %s\n", strPoolAddress, strCaller);
    Emit({CPoolEvent::Unpaused(strCaller)});
    return true;
}

bool CStakePool::AdminWithdraw(const std::string& strCaller, CAmount nAmount, const std::string& strDestination,
                               CPoolValidationState& vstate)
{
    LOCK(cs_pool);
    if (!CheckNotEntered(__func__, vstate)) return false;
    if (!RequireRole(PoolRole::ADMIN, strCaller, __func__, vstate)) return false;
    EntryGuard guard(fEntered);

    const PoolState snapshot = state;
    PoolState next = state;
    PoolAdminWithdrawResult result;
    if (!ApplyAdminWithdraw(next, oracle, nAmount, strDestination, result, vstate)) {
        return false;
    }
    if (!Persist(next, {}, vstate)) {
        return false;
    }
    state = next;

    const CAmount nSent = oracle.TransferShares(strDestination, result.nShares);
    if (nSent != result.nShares) {
        RollBack(snapshot, nullptr);
        return vstate.Invalid(error("%s: vault sent %d of %d treasury shares to %s", __func__, nSent, result.nShares, strDestination),
                              PoolError::TRANSFER_FAILED, "bad-adminwithdraw-transfer-failed");
    }

    LogPrint(BCLog::POOL, "%s: %s sent %s treasury shares to %s, treasuryShares=%s\n", __func__, strCaller,
             FormatMoney(nSent), strDestination, FormatMoney(state.treasuryShares));
    Emit({CPoolEvent::TreasuryWithdrawn(strDestination, nAmount, nSent)});
    return true;
}

bool CStakePool::GrantRole(const std::string& strCaller, PoolRole role, const std::string& strAccount, CPoolValidationState& vstate)
{
    LOCK(cs_pool);
    if (!CheckNotEntered(__func__, vstate)) return false;
    if (!RequireRole(PoolRole::ADMIN, strCaller, __func__, vstate)) return false;
    if (strAccount.empty()) {
        return vstate.Invalid(PoolError::ZERO_ADDRESS, "bad-grantrole-zero-address");
    }
    if (roles.HasRole(role, strAccount)) {
        return true;
    }

    if (pdb && !pdb->WriteRoleChange(role, strAccount, true)) {
        return vstate.Invalid(error("%s: role change not persisted", __func__), PoolError::DB_ERROR, "bad-db-write");
    }
    roles.Grant(role, strAccount);
    LogPrintf("Role %s granted to %s by %s\n", PoolRoleName(role), strAccount, strCaller);
    return true;
}

bool CStakePool::RevokeRole(const std::string& strCaller, PoolRole role, const std::string& strAccount, CPoolValidationState& vstate)
{
    LOCK(cs_pool);
    if (!CheckNotEntered(__func__, vstate)) return false;
    if (!RequireRole(PoolRole::ADMIN, strCaller, __func__, vstate)) return false;
    if (strAccount.empty()) {
        return vstate.Invalid(PoolError::ZERO_ADDRESS, "bad-revokerole-zero-address");
    }
    if (!roles.HasRole(role, strAccount)) {
        return true;
    }
    if (role == PoolRole::ADMIN && roles.CountMembers(PoolRole::ADMIN) == 1) {
        return vstate.Invalid(PoolError::UNAUTHORIZED, "bad-revokerole-last-admin");
    }

    if (pdb && !pdb->WriteRoleChange(role, strAccount, false)) {
        return vstate.Invalid(error("%s: role change not persisted", __func__), PoolError::DB_ERROR, "bad-db-write");
    }
    roles.Revoke(role, strAccount);
    LogPrintf("Role %s revoked from %s by %s\n", PoolRoleName(role), strAccount, strCaller);
    return true;
}

PoolState CStakePool::GetState() const
{
    LOCK(cs_pool);
    return state;
}

UserAccount CStakePool::GetAccount(const std::string& strAddress) const
{
    LOCK(cs_pool);
    return LookupAccount(strAddress);
}

bool CStakePool::HasAccount(const std::string& strAddress) const
{
    LOCK(cs_pool);
    return mapAccounts.count(strAddress) > 0;
}

std::map<std::string, UserAccount> CStakePool::GetAccounts() const
{
    LOCK(cs_pool);
    return mapAccounts;
}

bool CStakePool::GetClaim(const std::string& strAddress, CAmount& nClaim) const
{
    LOCK(cs_pool);
    return CalculateClaim(LookupAccount(strAddress).scaledBalance, state.poolValue, state.accumulatedScaledBalance, nClaim);
}

bool CStakePool::HasRole(PoolRole role, const std::string& strAddress) const
{
    LOCK(cs_pool);
    return roles.HasRole(role, strAddress);
}

std::set<std::string> CStakePool::GetRoleMembers(PoolRole role) const
{
    LOCK(cs_pool);
    return roles.GetMembers(role);
}

bool CStakePool::CheckInvariants(CPoolValidationState& vstate) const
{
    LOCK(cs_pool);

    if (!state.CheckInvariants()) {
        return vstate.Invalid(PoolError::INVARIANT_VIOLATION, "bad-state-invariant", state.ToString());
    }

    CAmount nScaledSum = 0;
    for (const auto& entry : mapAccounts) {
        const UserAccount& account = entry.second;
        if (!MoneyRange(account.scaledBalance) || !MoneyRange(account.shares) ||
            !pool_math::CheckedAdd(nScaledSum, account.scaledBalance, nScaledSum)) {
            return vstate.Invalid(error("%s: account %s out of range: %s", __func__, entry.first, account.ToString()),
                                  PoolError::INVARIANT_VIOLATION, "bad-account-invariant");
        }
    }

    if (nScaledSum != state.accumulatedScaledBalance) {
        return vstate.Invalid(error("%s: accumulatedScaledBalance %s != sum of scaled balances %s", __func__,
                                    FormatMoney(state.accumulatedScaledBalance), FormatMoney(nScaledSum)),
                              PoolError::INVARIANT_VIOLATION, "bad-scaled-sum");
    }

    // User shares are not debited by the treasury skim, so the share backing
    // is checked through the claims rather than against the shares field
    CAmount nClaimSum = 0;
    for (const auto& entry : mapAccounts) {
        CAmount nClaim = 0;
        if (!CalculateClaim(entry.second.scaledBalance, state.poolValue, state.accumulatedScaledBalance, nClaim) ||
            !pool_math::CheckedAdd(nClaimSum, nClaim, nClaimSum)) {
            return vstate.Invalid(error("%s: claim of %s not computable", __func__, entry.first),
                                  PoolError::INVARIANT_VIOLATION, "bad-account-invariant");
        }
    }
    if (nClaimSum > state.poolValue) {
        return vstate.Invalid(error("%s: claims %s exceed poolValue %s", __func__, FormatMoney(nClaimSum), FormatMoney(state.poolValue)),
                              PoolError::INVARIANT_VIOLATION, "bad-claim-sum");
    }
    if (oracle.GetValue(state.totalShares) == state.poolValue) {
        const CAmount nBacking = oracle.GetShares(nClaimSum);
        if (nBacking > state.totalShares) {
            return vstate.Invalid(error("%s: claims need %s shares, pool holds %s for its users", __func__,
                                        FormatMoney(nBacking), FormatMoney(state.totalShares)),
                                  PoolError::INVARIANT_VIOLATION, "bad-share-backing");
        }
    }
    return true;
}

void CStakePool::RegisterListener(CPoolEventListener* listener)
{
    LOCK(cs_pool);
    vListeners.push_back(listener);
}

void CStakePool::UnregisterListener(CPoolEventListener* listener)
{
    LOCK(cs_pool);
    vListeners.erase(std::remove(vListeners.begin(), vListeners.end(), listener), vListeners.end());
}
