// Copyright (c) 2025 The StakePool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEPOOL_POOL_LEDGER_H
#define STAKEPOOL_POOL_LEDGER_H

#include "amount.h"
#include "pool/pool_admin.h"
#include "pool/pool_errors.h"
#include "pool/pool_events.h"
#include "pool/pool_state.h"
#include "sync.h"

#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

class CPoolStateDB;
class CRateOracle;

/**
 * CStakePool - Staking pool ledger
 *
 * Owns the PoolState, the account store and the role membership of one pool,
 * and drives the rate oracle. Every public operation:
 *
 * 1. takes cs_pool and rejects nested calls made from inside an oracle call
 * 2. checks its preconditions
 * 3. runs reward assignment (deposit and withdrawal only)
 * 4. applies its arithmetic to a copy of the state
 * 5. writes the final state as one DB batch, then commits it in memory
 * 6. performs the external share transfer; on failure the pre-operation
 *    snapshot is restored in memory and written back to the DB
 * 7. emits its events
 *
 * An operation therefore either fully commits or leaves no trace.
 */
class CStakePool
{
private:
    mutable RecursiveMutex cs_pool;

    CRateOracle& oracle;
    const std::string strPoolAddress;
    CPoolStateDB* pdb; // not owned, may be null

    PoolState state;                                // GUARDED_BY(cs_pool)
    std::map<std::string, UserAccount> mapAccounts; // GUARDED_BY(cs_pool)
    CPoolRoles roles;                               // GUARDED_BY(cs_pool)
    std::vector<CPoolEventListener*> vListeners;    // GUARDED_BY(cs_pool)

    //! set while an operation is in progress, including its oracle calls
    bool fEntered{false}; // GUARDED_BY(cs_pool)

    class EntryGuard
    {
    private:
        bool& fFlag;

    public:
        explicit EntryGuard(bool& fFlagIn) : fFlag(fFlagIn) { fFlag = true; }
        ~EntryGuard() { fFlag = false; }
    };

    struct AccountSnapshot
    {
        std::string strAddress;
        bool fExisted{false};
        UserAccount account;
    };

    bool CheckNotEntered(const char* pszOperation, CPoolValidationState& vstate) const;
    bool RequireRole(PoolRole role, const std::string& strCaller, const char* pszOperation, CPoolValidationState& vstate) const;
    UserAccount LookupAccount(const std::string& strAddress) const;
    AccountSnapshot TakeSnapshot(const std::string& strAddress) const;
    void RestoreSnapshot(const AccountSnapshot& snapshot);

    /** Run reward assignment on next, queueing its event */
    bool RunRewards(PoolState& next, std::vector<CPoolEvent>& events, CPoolValidationState& vstate) const;
    /** Write stateIn and the given accounts as one batch (no-op without a DB) */
    bool Persist(const PoolState& stateIn, const std::vector<std::pair<std::string, UserAccount>>& accounts,
                 CPoolValidationState& vstate);
    /** Undo a committed operation whose transfer failed, in memory and on disk */
    void RollBack(const PoolState& snapshot, const AccountSnapshot* pAccountSnapshot);
    void Emit(const std::vector<CPoolEvent>& events);
    /** The vault must hold exactly the shares the books say the pool owns */
    bool CheckHoldings(CPoolValidationState& vstate) const;

public:
    /**
     * @param oracleIn          Asset vault / rate oracle the pool holds shares in
     * @param strPoolAddressIn  Address under which the pool holds shares
     * @param pdbIn             Optional persistence, must outlive the pool
     */
    CStakePool(CRateOracle& oracleIn, const std::string& strPoolAddressIn, CPoolStateDB* pdbIn = nullptr);

    CStakePool(const CStakePool&) = delete;
    CStakePool& operator=(const CStakePool&) = delete;

    /**
     * Init - Load the pool from its DB, or create a fresh one
     *
     * A fresh pool starts with all counters zero, the given deposit cap and
     * the given ADMIN / PAUSER members. A stored pool whose invariants fail,
     * or whose shares the oracle does not hold, is refused.
     */
    bool Init(CAmount nDefaultCap, const std::string& strAdmin, const std::string& strPauser, CPoolValidationState& vstate);

    /** Skim positive yield into treasury shares (not while paused) */
    bool AssignRewards(CPoolValidationState& vstate);

    /**
     * Deposit - Pull shares worth nAmount from strAccount into the pool
     *
     * @param[out] nCredited value actually credited (finalAmount)
     */
    bool Deposit(const std::string& strAccount, CAmount nAmount, CAmount& nCredited, CPoolValidationState& vstate);

    /**
     * Withdraw - Send shares worth nAmount back to strAccount
     *
     * @param[out] nWithdrawn value actually withdrawn (finalAmount)
     */
    bool Withdraw(const std::string& strAccount, CAmount nAmount, CAmount& nWithdrawn, CPoolValidationState& vstate);

    /**
     * EmergencyWithdraw - Full exit of strAccount while the pool is paused
     *
     * @param[out] nWithdrawn value of the shares actually sent
     */
    bool EmergencyWithdraw(const std::string& strAccount, CAmount& nWithdrawn, CPoolValidationState& vstate);

    bool SetDepositCap(const std::string& strCaller, CAmount nNewCap, CPoolValidationState& vstate);
    bool Pause(const std::string& strCaller, CPoolValidationState& vstate);
    bool Unpause(const std::string& strCaller, CPoolValidationState& vstate);

    /** Send treasury shares worth nAmount to strDestination */
    bool AdminWithdraw(const std::string& strCaller, CAmount nAmount, const std::string& strDestination,
                       CPoolValidationState& vstate);

    bool GrantRole(const std::string& strCaller, PoolRole role, const std::string& strAccount, CPoolValidationState& vstate);
    /** Revoking the last ADMIN is rejected */
    bool RevokeRole(const std::string& strCaller, PoolRole role, const std::string& strAccount, CPoolValidationState& vstate);

    PoolState GetState() const;
    /** Zeroed account if strAddress never deposited */
    UserAccount GetAccount(const std::string& strAddress) const;
    bool HasAccount(const std::string& strAddress) const;
    std::map<std::string, UserAccount> GetAccounts() const;

    /** Value units strAddress could withdraw at the last synchronized poolValue */
    bool GetClaim(const std::string& strAddress, CAmount& nClaim) const;

    bool HasRole(PoolRole role, const std::string& strAddress) const;
    std::set<std::string> GetRoleMembers(PoolRole role) const;

    const std::string& GetPoolAddress() const { return strPoolAddress; }

    /**
     * CheckInvariants - Verify the state rules and the account store
     *
     * - accumulatedScaledBalance equals the sum of all scaled balances
     * - the claims of all accounts add up to at most poolValue
     * - when poolValue is synchronized with the oracle, the shares needed to
     *   pay every claim fit within totalShares
     */
    bool CheckInvariants(CPoolValidationState& vstate) const;

    void RegisterListener(CPoolEventListener* listener);
    void UnregisterListener(CPoolEventListener* listener);
};

#endif // STAKEPOOL_POOL_LEDGER_H
