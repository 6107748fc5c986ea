// Copyright (c) 2025 The StakePool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pool/pool_admin.h"

#include "logging.h"
#include "pool/pool_errors.h"
#include "pool/pool_math.h"
#include "pool/pool_oracle.h"
#include "pool/pool_state.h"
#include "utilmoneystr.h"

std::string PoolRoleName(PoolRole role)
{
    switch (role) {
    case PoolRole::ADMIN: return "admin";
    case PoolRole::PAUSER: return "pauser";
    }
    return "unknown";
}

bool ParsePoolRole(const std::string& str, PoolRole& role)
{
    if (str == "admin") {
        role = PoolRole::ADMIN;
        return true;
    }
    if (str == "pauser") {
        role = PoolRole::PAUSER;
        return true;
    }
    return false;
}

bool CPoolRoles::HasRole(PoolRole role, const std::string& strAccount) const
{
    auto it = mapMembers.find(role);
    return it != mapMembers.end() && it->second.count(strAccount) > 0;
}

bool CPoolRoles::Grant(PoolRole role, const std::string& strAccount)
{
    return mapMembers[role].insert(strAccount).second;
}

bool CPoolRoles::Revoke(PoolRole role, const std::string& strAccount)
{
    auto it = mapMembers.find(role);
    if (it == mapMembers.end()) return false;
    return it->second.erase(strAccount) > 0;
}

size_t CPoolRoles::CountMembers(PoolRole role) const
{
    auto it = mapMembers.find(role);
    return it == mapMembers.end() ? 0 : it->second.size();
}

std::set<std::string> CPoolRoles::GetMembers(PoolRole role) const
{
    auto it = mapMembers.find(role);
    return it == mapMembers.end() ? std::set<std::string>() : it->second;
}

bool CheckSetDepositCap(const PoolState& state, CAmount nNewCap, CPoolValidationState& vstate)
{
    if (nNewCap <= 0) {
        return vstate.Invalid(PoolError::ZERO_AMOUNT, "bad-cap-zero-amount");
    }
    if (!MoneyRange(nNewCap)) {
        return vstate.Invalid(PoolError::OVERFLOW, "bad-cap-range", strprintf("cap %d out of range", nNewCap));
    }
    if (nNewCap < state.poolValue) {
        return vstate.Invalid(PoolError::CAP_BELOW_POOL_VALUE, "bad-cap-below-pool-value",
                              strprintf("cap %s < poolValue %s", FormatMoney(nNewCap), FormatMoney(state.poolValue)));
    }
    return true;
}

bool CheckPoolPause(const PoolState& state, bool fPause, CPoolValidationState& vstate)
{
    if (fPause && state.fPaused) {
        return vstate.Invalid(PoolError::PAUSED, "bad-pause-already-paused");
    }
    if (!fPause && !state.fPaused) {
        return vstate.Invalid(PoolError::NOT_PAUSED, "bad-unpause-not-paused");
    }
    return true;
}

bool ApplyAdminWithdraw(PoolState& state, const CRateOracle& oracle, CAmount nAmount, const std::string& strDestination,
                        PoolAdminWithdrawResult& result, CPoolValidationState& vstate)
{
    result = PoolAdminWithdrawResult();

    if (strDestination.empty()) {
        return vstate.Invalid(PoolError::ZERO_ADDRESS, "bad-adminwithdraw-zero-address");
    }
    if (nAmount <= 0) {
        return vstate.Invalid(PoolError::ZERO_AMOUNT, "bad-adminwithdraw-zero-amount");
    }
    if (!MoneyRange(nAmount)) {
        return vstate.Invalid(PoolError::OVERFLOW, "bad-adminwithdraw-amount-range",
                              strprintf("amount %d out of range", nAmount));
    }

    const CAmount nShares = oracle.GetShares(nAmount);
    CAmount nNewTreasury = 0;
    if (!pool_math::CheckedSub(state.treasuryShares, nShares, nNewTreasury)) {
        return vstate.Invalid(PoolError::INSUFFICIENT_SHARES, "bad-adminwithdraw-insufficient-shares",
                              strprintf("need %s shares, treasury holds %s", FormatMoney(nShares),
                                        FormatMoney(state.treasuryShares)));
    }
    if (nShares == 0) {
        return vstate.Invalid(PoolError::TRANSFER_FAILED, "bad-adminwithdraw-zero-shares",
                              strprintf("%s converts to no shares", FormatMoney(nAmount)));
    }

    state.treasuryShares = nNewTreasury;
    result.nShares = nShares;
    return true;
}
