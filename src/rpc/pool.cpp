// Copyright (c) 2025 The StakePool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpc/pool.h"

#include "logging.h"
#include "pool/pool_admin.h"
#include "pool/pool_errors.h"
#include "pool/pool_events.h"
#include "pool/pool_ledger.h"
#include "pool/pool_state.h"
#include "pool/pool_vault.h"
#include "rpc/server.h"

#include <stdexcept>

UniValue PoolStateToJSON(const PoolState& state)
{
    UniValue result(UniValue::VOBJ);
    result.pushKV("totalShares", ValueFromAmount(state.totalShares));
    result.pushKV("treasuryShares", ValueFromAmount(state.treasuryShares));
    result.pushKV("poolValue", ValueFromAmount(state.poolValue));
    result.pushKV("accumulatedScaledBalance", ValueFromAmount(state.accumulatedScaledBalance));
    result.pushKV("lastRewardTimestamp", state.lastRewardTimestamp);
    result.pushKV("maxTotalDeposit", ValueFromAmount(state.maxTotalDeposit));
    result.pushKV("paused", state.fPaused);
    return result;
}

UniValue UserAccountToJSON(const UserAccount& account)
{
    UniValue result(UniValue::VOBJ);
    result.pushKV("scaledBalance", ValueFromAmount(account.scaledBalance));
    result.pushKV("shares", ValueFromAmount(account.shares));
    return result;
}

UniValue PoolEventToJSON(const CPoolEvent& event)
{
    UniValue result(UniValue::VOBJ);
    result.pushKV("event", PoolEventTypeName(event.type));
    switch (event.type) {
    case PoolEventType::DEPOSITED:
    case PoolEventType::WITHDRAWN:
    case PoolEventType::EMERGENCY_WITHDRAWN:
        result.pushKV("account", event.strAccount);
        result.pushKV("amount", ValueFromAmount(event.nAmount));
        result.pushKV("shares", ValueFromAmount(event.nShares));
        break;
    case PoolEventType::TREASURY_WITHDRAWN:
        result.pushKV("destination", event.strAccount);
        result.pushKV("amount", ValueFromAmount(event.nAmount));
        result.pushKV("shares", ValueFromAmount(event.nShares));
        break;
    case PoolEventType::REWARDS_ASSIGNED:
        result.pushKV("shares", ValueFromAmount(event.nShares));
        result.pushKV("totalShares", ValueFromAmount(event.nTotalShares));
        result.pushKV("time", event.nTime);
        break;
    case PoolEventType::DEPOSIT_CAP_UPDATED:
        result.pushKV("oldCap", ValueFromAmount(event.nOldCap));
        result.pushKV("newCap", ValueFromAmount(event.nNewCap));
        break;
    case PoolEventType::PAUSED:
    case PoolEventType::UNPAUSED:
        result.pushKV("caller", event.strAccount);
        break;
    }
    return result;
}

UniValue PoolStateError(const CPoolValidationState& vstate)
{
    int code = RPC_POOL_REJECTED;
    switch (vstate.GetError()) {
    case PoolError::PAUSED:
    case PoolError::NOT_PAUSED:
        code = RPC_POOL_PAUSED;
        break;
    case PoolError::UNAUTHORIZED:
        code = RPC_POOL_UNAUTHORIZED;
        break;
    case PoolError::DEPOSIT_FAILED:
    case PoolError::TRANSFER_FAILED:
        code = RPC_POOL_TRANSFER;
        break;
    case PoolError::REENTRANCY:
    case PoolError::INVARIANT_VIOLATION:
    case PoolError::OVERFLOW:
        code = RPC_POOL_INTERNAL;
        break;
    case PoolError::DB_ERROR:
        code = RPC_DATABASE_ERROR;
        break;
    default:
        break;
    }
    return JSONRPCError(code, vstate.ToString());
}

static CStakePool& EnsurePool(const JSONRPCRequest& request)
{
    if (!request.context || !request.context->pool) {
        throw JSONRPCError(RPC_INTERNAL_ERROR, "Pool not initialized");
    }
    return *request.context->pool;
}

static CInMemoryVault& EnsureVault(const JSONRPCRequest& request)
{
    if (!request.context || !request.context->vault) {
        throw JSONRPCError(RPC_INTERNAL_ERROR, "Vault commands are not available");
    }
    return *request.context->vault;
}

static std::string AddressFromValue(const UniValue& value)
{
    RPCTypeCheckArgument(value, UniValue::VSTR);
    return value.get_str();
}

static PoolRole RoleFromValue(const UniValue& value)
{
    PoolRole role;
    RPCTypeCheckArgument(value, UniValue::VSTR);
    if (!ParsePoolRole(value.get_str(), role)) {
        throw JSONRPCError(RPC_INVALID_PARAMETER, "Unknown role (expected admin or pauser): " + value.get_str());
    }
    return role;
}

static UniValue getpoolstate(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 0) {
        throw std::runtime_error(
            "getpoolstate\n"
            "\nReturns the aggregate state of the pool.\n"
            "\nResult:\n"
            "{\n"
            "  \"totalShares\": x.xxx,              (numeric) Shares owned by depositors\n"
            "  \"treasuryShares\": x.xxx,           (numeric) Shares skimmed from yield\n"
            "  \"poolValue\": x.xxx,                (numeric) Value of totalShares at the last synchronization\n"
            "  \"accumulatedScaledBalance\": x.xxx, (numeric) Sum of all scaled balances\n"
            "  \"lastRewardTimestamp\": n,          (numeric) Time of the last yield skim\n"
            "  \"maxTotalDeposit\": x.xxx,          (numeric) Deposit cap\n"
            "  \"paused\": true|false,              (boolean) Whether only emergency exits are allowed\n"
            "  \"accounts\": n,                     (numeric) Number of accounts\n"
            "  \"invariants_ok\": true|false        (boolean) Whether the ledger invariants hold\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("getpoolstate", "")
        );
    }

    CStakePool& pool = EnsurePool(request);
    UniValue result = PoolStateToJSON(pool.GetState());
    result.pushKV("accounts", (int64_t)pool.GetAccounts().size());
    CPoolValidationState vstate;
    result.pushKV("invariants_ok", pool.CheckInvariants(vstate));
    return result;
}

static UniValue getuseraccount(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "getuseraccount \"address\"\n"
            "\nReturns the account of a participant.\n"
            "\nArguments:\n"
            "1. \"address\"   (string, required) The participant\n"
            "\nResult:\n"
            "{\n"
            "  \"scaledBalance\": x.xxx, (numeric) Claim in scaled units\n"
            "  \"shares\": x.xxx,        (numeric) Share bound of the account\n"
            "  \"claim\": x.xxx          (numeric) Claim in value units\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("getuseraccount", "\"alice\"")
        );
    }

    CStakePool& pool = EnsurePool(request);
    const std::string strAddress = AddressFromValue(request.params[0]);

    CAmount nClaim = 0;
    if (!pool.GetClaim(strAddress, nClaim)) {
        throw JSONRPCError(RPC_POOL_INTERNAL, "Unable to compute claim");
    }
    UniValue result = UserAccountToJSON(pool.GetAccount(strAddress));
    result.pushKV("claim", ValueFromAmount(nClaim));
    return result;
}

static UniValue getclaim(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "getclaim \"address\"\n"
            "\nReturns the value a participant could withdraw at the last synchronized pool value.\n"
            "\nArguments:\n"
            "1. \"address\"   (string, required) The participant\n"
            "\nResult:\n"
            "x.xxx            (numeric) Claim in value units\n"
            "\nExamples:\n"
            + HelpExampleCli("getclaim", "\"alice\"")
        );
    }

    CStakePool& pool = EnsurePool(request);
    CAmount nClaim = 0;
    if (!pool.GetClaim(AddressFromValue(request.params[0]), nClaim)) {
        throw JSONRPCError(RPC_POOL_INTERNAL, "Unable to compute claim");
    }
    return ValueFromAmount(nClaim);
}

static UniValue assignrewards(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 0) {
        throw std::runtime_error(
            "assignrewards\n"
            "\nSkims positive yield accrued since the last synchronization into treasury shares.\n"
            "\nResult: the pool state, as in getpoolstate\n"
            "\nExamples:\n"
            + HelpExampleCli("assignrewards", "")
        );
    }

    CStakePool& pool = EnsurePool(request);
    CPoolValidationState vstate;
    if (!pool.AssignRewards(vstate)) {
        throw PoolStateError(vstate);
    }
    return PoolStateToJSON(pool.GetState());
}

static UniValue deposit(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 2) {
        throw std::runtime_error(
            "deposit \"address\" amount\n"
            "\nPulls shares worth amount from address into the pool.\n"
            "\nArguments:\n"
            "1. \"address\"   (string, required) The depositor\n"
            "2. amount        (numeric, required) Value units to deposit\n"
            "\nResult:\n"
            "x.xxx            (numeric) Value actually credited\n"
            "\nExamples:\n"
            + HelpExampleCli("deposit", "\"alice\", 100")
        );
    }

    CStakePool& pool = EnsurePool(request);
    const std::string strAddress = AddressFromValue(request.params[0]);
    const CAmount nAmount = AmountFromValue(request.params[1]);

    CAmount nCredited = 0;
    CPoolValidationState vstate;
    if (!pool.Deposit(strAddress, nAmount, nCredited, vstate)) {
        throw PoolStateError(vstate);
    }
    return ValueFromAmount(nCredited);
}

static UniValue withdraw(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 2) {
        throw std::runtime_error(
            "withdraw \"address\" amount\n"
            "\nSends shares worth amount from the pool back to address.\n"
            "\nArguments:\n"
            "1. \"address\"   (string, required) The participant\n"
            "2. amount        (numeric, required) Value units to withdraw\n"
            "\nResult:\n"
            "x.xxx            (numeric) Value actually withdrawn\n"
            "\nExamples:\n"
            + HelpExampleCli("withdraw", "\"alice\", 50")
        );
    }

    CStakePool& pool = EnsurePool(request);
    const std::string strAddress = AddressFromValue(request.params[0]);
    const CAmount nAmount = AmountFromValue(request.params[1]);

    CAmount nWithdrawn = 0;
    CPoolValidationState vstate;
    if (!pool.Withdraw(strAddress, nAmount, nWithdrawn, vstate)) {
        throw PoolStateError(vstate);
    }
    return ValueFromAmount(nWithdrawn);
}

static UniValue emergencywithdraw(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "emergencywithdraw \"address\"\n"
            "\nWithdraws the whole claim of address. Only allowed while the pool is paused.\n"
            "\nArguments:\n"
            "1. \"address\"   (string, required) The participant\n"
            "\nResult:\n"
            "x.xxx            (numeric) Value of the shares sent\n"
            "\nExamples:\n"
            + HelpExampleCli("emergencywithdraw", "\"alice\"")
        );
    }

    CStakePool& pool = EnsurePool(request);
    CAmount nWithdrawn = 0;
    CPoolValidationState vstate;
    if (!pool.EmergencyWithdraw(AddressFromValue(request.params[0]), nWithdrawn, vstate)) {
        throw PoolStateError(vstate);
    }
    return ValueFromAmount(nWithdrawn);
}

static UniValue setdepositcap(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 2) {
        throw std::runtime_error(
            "setdepositcap \"caller\" cap\n"
            "\nSets the deposit cap. Requires the admin role.\n"
            "\nArguments:\n"
            "1. \"caller\"    (string, required) Admin address\n"
            "2. cap           (numeric, required) New cap, not below the pool value\n"
            "\nResult:\n"
            "x.xxx            (numeric) The new cap\n"
            "\nExamples:\n"
            + HelpExampleCli("setdepositcap", "\"admin\", 1000000")
        );
    }

    CStakePool& pool = EnsurePool(request);
    const CAmount nCap = AmountFromValue(request.params[1]);
    CPoolValidationState vstate;
    if (!pool.SetDepositCap(AddressFromValue(request.params[0]), nCap, vstate)) {
        throw PoolStateError(vstate);
    }
    return ValueFromAmount(nCap);
}

static UniValue pausepool(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "pause \"caller\"\n"
            "\nSuspends the pool: only emergency exits remain allowed. Requires the pauser role.\n"
            "\nArguments:\n"
            "1. \"caller\"    (string, required) Pauser address\n"
            "\nExamples:\n"
            + HelpExampleCli("pause", "\"pauser\"")
        );
    }

    CStakePool& pool = EnsurePool(request);
    CPoolValidationState vstate;
    if (!pool.Pause(AddressFromValue(request.params[0]), vstate)) {
        throw PoolStateError(vstate);
    }
    return true;
}

static UniValue unpausepool(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "unpause \"caller\"\n"
            "\nResumes normal operation. Requires the pauser role.\n"
            "\nArguments:\n"
            "1. \"caller\"    (string, required) Pauser address\n"
            "\nExamples:\n"
            + HelpExampleCli("unpause", "\"pauser\"")
        );
    }

    CStakePool& pool = EnsurePool(request);
    CPoolValidationState vstate;
    if (!pool.Unpause(AddressFromValue(request.params[0]), vstate)) {
        throw PoolStateError(vstate);
    }
    return true;
}

static UniValue adminwithdraw(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 3) {
        throw std::runtime_error(
            "adminwithdraw \"caller\" amount \"destination\"\n"
            "\nSends treasury shares worth amount to destination. Requires the admin role.\n"
            "\nArguments:\n"
            "1. \"caller\"       (string, required) Admin address\n"
            "2. amount           (numeric, required) Value units to withdraw from the treasury\n"
            "3. \"destination\"  (string, required) Receiver of the shares\n"
            "\nResult:\n"
            "{\n"
            "  \"treasuryShares\": x.xxx  (numeric) Treasury shares left\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("adminwithdraw", "\"admin\", 5, \"operator\"")
        );
    }

    CStakePool& pool = EnsurePool(request);
    const std::string strCaller = AddressFromValue(request.params[0]);
    const CAmount nAmount = AmountFromValue(request.params[1]);
    const std::string strDestination = AddressFromValue(request.params[2]);

    CPoolValidationState vstate;
    if (!pool.AdminWithdraw(strCaller, nAmount, strDestination, vstate)) {
        throw PoolStateError(vstate);
    }
    UniValue result(UniValue::VOBJ);
    result.pushKV("treasuryShares", ValueFromAmount(pool.GetState().treasuryShares));
    return result;
}

static UniValue grantrole(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 3) {
        throw std::runtime_error(
            "grantrole \"caller\" \"role\" \"account\"\n"
            "\nGrants admin or pauser to account. Requires the admin role.\n"
            "\nArguments:\n"
            "1. \"caller\"    (string, required) Admin address\n"
            "2. \"role\"      (string, required) admin or pauser\n"
            "3. \"account\"   (string, required) Receiver of the role\n"
            "\nExamples:\n"
            + HelpExampleCli("grantrole", "\"admin\", \"pauser\", \"bob\"")
        );
    }

    CStakePool& pool = EnsurePool(request);
    const std::string strCaller = AddressFromValue(request.params[0]);
    const PoolRole role = RoleFromValue(request.params[1]);
    CPoolValidationState vstate;
    if (!pool.GrantRole(strCaller, role, AddressFromValue(request.params[2]), vstate)) {
        throw PoolStateError(vstate);
    }
    return true;
}

static UniValue revokerole(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 3) {
        throw std::runtime_error(
            "revokerole \"caller\" \"role\" \"account\"\n"
            "\nRevokes admin or pauser from account. The last admin cannot be revoked.\n"
            "\nArguments:\n"
            "1. \"caller\"    (string, required) Admin address\n"
            "2. \"role\"      (string, required) admin or pauser\n"
            "3. \"account\"   (string, required) Holder of the role\n"
            "\nExamples:\n"
            + HelpExampleCli("revokerole", "\"admin\", \"pauser\", \"bob\"")
        );
    }

    CStakePool& pool = EnsurePool(request);
    const std::string strCaller = AddressFromValue(request.params[0]);
    const PoolRole role = RoleFromValue(request.params[1]);
    CPoolValidationState vstate;
    if (!pool.RevokeRole(strCaller, role, AddressFromValue(request.params[2]), vstate)) {
        throw PoolStateError(vstate);
    }
    return true;
}

static UniValue vaultmint(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 2) {
        throw std::runtime_error(
            "vaultmint \"address\" amount\n"
            "\nStakes amount value units in the vault on behalf of address.\n"
            "\nArguments:\n"
            "1. \"address\"   (string, required) Receiver of the shares\n"
            "2. amount        (numeric, required) Value units to stake\n"
            "\nResult:\n"
            "x.xxx            (numeric) Shares minted\n"
            "\nExamples:\n"
            + HelpExampleCli("vaultmint", "\"alice\", 100")
        );
    }

    CInMemoryVault& vault = EnsureVault(request);
    const std::string strAddress = AddressFromValue(request.params[0]);
    if (request.context->pool && strAddress == request.context->pool->GetPoolAddress()) {
        // Shares the books do not account for would stop the pool from loading
        throw JSONRPCError(RPC_INVALID_PARAMETER, "Cannot mint into the pool's own holdings");
    }
    const CAmount nShares = vault.Mint(strAddress, AmountFromValue(request.params[1]));
    if (nShares == 0) {
        throw JSONRPCError(RPC_INVALID_PARAMETER, "Vault refused to mint");
    }
    return ValueFromAmount(nShares);
}

static UniValue vaultrebase(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "vaultrebase pooledvalue\n"
            "\nSets the vault's total pooled value (yield when larger, loss when smaller).\n"
            "\nArguments:\n"
            "1. pooledvalue   (numeric, required) New total pooled value\n"
            "\nResult:\n"
            "{\n"
            "  \"totalShares\": x.xxx,  (numeric) Shares outstanding in the vault\n"
            "  \"pooledValue\": x.xxx   (numeric) Value backing them\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("vaultrebase", "110")
        );
    }

    CInMemoryVault& vault = EnsureVault(request);
    if (!vault.Rebase(AmountFromValue(request.params[0]))) {
        throw JSONRPCError(RPC_INVALID_PARAMETER, "Vault refused to rebase");
    }
    UniValue result(UniValue::VOBJ);
    result.pushKV("totalShares", ValueFromAmount(vault.GetTotalShares()));
    result.pushKV("pooledValue", ValueFromAmount(vault.GetPooledValue()));
    return result;
}

static UniValue vaultbalance(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "vaultbalance \"address\"\n"
            "\nReturns the vault balance of address.\n"
            "\nArguments:\n"
            "1. \"address\"   (string, required) Holder\n"
            "\nResult:\n"
            "{\n"
            "  \"shares\": x.xxx,  (numeric) Shares held\n"
            "  \"value\": x.xxx    (numeric) Their current value\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("vaultbalance", "\"alice\"")
        );
    }

    CInMemoryVault& vault = EnsureVault(request);
    const CAmount nShares = vault.GetBalance(AddressFromValue(request.params[0]));
    UniValue result(UniValue::VOBJ);
    result.pushKV("shares", ValueFromAmount(nShares));
    result.pushKV("value", ValueFromAmount(vault.GetValue(nShares)));
    return result;
}

static const CRPCCommand commands[] = {
    //  category    name                      actor (function)            okSafe  argNames
    //  ----------- ------------------------  ------------------------    ------  ----------
    { "pool",       "getpoolstate",           &getpoolstate,              true,   {} },
    { "pool",       "getuseraccount",         &getuseraccount,            true,   {"address"} },
    { "pool",       "getclaim",               &getclaim,                  true,   {"address"} },
    { "pool",       "assignrewards",          &assignrewards,             false,  {} },
    { "pool",       "deposit",                &deposit,                   false,  {"address", "amount"} },
    { "pool",       "withdraw",               &withdraw,                  false,  {"address", "amount"} },
    { "pool",       "emergencywithdraw",      &emergencywithdraw,         true,   {"address"} },
    { "admin",      "setdepositcap",          &setdepositcap,             false,  {"caller", "cap"} },
    { "admin",      "pause",                  &pausepool,                 true,   {"caller"} },
    { "admin",      "unpause",                &unpausepool,               true,   {"caller"} },
    { "admin",      "adminwithdraw",          &adminwithdraw,             false,  {"caller", "amount", "destination"} },
    { "admin",      "grantrole",              &grantrole,                 false,  {"caller", "role", "account"} },
    { "admin",      "revokerole",             &revokerole,                false,  {"caller", "role", "account"} },
    { "vault",      "vaultmint",              &vaultmint,                 false,  {"address", "amount"} },
    { "vault",      "vaultrebase",            &vaultrebase,               false,  {"pooledvalue"} },
    { "vault",      "vaultbalance",           &vaultbalance,              true,   {"address"} },
};

void RegisterPoolRPCCommands(CPoolRPCTable& t)
{
    for (const CRPCCommand& command : commands)
        t.appendCommand(command.name, &command);
}
