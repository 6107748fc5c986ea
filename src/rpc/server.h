// Copyright (c) 2025 The StakePool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEPOOL_RPC_SERVER_H
#define STAKEPOOL_RPC_SERVER_H

#include "amount.h"
#include "rpc/protocol.h"

#include <map>
#include <string>
#include <vector>

#include <univalue.h>

class CInMemoryVault;
class CStakePool;

/** Objects the commands operate on, owned by the caller of execute() */
struct PoolRPCContext
{
    CStakePool* pool{nullptr};
    CInMemoryVault* vault{nullptr};
};

class JSONRPCRequest
{
public:
    UniValue id;
    std::string strMethod;
    UniValue params;
    bool fHelp;
    PoolRPCContext* context;

    JSONRPCRequest() : id(NullUniValue), params(NullUniValue), fHelp(false), context(nullptr) {}

    /** Fill from a request object; throws a JSON error object when malformed */
    void parse(const UniValue& valRequest);
};

typedef UniValue(*rpcfn_type)(const JSONRPCRequest& jsonRequest);

class CRPCCommand
{
public:
    std::string category;
    std::string name;
    rpcfn_type actor;
    bool okSafeMode;
    std::vector<std::string> argNames;
};

/**
 * Pool command dispatcher
 */
class CPoolRPCTable
{
private:
    std::map<std::string, const CRPCCommand*> mapCommands;

public:
    CPoolRPCTable();
    const CRPCCommand* operator[](const std::string& name) const;
    std::string help(const std::string& name) const;

    /**
     * Execute a method.
     * @param request The JSONRPCRequest to execute
     * @returns Result of the call.
     * @throws an exception (UniValue) when an error happens.
     */
    UniValue execute(const JSONRPCRequest& request) const;

    /**
     * Returns a list of registered commands
     * @returns List of registered commands.
     */
    std::vector<std::string> listCommands() const;

    /**
     * Appends a CRPCCommand to the dispatch table.
     * Returns false if a command with the same name is already registered.
     */
    bool appendCommand(const std::string& name, const CRPCCommand* pcmd);
};

/** Register the pool and vault commands on t */
void RegisterPoolRPCCommands(CPoolRPCTable& t);

/**
 * Type-check arguments; throws JSONRPCError if wrong type given.
 */
void RPCTypeCheckArgument(const UniValue& value, UniValue::VType typeExpected);

CAmount AmountFromValue(const UniValue& value);
UniValue ValueFromAmount(const CAmount& amount);
std::string HelpExampleCli(const std::string& methodname, const std::string& args);

/** Run one request and build its reply object; never throws */
UniValue ExecuteRequestLine(const CPoolRPCTable& table, PoolRPCContext& context, const std::string& strLine);

#endif // STAKEPOOL_RPC_SERVER_H
