// Copyright (c) 2025 The StakePool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpc/server.h"

#include "logging.h"
#include "utilmoneystr.h"

#include <stdexcept>

void JSONRPCRequest::parse(const UniValue& valRequest)
{
    // Parse request
    if (!valRequest.isObject())
        throw JSONRPCError(RPC_INVALID_REQUEST, "Invalid Request object");
    const UniValue& request = valRequest.get_obj();

    // Parse id now so errors from here on will have the id
    id = find_value(request, "id");

    // Parse method
    UniValue valMethod = find_value(request, "method");
    if (valMethod.isNull())
        throw JSONRPCError(RPC_INVALID_REQUEST, "Missing method");
    if (!valMethod.isStr())
        throw JSONRPCError(RPC_INVALID_REQUEST, "Method must be a string");
    strMethod = valMethod.get_str();
    LogPrint(BCLog::RPC, "ThreadRPCServer method=%s\n", strMethod);

    // Parse params
    UniValue valParams = find_value(request, "params");
    if (valParams.isArray())
        params = valParams.get_array();
    else if (valParams.isNull())
        params = UniValue(UniValue::VARR);
    else
        throw JSONRPCError(RPC_INVALID_REQUEST, "Params must be an array");
}

CPoolRPCTable::CPoolRPCTable()
{
}

const CRPCCommand* CPoolRPCTable::operator[](const std::string& name) const
{
    std::map<std::string, const CRPCCommand*>::const_iterator it = mapCommands.find(name);
    if (it == mapCommands.end())
        return nullptr;
    return (*it).second;
}

bool CPoolRPCTable::appendCommand(const std::string& name, const CRPCCommand* pcmd)
{
    std::map<std::string, const CRPCCommand*>::const_iterator it = mapCommands.find(name);
    if (it != mapCommands.end())
        return false;

    mapCommands[name] = pcmd;
    return true;
}

std::string CPoolRPCTable::help(const std::string& strCommand) const
{
    std::string strRet;
    std::string category;

    for (const auto& entry : mapCommands) {
        const CRPCCommand* pcmd = entry.second;
        if (!strCommand.empty() && pcmd->name != strCommand)
            continue;
        JSONRPCRequest jreq;
        jreq.fHelp = true;
        try {
            pcmd->actor(jreq);
        } catch (const std::exception& e) {
            // Help text is returned in an exception
            std::string strHelp = std::string(e.what());
            if (strCommand.empty()) {
                if (strHelp.find('\n') != std::string::npos)
                    strHelp = strHelp.substr(0, strHelp.find('\n'));

                if (category != pcmd->category) {
                    if (!category.empty())
                        strRet += "\n";
                    category = pcmd->category;
                    strRet += "== " + category + " ==\n";
                }
            }
            strRet += strHelp + "\n";
        }
    }
    if (strRet.empty())
        strRet = strprintf("help: unknown command: %s\n", strCommand);
    strRet = strRet.substr(0, strRet.size() - 1);
    return strRet;
}

UniValue CPoolRPCTable::execute(const JSONRPCRequest& request) const
{
    // Find method
    const CRPCCommand* pcmd = (*this)[request.strMethod];
    if (!pcmd)
        throw JSONRPCError(RPC_METHOD_NOT_FOUND, "Method not found");
    if (!request.context && !request.fHelp)
        throw JSONRPCError(RPC_INTERNAL_ERROR, "No pool attached");

    try {
        // Execute
        return pcmd->actor(request);
    } catch (const std::exception& e) {
        throw JSONRPCError(RPC_MISC_ERROR, e.what());
    }
}

std::vector<std::string> CPoolRPCTable::listCommands() const
{
    std::vector<std::string> commandList;
    for (const auto& entry : mapCommands) {
        commandList.push_back(entry.first);
    }
    return commandList;
}

void RPCTypeCheckArgument(const UniValue& value, UniValue::VType typeExpected)
{
    if (value.type() != typeExpected) {
        throw JSONRPCError(RPC_TYPE_ERROR, strprintf("Expected type %s, got %s", uvTypeName(typeExpected), uvTypeName(value.type())));
    }
}

CAmount AmountFromValue(const UniValue& value)
{
    if (!value.isNum() && !value.isStr())
        throw JSONRPCError(RPC_TYPE_ERROR, "Amount is not a number or string");
    CAmount amount;
    if (!ParseMoney(value.getValStr(), amount))
        throw JSONRPCError(RPC_TYPE_ERROR, "Invalid amount");
    return amount;
}

UniValue ValueFromAmount(const CAmount& amount)
{
    bool sign = amount < 0;
    int64_t n_abs = (sign ? -amount : amount);
    int64_t quotient = n_abs / COIN;
    int64_t remainder = n_abs % COIN;
    return UniValue(UniValue::VNUM,
            strprintf("%s%d.%08d", sign ? "-" : "", quotient, remainder));
}

std::string HelpExampleCli(const std::string& methodname, const std::string& args)
{
    return "> echo '{\"method\":\"" + methodname + "\",\"params\":[" + args + "],\"id\":1}' | stakepoold\n";
}

UniValue ExecuteRequestLine(const CPoolRPCTable& table, PoolRPCContext& context, const std::string& strLine)
{
    JSONRPCRequest jreq;
    jreq.context = &context;
    try {
        UniValue valRequest;
        if (!valRequest.read(strLine))
            throw JSONRPCError(RPC_PARSE_ERROR, "Parse error");

        jreq.parse(valRequest);
        if (jreq.strMethod == "help") {
            std::string strCommand;
            if (jreq.params.size() > 0)
                strCommand = jreq.params[0].get_str();
            return JSONRPCReplyObj(table.help(strCommand), NullUniValue, jreq.id);
        }
        UniValue result = table.execute(jreq);
        return JSONRPCReplyObj(result, NullUniValue, jreq.id);
    } catch (const UniValue& objError) {
        return JSONRPCReplyObj(NullUniValue, objError, jreq.id);
    } catch (const std::exception& e) {
        return JSONRPCReplyObj(NullUniValue, JSONRPCError(RPC_PARSE_ERROR, e.what()), jreq.id);
    }
}
