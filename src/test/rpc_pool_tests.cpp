// Copyright (c) 2025 The StakePool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test/test_stakepool.h"

#include "rpc/pool.h"
#include "rpc/server.h"

#include <string>

#include <boost/test/unit_test.hpp>

#include <univalue.h>

namespace {

struct RPCTestingSetup : public PoolTestingSetup {
    CPoolRPCTable table;
    PoolRPCContext context;

    RPCTestingSetup()
    {
        RegisterPoolRPCCommands(table);
        context.pool = pool.get();
        context.vault = vault.get();
    }

    UniValue Call(const std::string& strLine)
    {
        return ExecuteRequestLine(table, context, strLine);
    }

    /** Run method with params (a JSON array body) and return its result, failing on error */
    UniValue CallOK(const std::string& strMethod, const std::string& strParams = "")
    {
        UniValue reply = Call("{\"method\":\"" + strMethod + "\",\"params\":[" + strParams + "],\"id\":1}");
        const UniValue& error = find_value(reply, "error");
        BOOST_CHECK_MESSAGE(error.isNull(), strMethod << " failed: " << error.write());
        return find_value(reply, "result");
    }

    /** Run method with params and return the error code, zero if it succeeded */
    int CallError(const std::string& strMethod, const std::string& strParams = "")
    {
        UniValue reply = Call("{\"method\":\"" + strMethod + "\",\"params\":[" + strParams + "],\"id\":1}");
        const UniValue& error = find_value(reply, "error");
        if (error.isNull()) return 0;
        BOOST_CHECK(find_value(reply, "result").isNull());
        return find_value(error, "code").get_int();
    }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(rpc_pool_tests, RPCTestingSetup)

BOOST_AUTO_TEST_CASE(rpc_deposit_withdraw)
{
    BOOST_CHECK_EQUAL(CallOK("vaultmint", "\"alice\", 100").getValStr(), "100.00000000");
    BOOST_CHECK_EQUAL(CallOK("deposit", "\"alice\", 100").getValStr(), "100.00000000");

    UniValue state = CallOK("getpoolstate");
    BOOST_CHECK_EQUAL(find_value(state, "poolValue").getValStr(), "100.00000000");
    BOOST_CHECK_EQUAL(find_value(state, "totalShares").getValStr(), "100.00000000");
    BOOST_CHECK_EQUAL(find_value(state, "maxTotalDeposit").getValStr(), "1000000.00000000");
    BOOST_CHECK_EQUAL(find_value(state, "accounts").get_int64(), 1);
    BOOST_CHECK(find_value(state, "invariants_ok").get_bool());
    BOOST_CHECK(!find_value(state, "paused").get_bool());

    BOOST_CHECK_EQUAL(CallOK("withdraw", "\"alice\", 0.5").getValStr(), "0.50000000");
    BOOST_CHECK_EQUAL(CallOK("getclaim", "\"alice\"").getValStr(), "99.50000000");

    UniValue account = CallOK("getuseraccount", "\"alice\"");
    BOOST_CHECK_EQUAL(find_value(account, "scaledBalance").getValStr(), "99.50000000");
    BOOST_CHECK_EQUAL(find_value(account, "shares").getValStr(), "99.50000000");
    BOOST_CHECK_EQUAL(find_value(account, "claim").getValStr(), "99.50000000");

    UniValue balance = CallOK("vaultbalance", "\"alice\"");
    BOOST_CHECK_EQUAL(find_value(balance, "shares").getValStr(), "0.50000000");
    BOOST_CHECK_EQUAL(find_value(balance, "value").getValStr(), "0.50000000");
}

BOOST_AUTO_TEST_CASE(rpc_rewards_and_treasury)
{
    CallOK("vaultmint", "\"alice\", 100");
    CallOK("deposit", "\"alice\", 100");

    UniValue rebased = CallOK("vaultrebase", "110");
    BOOST_CHECK_EQUAL(find_value(rebased, "pooledValue").getValStr(), "110.00000000");

    UniValue state = CallOK("assignrewards");
    BOOST_CHECK_EQUAL(find_value(state, "treasuryShares").getValStr(), "9.09090909");
    BOOST_CHECK_EQUAL(find_value(state, "lastRewardTimestamp").get_int64(), TEST_MOCK_TIME);

    UniValue treasury = CallOK("adminwithdraw", "\"admin\", 5, \"operator\"");
    BOOST_CHECK_EQUAL(find_value(treasury, "treasuryShares").getValStr(), "4.54545455");

    BOOST_CHECK_EQUAL(CallError("adminwithdraw", "\"alice\", 1, \"operator\""), RPC_POOL_UNAUTHORIZED);
    BOOST_CHECK_EQUAL(CallError("adminwithdraw", "\"admin\", 6, \"operator\""), RPC_POOL_REJECTED);
}

BOOST_AUTO_TEST_CASE(rpc_admin_commands)
{
    BOOST_CHECK_EQUAL(CallOK("setdepositcap", "\"admin\", 50").getValStr(), "50.00000000");
    BOOST_CHECK_EQUAL(CallError("setdepositcap", "\"pauser\", 50"), RPC_POOL_UNAUTHORIZED);

    BOOST_CHECK(CallOK("pause", "\"pauser\"").get_bool());
    BOOST_CHECK_EQUAL(CallError("pause", "\"pauser\""), RPC_POOL_PAUSED);
    CallOK("vaultmint", "\"alice\", 10");
    BOOST_CHECK_EQUAL(CallError("deposit", "\"alice\", 10"), RPC_POOL_PAUSED);
    BOOST_CHECK(CallOK("unpause", "\"pauser\"").get_bool());

    BOOST_CHECK(CallOK("grantrole", "\"admin\", \"pauser\", \"bob\"").get_bool());
    BOOST_CHECK(pool->HasRole(PoolRole::PAUSER, "bob"));
    BOOST_CHECK(CallOK("revokerole", "\"admin\", \"pauser\", \"bob\"").get_bool());
    BOOST_CHECK(!pool->HasRole(PoolRole::PAUSER, "bob"));
    BOOST_CHECK_EQUAL(CallError("grantrole", "\"admin\", \"owner\", \"bob\""), RPC_INVALID_PARAMETER);
    BOOST_CHECK_EQUAL(CallError("revokerole", "\"admin\", \"admin\", \"admin\""), RPC_POOL_UNAUTHORIZED);
}

/**
 * Pool rejections map to distinct error codes
 */
BOOST_AUTO_TEST_CASE(rpc_pool_errors)
{
    // No vault balance to pull from
    BOOST_CHECK_EQUAL(CallError("deposit", "\"bob\", 100"), RPC_POOL_TRANSFER);
    BOOST_CHECK_EQUAL(CallError("deposit", "\"bob\", 0"), RPC_POOL_REJECTED);
    BOOST_CHECK_EQUAL(CallError("withdraw", "\"bob\", 1"), RPC_POOL_REJECTED);
    BOOST_CHECK_EQUAL(CallError("emergencywithdraw", "\"bob\""), RPC_POOL_PAUSED);
    BOOST_CHECK_EQUAL(CallError("vaultmint", "\"bob\", 0"), RPC_INVALID_PARAMETER);
    BOOST_CHECK_EQUAL(CallError("vaultmint", "\"stakepool-regtest\", 10"), RPC_INVALID_PARAMETER);
    BOOST_CHECK_EQUAL(CallError("vaultrebase", "100"), RPC_INVALID_PARAMETER);

    UniValue reply = Call("{\"method\":\"deposit\",\"params\":[\"bob\",100],\"id\":1}");
    const std::string strMessage = find_value(find_value(reply, "error"), "message").get_str();
    BOOST_CHECK(strMessage.find("bad-deposit-transfer-failed") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(rpc_request_errors)
{
    UniValue reply = Call("{\"method\":\"nosuchmethod\",\"params\":[],\"id\":7}");
    BOOST_CHECK_EQUAL(find_value(find_value(reply, "error"), "code").get_int(), RPC_METHOD_NOT_FOUND);
    BOOST_CHECK_EQUAL(find_value(reply, "id").get_int(), 7);

    reply = Call("{\"method\":");
    BOOST_CHECK_EQUAL(find_value(find_value(reply, "error"), "code").get_int(), RPC_PARSE_ERROR);

    reply = Call("[1, 2]");
    BOOST_CHECK_EQUAL(find_value(find_value(reply, "error"), "code").get_int(), RPC_INVALID_REQUEST);

    reply = Call("{\"method\":\"getpoolstate\",\"params\":{},\"id\":1}");
    BOOST_CHECK_EQUAL(find_value(find_value(reply, "error"), "code").get_int(), RPC_INVALID_REQUEST);

    // Wrong arity returns the usage text
    BOOST_CHECK_EQUAL(CallError("deposit", "\"alice\""), RPC_MISC_ERROR);
    BOOST_CHECK_EQUAL(CallError("deposit", "1, 100"), RPC_TYPE_ERROR);
    BOOST_CHECK_EQUAL(CallError("deposit", "\"alice\", \"lots\""), RPC_TYPE_ERROR);
    BOOST_CHECK_EQUAL(CallError("deposit", "\"alice\", -1"), RPC_TYPE_ERROR);
}

BOOST_AUTO_TEST_CASE(rpc_help)
{
    UniValue result = CallOK("help");
    BOOST_CHECK(result.get_str().find("== pool ==") != std::string::npos);
    BOOST_CHECK(result.get_str().find("deposit \"address\" amount") != std::string::npos);

    result = CallOK("help", "\"emergencywithdraw\"");
    BOOST_CHECK(result.get_str().find("paused") != std::string::npos);

    BOOST_CHECK_EQUAL(table.listCommands().size(), 16U);
    BOOST_CHECK(table["getpoolstate"] != nullptr);
    BOOST_CHECK(table["stop"] == nullptr);
}

BOOST_AUTO_TEST_CASE(rpc_event_json)
{
    UniValue obj = PoolEventToJSON(CPoolEvent::Deposited("alice", 9999999999, 9090909090));
    BOOST_CHECK_EQUAL(find_value(obj, "event").get_str(), "deposited");
    BOOST_CHECK_EQUAL(find_value(obj, "account").get_str(), "alice");
    BOOST_CHECK_EQUAL(find_value(obj, "amount").getValStr(), "99.99999999");
    BOOST_CHECK_EQUAL(find_value(obj, "shares").getValStr(), "90.90909090");

    obj = PoolEventToJSON(CPoolEvent::RewardsAssigned(909090909, 9090909091, TEST_MOCK_TIME));
    BOOST_CHECK_EQUAL(find_value(obj, "event").get_str(), "rewardsassigned");
    BOOST_CHECK_EQUAL(find_value(obj, "time").get_int64(), TEST_MOCK_TIME);
    BOOST_CHECK(find_value(obj, "account").isNull());

    obj = PoolEventToJSON(CPoolEvent::DepositCapUpdated(COIN, 2 * COIN));
    BOOST_CHECK_EQUAL(find_value(obj, "oldCap").getValStr(), "1.00000000");
    BOOST_CHECK_EQUAL(find_value(obj, "newCap").getValStr(), "2.00000000");
}

BOOST_AUTO_TEST_SUITE_END()
