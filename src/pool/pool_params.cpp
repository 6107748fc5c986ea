// Copyright (c) 2025 The StakePool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pool/pool_params.h"

#include "logging.h"

#include <stdexcept>

const std::string CPoolParams::MAIN = "main";
const std::string CPoolParams::TESTNET = "test";
const std::string CPoolParams::REGTEST = "regtest";

class CMainPoolParams : public CPoolParams
{
public:
    CMainPoolParams()
    {
        strNetworkID = MAIN;
        nDefaultDepositCap = 10000000 * COIN;
        strDefaultAdmin = "admin";
        strDefaultPauser = "pauser";
        strPoolAddress = "stakepool";
        nDefaultDBCache = 16;
    }
};

class CTestNetPoolParams : public CPoolParams
{
public:
    CTestNetPoolParams()
    {
        strNetworkID = TESTNET;
        nDefaultDepositCap = 1000000 * COIN;
        strDefaultAdmin = "admin";
        strDefaultPauser = "pauser";
        strPoolAddress = "stakepool-test";
        nDefaultDBCache = 8;
    }
};

/**
 * Regression test: effectively uncapped so tests pick their own cap.
 */
class CRegTestPoolParams : public CPoolParams
{
public:
    CRegTestPoolParams()
    {
        strNetworkID = REGTEST;
        nDefaultDepositCap = MAX_MONEY;
        strDefaultAdmin = "admin";
        strDefaultPauser = "pauser";
        strPoolAddress = "stakepool-regtest";
        nDefaultDBCache = 2;
    }
};

static std::unique_ptr<const CPoolParams> globalPoolParams;

const CPoolParams& PoolParams()
{
    if (!globalPoolParams) {
        throw std::logic_error("PoolParams(): no network selected");
    }
    return *globalPoolParams;
}

std::unique_ptr<const CPoolParams> CreatePoolParams(const std::string& network)
{
    if (network == CPoolParams::MAIN) {
        return std::unique_ptr<const CPoolParams>(new CMainPoolParams());
    } else if (network == CPoolParams::TESTNET) {
        return std::unique_ptr<const CPoolParams>(new CTestNetPoolParams());
    } else if (network == CPoolParams::REGTEST) {
        return std::unique_ptr<const CPoolParams>(new CRegTestPoolParams());
    }
    throw std::runtime_error(strprintf("%s: Unknown network %s.", __func__, network));
}

void SelectPoolParams(const std::string& network)
{
    globalPoolParams = CreatePoolParams(network);
}
