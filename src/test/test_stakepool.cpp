// Copyright (c) 2025 The StakePool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test/test_stakepool.h"

#include "logging.h"
#include "util/system.h"
#include "util/time.h"

#include <stdexcept>

#include <boost/test/unit_test.hpp>

BasicTestingSetup::BasicTestingSetup(const std::string& network)
{
    m_path_root = fs::temp_directory_path() / "test_stakepool" / fs::unique_path("%%%%-%%%%-%%%%-%%%%");
    fs::create_directories(m_path_root);

    LogInstance().m_print_to_console = false;
    LogInstance().m_print_to_file = false;
    LogInstance().StartLogging();

    SetMockTime(TEST_MOCK_TIME);
    SelectPoolParams(network);
    gArgs.ClearArgs();
    gArgs.ForceSetArg("-datadir", m_path_root.string());
    gArgs.ForceSetArg("-network", network);
}

BasicTestingSetup::~BasicTestingSetup()
{
    LogInstance().DisconnectTestLogger();
    SetMockTime(0);
    gArgs.ClearArgs();
    fs::remove_all(m_path_root);
}

size_t CRecordingListener::Count(PoolEventType type) const
{
    size_t n = 0;
    for (const CPoolEvent& event : events) {
        if (event.type == type) ++n;
    }
    return n;
}

const CPoolEvent& CRecordingListener::Last(PoolEventType type) const
{
    for (auto it = events.rbegin(); it != events.rend(); ++it) {
        if (it->type == type) return *it;
    }
    throw std::runtime_error("no event of type " + PoolEventTypeName(type));
}

const CAmount PoolTestingSetup::TEST_DEPOSIT_CAP;

PoolTestingSetup::PoolTestingSetup()
{
    CInMemoryVault* plain = new CInMemoryVault();
    ResetPool(plain);
}

PoolTestingSetup::~PoolTestingSetup()
{
    if (pool) pool->UnregisterListener(&listener);
    pool.reset();
}

void PoolTestingSetup::ResetPool(CInMemoryVault* vaultIn)
{
    if (pool) pool->UnregisterListener(&listener);
    pool.reset();
    vault.reset(vaultIn);
    vault->SetHolder(PoolParams().PoolAddress());

    pool.reset(new CStakePool(*vault, PoolParams().PoolAddress()));
    CPoolValidationState vstate;
    BOOST_REQUIRE_MESSAGE(pool->Init(TEST_DEPOSIT_CAP, "admin", "pauser", vstate), vstate.ToString());
    pool->RegisterListener(&listener);
    listener.events.clear();
}

CAmount PoolTestingSetup::FundAndDeposit(const std::string& strAccount, CAmount nValue)
{
    BOOST_REQUIRE(vault->Mint(strAccount, nValue) > 0);
    CAmount nCredited = 0;
    CPoolValidationState vstate;
    BOOST_REQUIRE_MESSAGE(pool->Deposit(strAccount, nValue, nCredited, vstate), vstate.ToString());
    return nCredited;
}

CAmount PoolTestingSetup::ClaimOf(const std::string& strAccount) const
{
    CAmount nClaim = 0;
    BOOST_REQUIRE(pool->GetClaim(strAccount, nClaim));
    return nClaim;
}
