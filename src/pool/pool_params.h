// Copyright (c) 2025 The StakePool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEPOOL_POOL_PARAMS_H
#define STAKEPOOL_POOL_PARAMS_H

#include "amount.h"

#include <memory>
#include <stdint.h>
#include <string>

/**
 * CPoolParams defines the deployment parameters of a pool on a given
 * network (main, test or regtest).
 */
class CPoolParams
{
public:
    static const std::string MAIN;
    static const std::string TESTNET;
    static const std::string REGTEST;

    const std::string& NetworkIDString() const { return strNetworkID; }
    /** Deposit cap a freshly created pool starts with */
    CAmount DefaultDepositCap() const { return nDefaultDepositCap; }
    /** Address granted the ADMIN role on a fresh database */
    const std::string& DefaultAdmin() const { return strDefaultAdmin; }
    /** Address granted the PAUSER role on a fresh database */
    const std::string& DefaultPauser() const { return strDefaultPauser; }
    /** Address under which the pool holds its shares in the vault */
    const std::string& PoolAddress() const { return strPoolAddress; }
    /** Default LevelDB cache in MiB */
    int64_t DefaultDBCache() const { return nDefaultDBCache; }

protected:
    CPoolParams() {}

    std::string strNetworkID;
    CAmount nDefaultDepositCap{0};
    std::string strDefaultAdmin;
    std::string strDefaultPauser;
    std::string strPoolAddress;
    int64_t nDefaultDBCache{0};
};

/**
 * Creates and returns a std::unique_ptr<CPoolParams> of the chosen network.
 * @throws std::runtime_error if the network is not supported.
 */
std::unique_ptr<const CPoolParams> CreatePoolParams(const std::string& network);

/**
 * Return the currently selected parameters. This won't change after app
 * startup, except for unit tests.
 */
const CPoolParams& PoolParams();

/** Sets the params returned by PoolParams() to those for the given network. */
void SelectPoolParams(const std::string& network);

#endif // STAKEPOOL_POOL_PARAMS_H
