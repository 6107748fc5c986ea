// Copyright (c) 2025 The StakePool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEPOOL_RPC_POOL_H
#define STAKEPOOL_RPC_POOL_H

#include <univalue.h>

struct CPoolEvent;
class CPoolValidationState;
struct PoolState;
struct UserAccount;

UniValue PoolStateToJSON(const PoolState& state);
UniValue UserAccountToJSON(const UserAccount& account);
UniValue PoolEventToJSON(const CPoolEvent& event);

/** Map a failed pool operation to a JSON error object (for throwing) */
UniValue PoolStateError(const CPoolValidationState& vstate);

#endif // STAKEPOOL_RPC_POOL_H
