// Copyright (c) 2025 The StakePool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEPOOL_RPC_PROTOCOL_H
#define STAKEPOOL_RPC_PROTOCOL_H

#include <string>

#include <univalue.h>

//! Error codes returned in the "code" field of a JSON error object
enum RPCErrorCode {
    //! Standard JSON-RPC 2.0 errors
    RPC_INVALID_REQUEST  = -32600,
    RPC_METHOD_NOT_FOUND = -32601,
    RPC_INVALID_PARAMS   = -32602,
    RPC_INTERNAL_ERROR   = -32603,
    RPC_PARSE_ERROR      = -32700,

    //! General application defined errors
    RPC_MISC_ERROR        = -1,  //!< std::exception thrown in command handling
    RPC_TYPE_ERROR        = -3,  //!< Unexpected type was passed as parameter
    RPC_INVALID_PARAMETER = -8,  //!< Invalid, missing or duplicate parameter
    RPC_DATABASE_ERROR    = -20, //!< Database error

    //! Pool errors
    RPC_POOL_REJECTED     = -26, //!< Operation rejected by the pool (input, capacity, insufficiency)
    RPC_POOL_PAUSED       = -27, //!< Operation not allowed in the current operating mode
    RPC_POOL_UNAUTHORIZED = -28, //!< Caller does not hold the required role
    RPC_POOL_TRANSFER     = -29, //!< The asset vault refused the share transfer
    RPC_POOL_INTERNAL     = -30, //!< Invariant violation, overflow or nested call
};

UniValue JSONRPCRequestObj(const std::string& strMethod, const UniValue& params, const UniValue& id);
UniValue JSONRPCReplyObj(const UniValue& result, const UniValue& error, const UniValue& id);
std::string JSONRPCReply(const UniValue& result, const UniValue& error, const UniValue& id);
UniValue JSONRPCError(int code, const std::string& message);

#endif // STAKEPOOL_RPC_PROTOCOL_H
