// Copyright (c) 2025 The StakePool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pool/pool_errors.h"

std::string PoolErrorName(PoolError code)
{
    switch (code) {
    case PoolError::OK: return "OK";
    case PoolError::ZERO_ADDRESS: return "ZERO_ADDRESS";
    case PoolError::ZERO_AMOUNT: return "ZERO_AMOUNT";
    case PoolError::DEPOSIT_CAP_EXCEEDED: return "DEPOSIT_CAP_EXCEEDED";
    case PoolError::INSUFFICIENT_SHARES: return "INSUFFICIENT_SHARES";
    case PoolError::NOT_ENOUGH_BALANCE: return "NOT_ENOUGH_BALANCE";
    case PoolError::NOTHING_TO_WITHDRAW: return "NOTHING_TO_WITHDRAW";
    case PoolError::DEPOSIT_FAILED: return "DEPOSIT_FAILED";
    case PoolError::TRANSFER_FAILED: return "TRANSFER_FAILED";
    case PoolError::CAP_BELOW_POOL_VALUE: return "CAP_BELOW_POOL_VALUE";
    case PoolError::PAUSED: return "PAUSED";
    case PoolError::NOT_PAUSED: return "NOT_PAUSED";
    case PoolError::UNAUTHORIZED: return "UNAUTHORIZED";
    case PoolError::REENTRANCY: return "REENTRANCY";
    case PoolError::INVARIANT_VIOLATION: return "INVARIANT_VIOLATION";
    case PoolError::OVERFLOW: return "OVERFLOW";
    case PoolError::DB_ERROR: return "DB_ERROR";
    } // no default case, so the compiler can warn about missing cases
    return "UNKNOWN";
}

std::string CPoolValidationState::ToString() const
{
    if (IsValid()) {
        return "Valid";
    }
    if (!m_debug_message.empty()) {
        return m_reject_reason + ", " + m_debug_message;
    }
    return m_reject_reason;
}
