// Copyright (c) 2025 The StakePool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEPOOL_POOL_ERRORS_H
#define STAKEPOOL_POOL_ERRORS_H

#include <string>

/** Named failure conditions of the pool operations */
enum class PoolError {
    OK = 0,

    // invalid input
    ZERO_ADDRESS,
    ZERO_AMOUNT,

    // capacity
    DEPOSIT_CAP_EXCEEDED,

    // insufficiency
    INSUFFICIENT_SHARES,
    NOT_ENOUGH_BALANCE,
    NOTHING_TO_WITHDRAW,

    // integration with the asset vault
    DEPOSIT_FAILED,
    TRANSFER_FAILED,

    // configuration
    CAP_BELOW_POOL_VALUE,

    // operating mode
    PAUSED,
    NOT_PAUSED,

    // permission
    UNAUTHORIZED,

    // concurrency
    REENTRANCY,

    // internal, fail closed
    INVARIANT_VIOLATION,
    OVERFLOW,

    // persistence
    DB_ERROR,
};

/** Upper-case name of a PoolError, e.g. "DEPOSIT_CAP_EXCEEDED" */
std::string PoolErrorName(PoolError code);

/**
 * Capture information about a failed pool operation.
 *
 * Operations return false and fill this state; nothing is retried.
 */
class CPoolValidationState
{
private:
    PoolError m_error{PoolError::OK};
    std::string m_reject_reason;
    std::string m_debug_message;

public:
    bool Invalid(PoolError code, const std::string& strRejectReason, const std::string& strDebugMessage = "")
    {
        m_error = code;
        m_reject_reason = strRejectReason;
        m_debug_message = strDebugMessage;
        return false;
    }

    /** Same as above, for use as `state.Invalid(error(...), ...)` */
    bool Invalid(bool ret, PoolError code, const std::string& strRejectReason, const std::string& strDebugMessage = "")
    {
        Invalid(code, strRejectReason, strDebugMessage);
        return ret;
    }

    bool IsValid() const { return m_error == PoolError::OK; }
    bool IsInvalid() const { return !IsValid(); }

    /** Internal failures (invariant, overflow, persistence) as opposed to rejected requests */
    bool IsError() const
    {
        return m_error == PoolError::INVARIANT_VIOLATION || m_error == PoolError::OVERFLOW ||
               m_error == PoolError::DB_ERROR;
    }

    PoolError GetError() const { return m_error; }
    std::string GetRejectReason() const { return m_reject_reason; }
    std::string GetDebugMessage() const { return m_debug_message; }

    void Reset()
    {
        m_error = PoolError::OK;
        m_reject_reason.clear();
        m_debug_message.clear();
    }

    std::string ToString() const;
};

#endif // STAKEPOOL_POOL_ERRORS_H
