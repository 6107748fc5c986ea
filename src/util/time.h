// Copyright (c) 2025 The StakePool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEPOOL_UTIL_TIME_H
#define STAKEPOOL_UTIL_TIME_H

#include <stdint.h>
#include <string>

/**
 * GetTime() returns the system time in seconds, but respects the mocktime
 * set with SetMockTime(). Reward assignment timestamps go through it so the
 * tests can pin them.
 */
int64_t GetTime();

int64_t GetTimeMillis();
int64_t GetTimeMicros();

/** For testing. Set e.g. with the setmocktime rpc, or -mocktime argument */
void SetMockTime(int64_t nMockTimeIn);
/** For testing */
int64_t GetMockTime();

/**
 * ISO 8601 formatting is preferred. Use the FormatISO8601{DateTime,Date}
 * helper functions if possible.
 */
std::string FormatISO8601DateTime(int64_t nTime);

#endif // STAKEPOOL_UTIL_TIME_H
