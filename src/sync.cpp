// Copyright (c) 2025 The StakePool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "sync.h"

#include "logging.h"

#include <stdexcept>

void AssertLockHeldInternal(const char* pszName, const char* pszFile, int nLine, const RecursiveMutex& cs)
{
    if (cs.IsHeldByCurrentThread()) return;
    std::string strMessage = strprintf("Assertion failed: lock %s not held in %s:%i", pszName, pszFile, nLine);
    LogPrintf("%s\n", strMessage);
    throw std::logic_error(strMessage);
}
