// Copyright (c) 2025 The StakePool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Money parsing/formatting utilities.
 */
#ifndef STAKEPOOL_UTILMONEYSTR_H
#define STAKEPOOL_UTILMONEYSTR_H

#include "amount.h"

#include <string>

std::string FormatMoney(const CAmount& n);
bool ParseMoney(const std::string& str, CAmount& nRet);

#endif // STAKEPOOL_UTILMONEYSTR_H
