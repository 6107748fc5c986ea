// Copyright (c) 2025 The StakePool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pool/pool_math.h"

#include <limits>

namespace pool_math {

bool MulDiv(CAmount a, CAmount b, CAmount d, CAmount& result)
{
    if (a < 0 || b < 0 || d <= 0) {
        return false;
    }

    int128_t quotient = (static_cast<int128_t>(a) * static_cast<int128_t>(b)) / static_cast<int128_t>(d);
    if (quotient > std::numeric_limits<CAmount>::max()) {
        return false;
    }

    result = static_cast<CAmount>(quotient);
    return true;
}

bool MulDivUp(CAmount a, CAmount b, CAmount d, CAmount& result)
{
    if (a < 0 || b < 0 || d <= 0) {
        return false;
    }

    const int128_t divisor = static_cast<int128_t>(d);
    int128_t quotient = (static_cast<int128_t>(a) * static_cast<int128_t>(b) + divisor - 1) / divisor;
    if (quotient > std::numeric_limits<CAmount>::max()) {
        return false;
    }

    result = static_cast<CAmount>(quotient);
    return true;
}

bool CheckedAdd(CAmount a, CAmount b, CAmount& result)
{
    if (a < 0 || b < 0) {
        return false;
    }

    int128_t sum = static_cast<int128_t>(a) + static_cast<int128_t>(b);
    if (sum > MAX_MONEY) {
        return false;
    }

    result = static_cast<CAmount>(sum);
    return true;
}

bool CheckedSub(CAmount a, CAmount b, CAmount& result)
{
    if (a < 0 || b < 0 || b > a) {
        return false;
    }

    result = a - b;
    return true;
}

} // namespace pool_math
