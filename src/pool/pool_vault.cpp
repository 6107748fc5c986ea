// Copyright (c) 2025 The StakePool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pool/pool_vault.h"

#include "logging.h"
#include "pool/pool_math.h"
#include "utilmoneystr.h"

CAmount CInMemoryVault::ValueOf(CAmount nShares) const
{
    if (nShares <= 0) return 0;
    if (nTotalShares == 0) return nShares;

    CAmount nValue = 0;
    if (!pool_math::MulDiv(nShares, nPooledValue, nTotalShares, nValue)) {
        error("%s: overflow converting %d shares", __func__, nShares);
        return 0;
    }
    return nValue;
}

CAmount CInMemoryVault::SharesOf(CAmount nValue) const
{
    if (nValue <= 0) return 0;
    if (nTotalShares == 0 || nPooledValue == 0) return nValue;

    CAmount nShares = 0;
    if (!pool_math::MulDiv(nValue, nTotalShares, nPooledValue, nShares)) {
        error("%s: overflow converting %d value units", __func__, nValue);
        return 0;
    }
    return nShares;
}

CAmount CInMemoryVault::GetValue(CAmount nShares) const
{
    LOCK(cs_vault);
    return ValueOf(nShares);
}

CAmount CInMemoryVault::GetShares(CAmount nValue) const
{
    LOCK(cs_vault);
    return SharesOf(nValue);
}

CAmount CInMemoryVault::TransferShares(const std::string& strTo, CAmount nShares)
{
    return TransferSharesFrom(GetHolder(), strTo, nShares);
}

CAmount CInMemoryVault::TransferSharesFrom(const std::string& strFrom, const std::string& strTo, CAmount nShares)
{
    LOCK(cs_vault);

    if (strFrom.empty() || strTo.empty() || nShares <= 0) {
        LogPrint(BCLog::VAULT, "%s: rejected transfer of %d shares from '%s' to '%s'\n", __func__, nShares, strFrom, strTo);
        return 0;
    }

    auto it = mapBalances.find(strFrom);
    if (it == mapBalances.end() || it->second < nShares) {
        LogPrint(BCLog::VAULT, "%s: %s holds %s shares, %s requested\n", __func__, strFrom,
                 FormatMoney(it == mapBalances.end() ? 0 : it->second), FormatMoney(nShares));
        return 0;
    }

    it->second -= nShares;
    mapBalances[strTo] += nShares;

    LogPrint(BCLog::VAULT, "%s: %s -> %s %s shares\n", __func__, strFrom, strTo, FormatMoney(nShares));
    return nShares;
}

CAmount CInMemoryVault::Mint(const std::string& strTo, CAmount nValue)
{
    LOCK(cs_vault);

    if (strTo.empty() || nValue <= 0 || !MoneyRange(nValue)) {
        return 0;
    }

    CAmount nShares = SharesOf(nValue);
    CAmount nNewTotal = 0;
    CAmount nNewPooled = 0;
    if (nShares <= 0 ||
        !pool_math::CheckedAdd(nTotalShares, nShares, nNewTotal) ||
        !pool_math::CheckedAdd(nPooledValue, nValue, nNewPooled)) {
        error("%s: cannot mint %s for %s", __func__, FormatMoney(nValue), strTo);
        return 0;
    }

    nTotalShares = nNewTotal;
    nPooledValue = nNewPooled;
    mapBalances[strTo] += nShares;

    LogPrint(BCLog::VAULT, "%s: %s staked %s for %s shares\n", __func__, strTo, FormatMoney(nValue), FormatMoney(nShares));
    return nShares;
}

bool CInMemoryVault::Rebase(CAmount nNewPooledValue)
{
    LOCK(cs_vault);

    if (!MoneyRange(nNewPooledValue)) {
        return error("%s: pooled value %d out of range", __func__, nNewPooledValue);
    }
    if (nTotalShares > 0 && nNewPooledValue == 0) {
        return error("%s: cannot rebase %s outstanding shares to zero", __func__, FormatMoney(nTotalShares));
    }
    if (nTotalShares == 0 && nNewPooledValue != 0) {
        return error("%s: nothing staked", __func__);
    }

    LogPrint(BCLog::VAULT, "%s: pooled value %s -> %s\n", __func__, FormatMoney(nPooledValue), FormatMoney(nNewPooledValue));
    nPooledValue = nNewPooledValue;
    return true;
}

CAmount CInMemoryVault::GetBalance(const std::string& strAddress) const
{
    LOCK(cs_vault);
    auto it = mapBalances.find(strAddress);
    return it == mapBalances.end() ? 0 : it->second;
}

std::map<std::string, CAmount> CInMemoryVault::GetBalances() const
{
    LOCK(cs_vault);
    return mapBalances;
}

bool CInMemoryVault::Restore(CAmount nTotalSharesIn, CAmount nPooledValueIn, const std::map<std::string, CAmount>& balances)
{
    LOCK(cs_vault);

    if (!MoneyRange(nTotalSharesIn) || !MoneyRange(nPooledValueIn)) {
        return error("%s: totals out of range (%d shares, %d value)", __func__, nTotalSharesIn, nPooledValueIn);
    }

    CAmount nSum = 0;
    for (const auto& entry : balances) {
        if (!MoneyRange(entry.second) || !pool_math::CheckedAdd(nSum, entry.second, nSum)) {
            return error("%s: balance of %s out of range", __func__, entry.first);
        }
    }
    if (nSum != nTotalSharesIn) {
        return error("%s: balances add up to %s, expected %s shares", __func__, FormatMoney(nSum), FormatMoney(nTotalSharesIn));
    }

    mapBalances = balances;
    nTotalShares = nTotalSharesIn;
    nPooledValue = nPooledValueIn;

    LogPrint(BCLog::VAULT, "%s: %u balance(s), %s shares worth %s\n", __func__, mapBalances.size(),
             FormatMoney(nTotalShares), FormatMoney(nPooledValue));
    return true;
}

CAmount CInMemoryVault::GetTotalShares() const
{
    LOCK(cs_vault);
    return nTotalShares;
}

CAmount CInMemoryVault::GetPooledValue() const
{
    LOCK(cs_vault);
    return nPooledValue;
}

void CInMemoryVault::SetHolder(const std::string& strHolderIn)
{
    LOCK(cs_vault);
    strHolder = strHolderIn;
}

std::string CInMemoryVault::GetHolder() const
{
    LOCK(cs_vault);
    return strHolder;
}
