// Copyright (c) 2025 The StakePool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pool/pool_events.h"

#include "logging.h"
#include "utilmoneystr.h"

std::string PoolEventTypeName(PoolEventType type)
{
    switch (type) {
    case PoolEventType::DEPOSITED: return "deposited";
    case PoolEventType::WITHDRAWN: return "withdrawn";
    case PoolEventType::REWARDS_ASSIGNED: return "rewardsassigned";
    case PoolEventType::DEPOSIT_CAP_UPDATED: return "depositcapupdated";
    case PoolEventType::EMERGENCY_WITHDRAWN: return "emergencywithdrawn";
    case PoolEventType::PAUSED: return "paused";
    case PoolEventType::UNPAUSED: return "unpaused";
    case PoolEventType::TREASURY_WITHDRAWN: return "treasurywithdrawn";
    }
    return "unknown";
}

CPoolEvent CPoolEvent::Deposited(const std::string& account, CAmount amount, CAmount shares)
{
    CPoolEvent ev(PoolEventType::DEPOSITED);
    ev.strAccount = account;
    ev.nAmount = amount;
    ev.nShares = shares;
    return ev;
}

CPoolEvent CPoolEvent::Withdrawn(const std::string& account, CAmount amount, CAmount shares)
{
    CPoolEvent ev(PoolEventType::WITHDRAWN);
    ev.strAccount = account;
    ev.nAmount = amount;
    ev.nShares = shares;
    return ev;
}

CPoolEvent CPoolEvent::RewardsAssigned(CAmount sharesYield, CAmount totalShares, int64_t nTimeIn)
{
    CPoolEvent ev(PoolEventType::REWARDS_ASSIGNED);
    ev.nShares = sharesYield;
    ev.nTotalShares = totalShares;
    ev.nTime = nTimeIn;
    return ev;
}

CPoolEvent CPoolEvent::DepositCapUpdated(CAmount oldCap, CAmount newCap)
{
    CPoolEvent ev(PoolEventType::DEPOSIT_CAP_UPDATED);
    ev.nOldCap = oldCap;
    ev.nNewCap = newCap;
    return ev;
}

CPoolEvent CPoolEvent::EmergencyWithdrawn(const std::string& account, CAmount amount, CAmount shares)
{
    CPoolEvent ev(PoolEventType::EMERGENCY_WITHDRAWN);
    ev.strAccount = account;
    ev.nAmount = amount;
    ev.nShares = shares;
    return ev;
}

CPoolEvent CPoolEvent::Paused(const std::string& caller)
{
    CPoolEvent ev(PoolEventType::PAUSED);
    ev.strAccount = caller;
    return ev;
}

CPoolEvent CPoolEvent::Unpaused(const std::string& caller)
{
    CPoolEvent ev(PoolEventType::UNPAUSED);
    ev.strAccount = caller;
    return ev;
}

CPoolEvent CPoolEvent::TreasuryWithdrawn(const std::string& destination, CAmount amount, CAmount shares)
{
    CPoolEvent ev(PoolEventType::TREASURY_WITHDRAWN);
    ev.strAccount = destination;
    ev.nAmount = amount;
    ev.nShares = shares;
    return ev;
}

std::string CPoolEvent::ToString() const
{
    switch (type) {
    case PoolEventType::DEPOSITED:
    case PoolEventType::WITHDRAWN:
    case PoolEventType::EMERGENCY_WITHDRAWN:
    case PoolEventType::TREASURY_WITHDRAWN:
        return strprintf("%s(account=%s, amount=%s, shares=%s)", PoolEventTypeName(type), strAccount,
                         FormatMoney(nAmount), FormatMoney(nShares));
    case PoolEventType::REWARDS_ASSIGNED:
        return strprintf("%s(shares=%s, totalShares=%s, time=%d)", PoolEventTypeName(type),
                         FormatMoney(nShares), FormatMoney(nTotalShares), nTime);
    case PoolEventType::DEPOSIT_CAP_UPDATED:
        return strprintf("%s(oldCap=%s, newCap=%s)", PoolEventTypeName(type), FormatMoney(nOldCap),
                         FormatMoney(nNewCap));
    case PoolEventType::PAUSED:
    case PoolEventType::UNPAUSED:
        return strprintf("%s(caller=%s)", PoolEventTypeName(type), strAccount);
    }
    return PoolEventTypeName(type);
}
