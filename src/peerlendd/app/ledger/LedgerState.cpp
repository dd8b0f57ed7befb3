//------------------------------------------------------------------------------
/*
    This file is part of peerlend
    Copyright (c) 2024 The peerlend developers

    Permission to use, copy, modify, and/or distribute this software for any
    purpose  with  or without fee is hereby granted, provided that the above
    copyright notice and this permission notice appear in all copies.

    THE  SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES
    WITH  REGARD  TO  THIS  SOFTWARE  INCLUDING  ALL  IMPLIED  WARRANTIES  OF
    MERCHANTABILITY  AND  FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR
    ANY  SPECIAL ,  DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
    WHATSOEVER  RESULTING  FROM  LOSS  OF USE, DATA OR PROFITS, WHETHER IN AN
    ACTION  OF  CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
    OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
*/
//==============================================================================

#include <peerlendd/app/ledger/LedgerState.h>

#include <peerlend/protocol/jss.h>

#include <xrpl/beast/utility/instrumentation.h>

namespace peerlend {

Json::Value
PlatformStats::getJson() const
{
    Json::Value ret(Json::objectValue);
    ret[jss::loan_counter] = std::to_string(loanCounter);
    ret[jss::pending] = std::to_string(pending);
    ret[jss::active] = std::to_string(active);
    ret[jss::repaid] = std::to_string(repaid);
    ret[jss::liquidated] = std::to_string(liquidated);
    ret[jss::total_originated] = std::to_string(totalOriginated);
    ret[jss::total_funded] = std::to_string(totalFunded);
    ret[jss::fees_collected] = std::to_string(feesCollected);

    ret[jss::owner] = toBase58(config.owner);
    ret[jss::custody] = toBase58(config.custody);
    ret[jss::platform_fee] = config.platformFee;
    ret[jss::min_collateral_ratio] = config.minCollateralRatio;
    ret[jss::max_duration] = config.maxDuration;
    ret[jss::base_rate] = config.rates.baseRate;
    ret[jss::utilization_multiplier] = config.rates.utilizationMultiplier;
    ret[jss::risk_multiplier] = config.rates.riskMultiplier;
    ret[jss::min_rate] = config.rates.minRate;
    ret[jss::max_rate] = config.rates.maxRate;
    return ret;
}

LedgerState::LedgerState(LedgerConfig const& config, beast::Journal journal)
    : config_(config), utilization_(journal)
{
}

LoanEntry const*
LedgerState::read(std::uint64_t id) const
{
    auto const it = loans_.find(id);
    if (it == loans_.end())
        return nullptr;
    return &it->second;
}

LoanEntry*
LedgerState::peek(std::uint64_t id)
{
    auto const it = loans_.find(id);
    if (it == loans_.end())
        return nullptr;
    return &it->second;
}

std::uint64_t
LedgerState::insert(LoanEntry entry)
{
    entry.id = ++loanCounter_;
    totalOriginated_ += entry.principal;

    auto const [it, inserted] = loans_.emplace(entry.id, std::move(entry));
    XRPL_ASSERT(inserted, "peerlend::LedgerState::insert : new loan id");
    return it->first;
}

PlatformStats
LedgerState::getPlatformStats() const
{
    PlatformStats stats;
    stats.loanCounter = loanCounter_;
    stats.totalOriginated = totalOriginated_;
    stats.totalFunded = totalFunded_;
    stats.feesCollected = feesCollected_;
    stats.config = config_;

    for (auto const& [id, loan] : loans_)
    {
        switch (loan.status)
        {
            case LoanStatus::pending:
                ++stats.pending;
                break;
            case LoanStatus::active:
                ++stats.active;
                break;
            case LoanStatus::repaid:
                ++stats.repaid;
                break;
            case LoanStatus::liquidated:
                ++stats.liquidated;
                break;
        }
    }
    return stats;
}

}  // namespace peerlend
