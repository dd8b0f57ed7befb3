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

#include <peerlendd/app/misc/UserStatsStore.h>

#include <peerlend/protocol/jss.h>

namespace peerlend {

Json::Value
UserStats::getJson() const
{
    Json::Value ret(Json::objectValue);
    ret[jss::loans_created] = std::to_string(loansCreated);
    ret[jss::loans_funded] = std::to_string(loansFunded);
    ret[jss::total_borrowed] = std::to_string(totalBorrowed);
    ret[jss::total_lent] = std::to_string(totalLent);
    ret[jss::reputation] = std::to_string(reputation);
    ret[jss::defaults] = std::to_string(defaults);
    return ret;
}

UserStats
UserStatsStore::get(AccountID const& account) const
{
    auto const it = stats_.find(account);
    if (it == stats_.end())
        return {};
    return it->second;
}

UserStats&
UserStatsStore::peek(AccountID const& account)
{
    return stats_[account];
}

void
UserStatsStore::onLoanCreated(AccountID const& borrower)
{
    auto& stats = peek(borrower);
    ++stats.loansCreated;
    ++stats.reputation;
}

void
UserStatsStore::onLoanFunded(
    AccountID const& lender,
    std::uint64_t principal,
    bool trackVolume)
{
    auto& stats = peek(lender);
    ++stats.loansFunded;
    ++stats.reputation;
    if (trackVolume)
        stats.totalLent += principal;
}

void
UserStatsStore::onLoanRepaid(AccountID const& borrower, std::uint64_t principal)
{
    peek(borrower).totalBorrowed += principal;
}

void
UserStatsStore::onLoanDefaulted(AccountID const& borrower)
{
    ++peek(borrower).defaults;
}

}  // namespace peerlend
