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

#include <peerlendd/app/misc/UtilizationTracker.h>

#include <peerlend/protocol/Protocol.h>
#include <peerlend/protocol/jss.h>

#include <xrpl/basics/Log.h>
#include <xrpl/basics/mulDiv.h>

#include <limits>

namespace peerlend {

Json::Value
AssetUtilization::getJson() const
{
    Json::Value ret(Json::objectValue);
    ret[jss::total_supplied] = std::to_string(totalSupplied);
    ret[jss::total_borrowed] = std::to_string(totalBorrowed);
    ret[jss::active_loans] = std::to_string(activeLoans);
    return ret;
}

UtilizationTracker::UtilizationTracker(beast::Journal journal) : j_(journal)
{
}

AssetUtilization
UtilizationTracker::get(AssetKey const& key) const
{
    auto const it = entries_.find(key);
    if (it == entries_.end())
        return {};
    return it->second;
}

std::uint64_t
UtilizationTracker::utilizationRate(AssetKey const& key) const
{
    auto const totals = get(key);
    if (totals.totalSupplied == 0)
        return 0;

    auto const rate = ripple::mulDiv(
        totals.totalBorrowed, bipsPerUnity, totals.totalSupplied);
    if (!rate)
        return std::numeric_limits<std::uint64_t>::max();
    return *rate;
}

void
UtilizationTracker::update(
    AssetKey const& key,
    std::uint64_t suppliedDelta,
    std::uint64_t borrowedDelta,
    std::uint64_t loanCountDelta,
    bool isAddition)
{
    auto& totals = entries_[key];

    if (isAddition)
    {
        totals.totalSupplied += suppliedDelta;
        totals.totalBorrowed += borrowedDelta;
        totals.activeLoans += loanCountDelta;
        return;
    }

    auto subtract = [this, &key](
                        std::uint64_t& value,
                        std::uint64_t delta,
                        char const* name) {
        if (delta > value)
        {
            JLOG(j_.warn()) << "UtilizationTracker: " << name << " for "
                            << to_string(key) << " clamped at zero ("
                            << value << " - " << delta << ")";
            value = 0;
            return;
        }
        value -= delta;
    };

    subtract(totals.totalSupplied, suppliedDelta, "supplied");
    subtract(totals.totalBorrowed, borrowedDelta, "borrowed");
    subtract(totals.activeLoans, loanCountDelta, "active loans");
}

}  // namespace peerlend
