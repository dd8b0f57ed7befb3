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

#ifndef PEERLEND_APP_MISC_UTILIZATIONTRACKER_H_INCLUDED
#define PEERLEND_APP_MISC_UTILIZATIONTRACKER_H_INCLUDED

#include <peerlend/protocol/Asset.h>

#include <xrpl/beast/utility/Journal.h>
#include <xrpl/json/json_value.h>

#include <cstdint>
#include <map>

namespace peerlend {

/** Running supply and demand totals for one asset. */
struct AssetUtilization
{
    std::uint64_t totalSupplied = 0;
    std::uint64_t totalBorrowed = 0;
    std::uint64_t activeLoans = 0;

    bool
    operator==(AssetUtilization const&) const = default;

    Json::Value
    getJson() const;
};

/**
 * Tracks how much of each asset has been requested and funded.
 *
 * Demand (borrowed) grows when a loan is requested, supply grows when a
 * lender funds it, and both the borrowed total and the active loan count
 * shrink when the loan is closed. Counters never go below zero: a
 * subtraction larger than the current value leaves the counter at zero.
 */
class UtilizationTracker
{
    std::map<AssetKey, AssetUtilization> entries_;
    beast::Journal const j_;

public:
    explicit UtilizationTracker(beast::Journal journal);

    /** Totals for an asset. Unknown assets read as all zero. */
    AssetUtilization
    get(AssetKey const& key) const;

    /** Borrowed over supplied, in basis points. Zero when nothing is
        supplied.
    */
    std::uint64_t
    utilizationRate(AssetKey const& key) const;

    void
    update(
        AssetKey const& key,
        std::uint64_t suppliedDelta,
        std::uint64_t borrowedDelta,
        std::uint64_t loanCountDelta,
        bool isAddition);

    std::map<AssetKey, AssetUtilization> const&
    entries() const
    {
        return entries_;
    }
};

}  // namespace peerlend

#endif
