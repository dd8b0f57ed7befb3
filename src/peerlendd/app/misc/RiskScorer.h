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

#ifndef PEERLEND_APP_MISC_RISKSCORER_H_INCLUDED
#define PEERLEND_APP_MISC_RISKSCORER_H_INCLUDED

#include <peerlendd/app/misc/UserStatsStore.h>

#include <peerlend/protocol/Asset.h>

#include <cstdint>
#include <optional>
#include <string>

namespace peerlend {

/** Ordinal borrower risk. The numeric value feeds the rate engine. */
enum class RiskTier : std::uint8_t {
    safe = 1,
    low = 2,
    medium = 3,
    high = 4,
    veryHigh = 5,
};

std::string
to_string(RiskTier tier);

/**
 * Derives a borrower's risk tier from their lending history.
 *
 * - No loans created yet: medium.
 * - More than two defaults: very high. Any default: high.
 * - Otherwise reputation decides: 10 and up is safe, 5 and up is low,
 *   anything less is medium.
 */
class RiskScorer
{
    UserStatsStore const& stats_;

public:
    explicit RiskScorer(UserStatsStore const& stats);

    // The collateral arguments do not influence the tier.
    RiskTier
    score(
        AccountID const& user,
        AssetKind collateralKind,
        std::optional<AccountID> const& collateralRef) const;
};

}  // namespace peerlend

#endif
