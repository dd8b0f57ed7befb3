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

#include <peerlendd/app/misc/RiskScorer.h>

#include <peerlend/protocol/Protocol.h>

namespace peerlend {

std::string
to_string(RiskTier tier)
{
    switch (tier)
    {
        case RiskTier::safe:
            return "safe";
        case RiskTier::low:
            return "low";
        case RiskTier::medium:
            return "medium";
        case RiskTier::high:
            return "high";
        case RiskTier::veryHigh:
            return "very_high";
    }
    return "unknown";  // LCOV_EXCL_LINE
}

RiskScorer::RiskScorer(UserStatsStore const& stats) : stats_(stats)
{
}

RiskTier
RiskScorer::score(
    AccountID const& user,
    AssetKind,
    std::optional<AccountID> const&) const
{
    auto const stats = stats_.get(user);

    if (stats.loansCreated == 0)
        return RiskTier::medium;

    if (stats.defaults > veryHighRiskDefaults)
        return RiskTier::veryHigh;
    if (stats.defaults > 0)
        return RiskTier::high;

    if (stats.reputation >= safeReputation)
        return RiskTier::safe;
    if (stats.reputation >= lowRiskReputation)
        return RiskTier::low;
    return RiskTier::medium;
}

}  // namespace peerlend
