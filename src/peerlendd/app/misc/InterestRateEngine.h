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

#ifndef PEERLEND_APP_MISC_INTERESTRATEENGINE_H_INCLUDED
#define PEERLEND_APP_MISC_INTERESTRATEENGINE_H_INCLUDED

#include <peerlendd/app/misc/RiskScorer.h>
#include <peerlendd/app/misc/UtilizationTracker.h>
#include <peerlendd/core/LedgerConfig.h>

#include <peerlend/protocol/Asset.h>
#include <peerlend/protocol/LER.h>
#include <peerlend/protocol/Protocol.h>

#include <xrpl/json/json_value.h>

#include <cstdint>

namespace peerlend {

/** Interest accrued over part (or more than all) of a loan's term.

    Returns zero, rather than failing, when principal or duration is zero or
    the rate is outside [minInterestRate, maxInterestRate]. Callers validate
    those inputs themselves before relying on a non-zero result.

    Each step truncates toward zero:
        annual     = principal * rate / 10000
        timeFactor = elapsed * 10000 / duration
        interest   = annual * timeFactor / 10000

    Elapsed time beyond the duration keeps accruing linearly.
*/
std::uint64_t
proportionalInterest(
    std::uint64_t principal,
    std::uint32_t rate,
    LedgerIndex elapsed,
    LedgerIndex duration);

/* The amounts that settle an active loan at a given ledger.

   The borrower pays `total`. Of that, `fee` goes to the platform owner and
   `lenderShare` to the lender.
*/
struct RepaymentParts
{
    std::uint64_t interest = 0;
    std::uint64_t total = 0;
    std::uint64_t fee = 0;
    std::uint64_t lenderShare = 0;

    bool
    operator==(RepaymentParts const&) const = default;

    Json::Value
    getJson() const;
};

/** Compute the settlement of a loan repaid `elapsed` ledgers after funding.

    Fails with tefINTERNAL if the total does not fit in 64 bits.
*/
Expected<RepaymentParts, LER>
computeRepayment(
    std::uint64_t principal,
    std::uint32_t rate,
    LedgerIndex elapsed,
    LedgerIndex duration,
    std::uint32_t platformFee);

/**
 * Derives a per-loan interest rate from market and borrower conditions.
 *
 *   rate = base
 *        + utilization * utilizationMultiplier / 10000
 *        + riskTier * riskMultiplier
 *        - 50 if the collateral ratio is at least 20000
 *
 * and the result is clamped to [minRate, maxRate].
 */
class InterestRateEngine
{
    UtilizationTracker const& utilization_;
    RateParameters const& params_;

public:
    InterestRateEngine(
        UtilizationTracker const& utilization,
        RateParameters const& params);

    std::uint32_t
    computeRate(
        std::uint32_t baseRate,
        AssetKey const& asset,
        RiskTier tier,
        std::uint64_t collateralRatio) const;

    /** Rate using the configured base rate. */
    std::uint32_t
    computeRate(
        AssetKey const& asset,
        RiskTier tier,
        std::uint64_t collateralRatio) const
    {
        return computeRate(params_.baseRate, asset, tier, collateralRatio);
    }

    bool
    withinBounds(std::uint32_t rate) const
    {
        return rate >= params_.minRate && rate <= params_.maxRate;
    }
};

/** Collateral over principal, in basis points. Saturates rather than
    overflowing. Principal must be positive.
*/
std::uint64_t
collateralRatio(std::uint64_t collateral, std::uint64_t principal);

}  // namespace peerlend

#endif
