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

#include <peerlendd/app/misc/InterestRateEngine.h>

#include <peerlend/protocol/jss.h>

#include <xrpl/basics/mulDiv.h>
#include <xrpl/beast/utility/instrumentation.h>

#include <algorithm>
#include <limits>

namespace peerlend {

static constexpr std::uint64_t maxAmount =
    std::numeric_limits<std::uint64_t>::max();

std::uint64_t
proportionalInterest(
    std::uint64_t principal,
    std::uint32_t rate,
    LedgerIndex elapsed,
    LedgerIndex duration)
{
    if (principal == 0 || duration == 0)
        return 0;
    if (rate < minInterestRate || rate > maxInterestRate)
        return 0;

    // rate <= 10000, so this never exceeds the principal
    auto const annualInterest =
        ripple::mulDiv(principal, rate, bipsPerUnity).value_or(maxAmount);

    std::uint64_t const timeFactor =
        static_cast<std::uint64_t>(elapsed) * bipsPerUnity / duration;

    return ripple::mulDiv(annualInterest, timeFactor, bipsPerUnity)
        .value_or(maxAmount);
}

Json::Value
RepaymentParts::getJson() const
{
    Json::Value ret(Json::objectValue);
    ret[jss::interest] = std::to_string(interest);
    ret[jss::total] = std::to_string(total);
    ret[jss::fee] = std::to_string(fee);
    ret[jss::lender_share] = std::to_string(lenderShare);
    return ret;
}

Expected<RepaymentParts, LER>
computeRepayment(
    std::uint64_t principal,
    std::uint32_t rate,
    LedgerIndex elapsed,
    LedgerIndex duration,
    std::uint32_t platformFee)
{
    RepaymentParts parts;
    parts.interest = proportionalInterest(principal, rate, elapsed, duration);

    if (parts.interest > maxAmount - principal)
        return Unexpected(tefINTERNAL);
    parts.total = principal + parts.interest;

    auto const fee = ripple::mulDiv(parts.total, platformFee, bipsPerUnity);
    if (!fee || *fee > parts.total)
        return Unexpected(tefINTERNAL);  // LCOV_EXCL_LINE
    parts.fee = *fee;
    parts.lenderShare = parts.total - parts.fee;

    XRPL_ASSERT_PARTS(
        parts.fee + parts.lenderShare == parts.total,
        "peerlend::computeRepayment",
        "repayment parts add up");
    return parts;
}

std::uint64_t
collateralRatio(std::uint64_t collateral, std::uint64_t principal)
{
    XRPL_ASSERT(
        principal > 0, "peerlend::collateralRatio : positive principal");
    if (principal == 0)
        return 0;
    return ripple::mulDiv(collateral, bipsPerUnity, principal)
        .value_or(maxAmount);
}

//------------------------------------------------------------------------------

InterestRateEngine::InterestRateEngine(
    UtilizationTracker const& utilization,
    RateParameters const& params)
    : utilization_(utilization), params_(params)
{
}

std::uint32_t
InterestRateEngine::computeRate(
    std::uint32_t baseRate,
    AssetKey const& asset,
    RiskTier tier,
    std::uint64_t collateralRatio) const
{
    auto const utilizationAdjustment =
        ripple::mulDiv(
            utilization_.utilizationRate(asset),
            params_.utilizationMultiplier,
            bipsPerUnity)
            .value_or(maxAmount);

    std::uint64_t const riskAdjustment =
        static_cast<std::uint64_t>(tier) * params_.riskMultiplier;

    std::uint64_t raw = baseRate;
    raw = (utilizationAdjustment > maxAmount - raw)
        ? maxAmount
        : raw + utilizationAdjustment;
    raw = (riskAdjustment > maxAmount - raw) ? maxAmount : raw + riskAdjustment;

    if (collateralRatio >= highCollateralRatio)
        raw = raw > highCollateralDiscount ? raw - highCollateralDiscount : 0;

    return static_cast<std::uint32_t>(std::clamp<std::uint64_t>(
        raw, params_.minRate, params_.maxRate));
}

}  // namespace peerlend
