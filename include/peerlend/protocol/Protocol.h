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

#ifndef PEERLEND_PROTOCOL_PROTOCOL_H_INCLUDED
#define PEERLEND_PROTOCOL_PROTOCOL_H_INCLUDED

#include <xrpl/protocol/Protocol.h>

#include <cstdint>

namespace peerlend {

/** Protocol specific constants.

    These values are part of the ledger rules. Changing one of them changes
    the outcome of existing operations.

    All rates and ratios are expressed in basis points.
*/

using ripple::LedgerIndex;

/** One hundred percent, in basis points. */
std::uint32_t constexpr bipsPerUnity = 100 * 100;

/** The range of rates accepted when computing proportional interest.

    Outside of this range interest computation fails closed and yields zero.
*/
std::uint32_t constexpr minInterestRate = 100;
std::uint32_t constexpr maxInterestRate = bipsPerUnity;
static_assert(minInterestRate < maxInterestRate);

/** Collateral ratio at or above which a loan receives a rate discount. */
std::uint32_t constexpr highCollateralRatio = 2 * bipsPerUnity;

/** The discount granted to highly collateralized loans. */
std::uint32_t constexpr highCollateralDiscount = 50;

/** Platform fee charged on repayment may not exceed this value. */
std::uint32_t constexpr maxPlatformFee = 1000;

/** Bounds on the configurable minimum collateral ratio. */
std::uint32_t constexpr minCollateralRatioFloor = bipsPerUnity;
std::uint32_t constexpr minCollateralRatioCeiling = 5 * bipsPerUnity;

/** Bounds on the dynamic rate parameters. */
namespace RateBounds {

std::uint32_t constexpr minBaseRate = 50;
std::uint32_t constexpr maxBaseRate = 1000;
std::uint32_t constexpr maxUtilizationMultiplier = 500;
std::uint32_t constexpr maxRiskMultiplier = 300;
std::uint32_t constexpr minMaxRate = 500;
std::uint32_t constexpr maxMaxRate = 5000;
std::uint32_t constexpr minMinRate = 50;
std::uint32_t constexpr maxMinRate = 200;

}  // namespace RateBounds

/** Registered tokens may declare at most this many decimals. */
std::uint8_t constexpr maxTokenDecimals = 18;

/** Asset risk scores are ordinal, from 1 (safest) to 5. */
std::uint8_t constexpr minAssetRiskScore = 1;
std::uint8_t constexpr maxAssetRiskScore = 5;

/** Risk thresholds used when scoring a borrower. */
std::uint64_t constexpr safeReputation = 10;
std::uint64_t constexpr lowRiskReputation = 5;
std::uint64_t constexpr veryHighRiskDefaults = 2;

}  // namespace peerlend

#endif
