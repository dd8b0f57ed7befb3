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

#ifndef PEERLEND_CORE_LEDGERCONFIG_H_INCLUDED
#define PEERLEND_CORE_LEDGERCONFIG_H_INCLUDED

#include <peerlend/protocol/Asset.h>
#include <peerlend/protocol/LER.h>
#include <peerlend/protocol/Protocol.h>

#include <xrpl/basics/BasicConfig.h>

#include <cstdint>

namespace peerlend {

/** Parameters of the dynamic interest rate. All values in basis points. */
struct RateParameters
{
    std::uint32_t baseRate = 500;
    std::uint32_t utilizationMultiplier = 200;
    std::uint32_t riskMultiplier = 100;
    std::uint32_t minRate = 100;
    std::uint32_t maxRate = 2000;

    bool
    operator==(RateParameters const&) const = default;
};

/** Scalar platform configuration.

    Loaded once from the [lending] and [lending_rates] sections and changed
    afterwards only by the privileged admin operations.
*/
struct LedgerConfig
{
    /** The platform owner: receives fees and may run admin operations. */
    AccountID owner;

    /** The account holding native collateral while a loan is open. */
    AccountID custody;

    std::uint32_t platformFee = 250;
    std::uint32_t minCollateralRatio = 15000;

    /** Longest loan term, in ledgers. */
    LedgerIndex maxDuration = 52560;

    RateParameters rates;
};

LER
checkPlatformFee(std::uint32_t fee);

LER
checkMinCollateralRatio(std::uint32_t ratio);

LER
checkRateParameters(RateParameters const& params);

/** Build the ledger configuration from a parsed config file.

    @throws std::runtime_error if a required key is missing or a value is
            outside its permitted range.
*/
LedgerConfig
setup_LedgerConfig(ripple::BasicConfig const& config);

}  // namespace peerlend

#endif
