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

#include <peerlendd/core/LedgerConfig.h>

#include <xrpl/basics/contract.h>

#include <boost/lexical_cast.hpp>

#include <stdexcept>
#include <string>
#include <type_traits>

namespace peerlend {

namespace {

template <class T>
void
readValue(ripple::Section const& section, std::string const& name, T& target)
{
    auto const value = section.get<std::string>(name);
    if (!value)
        return;

    // lexical_cast wraps "-1" around for unsigned types.
    if (std::is_unsigned_v<T> && !value->empty() && value->front() == '-')
        ripple::Throw<std::runtime_error>(
            "Negative value for '" + name + "' in [" + section.name() +
            "]: " + *value);

    try
    {
        target = boost::lexical_cast<T>(*value);
    }
    catch (boost::bad_lexical_cast const&)
    {
        ripple::Throw<std::runtime_error>(
            "Invalid value for '" + name + "' in [" + section.name() + "]");
    }
}

AccountID
readAccount(ripple::Section const& section, std::string const& name)
{
    auto const value = section.get<std::string>(name);
    if (!value || value->empty())
        ripple::Throw<std::runtime_error>(
            "Missing '" + name + "' in [" + section.name() + "]");

    auto const account = ripple::parseBase58<AccountID>(*value);
    if (!account)
        ripple::Throw<std::runtime_error>(
            "Invalid account for '" + name + "' in [" + section.name() +
            "]: " + *value);
    return *account;
}

}  // namespace

LER
checkPlatformFee(std::uint32_t fee)
{
    if (fee > maxPlatformFee)
        return temINVALID_AMOUNT;
    return tesSUCCESS;
}

LER
checkMinCollateralRatio(std::uint32_t ratio)
{
    if (ratio < minCollateralRatioFloor || ratio > minCollateralRatioCeiling)
        return temINVALID_AMOUNT;
    return tesSUCCESS;
}

LER
checkRateParameters(RateParameters const& params)
{
    using namespace RateBounds;

    if (params.baseRate < minBaseRate || params.baseRate > maxBaseRate)
        return temINVALID_INTEREST;
    if (params.utilizationMultiplier > maxUtilizationMultiplier)
        return temINVALID_INTEREST;
    if (params.riskMultiplier > maxRiskMultiplier)
        return temINVALID_INTEREST;
    if (params.maxRate < minMaxRate || params.maxRate > maxMaxRate)
        return temINVALID_INTEREST;
    if (params.minRate < minMinRate || params.minRate > maxMinRate)
        return temINVALID_INTEREST;
    if (params.maxRate <= params.minRate)
        return temINVALID_INTEREST;
    return tesSUCCESS;
}

LedgerConfig
setup_LedgerConfig(ripple::BasicConfig const& config)
{
    LedgerConfig setup;

    {
        auto const& section = config.section("lending");

        setup.owner = readAccount(section, "owner");
        setup.custody = readAccount(section, "custody");

        readValue(section, "platform_fee", setup.platformFee);
        readValue(section, "min_collateral_ratio", setup.minCollateralRatio);
        readValue(section, "max_duration", setup.maxDuration);

        if (!isTesSuccess(checkPlatformFee(setup.platformFee)))
            ripple::Throw<std::runtime_error>(
                "[lending] platform_fee must not exceed " +
                std::to_string(maxPlatformFee));

        if (!isTesSuccess(checkMinCollateralRatio(setup.minCollateralRatio)))
            ripple::Throw<std::runtime_error>(
                "[lending] min_collateral_ratio must be between " +
                std::to_string(minCollateralRatioFloor) + " and " +
                std::to_string(minCollateralRatioCeiling));

        if (setup.maxDuration == 0)
            ripple::Throw<std::runtime_error>(
                "[lending] max_duration must be positive");
    }

    {
        auto const& section = config.section("lending_rates");

        readValue(section, "base_rate", setup.rates.baseRate);
        readValue(
            section,
            "utilization_multiplier",
            setup.rates.utilizationMultiplier);
        readValue(section, "risk_multiplier", setup.rates.riskMultiplier);
        readValue(section, "min_rate", setup.rates.minRate);
        readValue(section, "max_rate", setup.rates.maxRate);

        if (!isTesSuccess(checkRateParameters(setup.rates)))
            ripple::Throw<std::runtime_error>(
                "[lending_rates] parameters are outside the permitted range");
    }

    return setup;
}

}  // namespace peerlend
