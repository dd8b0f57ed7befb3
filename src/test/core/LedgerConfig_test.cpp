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

#include <test/jtx/LendingEnv.h>

#include <peerlendd/core/LedgerConfig.h>

#include <xrpl/basics/BasicConfig.h>
#include <xrpl/beast/unit_test.h>

#include <stdexcept>
#include <string>

namespace peerlend {
namespace test {

class LedgerConfig_test : public beast::unit_test::suite
{
    jtx::Account const owner_{"owner"};
    jtx::Account const custody_{"custody"};

    ripple::BasicConfig
    makeConfig()
    {
        ripple::BasicConfig config;
        config.overwrite("lending", "owner", owner_.human());
        config.overwrite("lending", "custody", custody_.human());
        return config;
    }

    bool
    rejects(ripple::BasicConfig const& config)
    {
        try
        {
            setup_LedgerConfig(config);
        }
        catch (std::runtime_error const&)
        {
            return true;
        }
        return false;
    }

    void
    testDefaults()
    {
        testcase("Defaults");

        auto const setup = setup_LedgerConfig(makeConfig());
        BEAST_EXPECT(setup.owner == owner_.id());
        BEAST_EXPECT(setup.custody == custody_.id());
        BEAST_EXPECT(setup.platformFee == 250);
        BEAST_EXPECT(setup.minCollateralRatio == 15000);
        BEAST_EXPECT(setup.maxDuration == 52560);
        BEAST_EXPECT(setup.rates == RateParameters{});
        BEAST_EXPECT(setup.rates.baseRate == 500);
        BEAST_EXPECT(setup.rates.utilizationMultiplier == 200);
        BEAST_EXPECT(setup.rates.riskMultiplier == 100);
        BEAST_EXPECT(setup.rates.minRate == 100);
        BEAST_EXPECT(setup.rates.maxRate == 2000);
    }

    void
    testOverrides()
    {
        testcase("Overrides");

        auto config = makeConfig();
        config.overwrite("lending", "platform_fee", "1000");
        config.overwrite("lending", "min_collateral_ratio", "20000");
        config.overwrite("lending", "max_duration", "100");
        config.overwrite("lending_rates", "base_rate", "50");
        config.overwrite("lending_rates", "utilization_multiplier", "500");
        config.overwrite("lending_rates", "risk_multiplier", "0");
        config.overwrite("lending_rates", "min_rate", "200");
        config.overwrite("lending_rates", "max_rate", "5000");

        auto const setup = setup_LedgerConfig(config);
        BEAST_EXPECT(setup.platformFee == 1000);
        BEAST_EXPECT(setup.minCollateralRatio == 20000);
        BEAST_EXPECT(setup.maxDuration == 100);
        BEAST_EXPECT(setup.rates.baseRate == 50);
        BEAST_EXPECT(setup.rates.utilizationMultiplier == 500);
        BEAST_EXPECT(setup.rates.riskMultiplier == 0);
        BEAST_EXPECT(setup.rates.minRate == 200);
        BEAST_EXPECT(setup.rates.maxRate == 5000);
    }

    void
    testErrors()
    {
        testcase("Errors");

        // Accounts are required.
        BEAST_EXPECT(rejects(ripple::BasicConfig{}));
        {
            ripple::BasicConfig config;
            config.overwrite("lending", "owner", owner_.human());
            BEAST_EXPECT(rejects(config));
        }
        {
            auto config = makeConfig();
            config.overwrite("lending", "custody", "not an account");
            BEAST_EXPECT(rejects(config));
        }

        auto rejectsValue = [&](std::string const& section,
                                std::string const& key,
                                std::string const& value) {
            auto config = makeConfig();
            config.overwrite(section, key, value);
            return rejects(config);
        };

        BEAST_EXPECT(rejectsValue("lending", "platform_fee", "1001"));
        BEAST_EXPECT(rejectsValue("lending", "platform_fee", "lots"));
        BEAST_EXPECT(rejectsValue("lending", "min_collateral_ratio", "9999"));
        BEAST_EXPECT(rejectsValue("lending", "min_collateral_ratio", "50001"));
        BEAST_EXPECT(rejectsValue("lending", "max_duration", "0"));
        BEAST_EXPECT(rejectsValue("lending", "max_duration", "-1"));
        BEAST_EXPECT(rejectsValue("lending", "platform_fee", "-1"));
        BEAST_EXPECT(rejectsValue("lending", "min_collateral_ratio", "-15000"));
        BEAST_EXPECT(rejectsValue("lending_rates", "risk_multiplier", "-0"));
        BEAST_EXPECT(rejectsValue("lending_rates", "base_rate", "49"));
        BEAST_EXPECT(rejectsValue("lending_rates", "base_rate", "1001"));
        BEAST_EXPECT(
            rejectsValue("lending_rates", "utilization_multiplier", "501"));
        BEAST_EXPECT(rejectsValue("lending_rates", "risk_multiplier", "301"));
        BEAST_EXPECT(rejectsValue("lending_rates", "min_rate", "49"));
        BEAST_EXPECT(rejectsValue("lending_rates", "min_rate", "201"));
        BEAST_EXPECT(rejectsValue("lending_rates", "max_rate", "499"));
        BEAST_EXPECT(rejectsValue("lending_rates", "max_rate", "5001"));

        BEAST_EXPECT(!rejectsValue("lending", "platform_fee", "0"));
    }

    void
    testBounds()
    {
        testcase("Bounds");

        BEAST_EXPECT(checkPlatformFee(1000) == tesSUCCESS);
        BEAST_EXPECT(checkPlatformFee(1001) == temINVALID_AMOUNT);

        BEAST_EXPECT(checkMinCollateralRatio(10000) == tesSUCCESS);
        BEAST_EXPECT(checkMinCollateralRatio(50000) == tesSUCCESS);
        BEAST_EXPECT(checkMinCollateralRatio(9999) == temINVALID_AMOUNT);
        BEAST_EXPECT(checkMinCollateralRatio(50001) == temINVALID_AMOUNT);

        RateParameters params;
        BEAST_EXPECT(checkRateParameters(params) == tesSUCCESS);

        // The extremes of every range are accepted.
        params.minRate = 200;
        params.maxRate = 500;
        BEAST_EXPECT(checkRateParameters(params) == tesSUCCESS);
        params.baseRate = 1000;
        params.utilizationMultiplier = 500;
        params.riskMultiplier = 300;
        BEAST_EXPECT(checkRateParameters(params) == tesSUCCESS);
        params.riskMultiplier = 301;
        BEAST_EXPECT(checkRateParameters(params) == temINVALID_INTEREST);
    }

public:
    void
    run() override
    {
        testDefaults();
        testOverrides();
        testErrors();
        testBounds();
    }
};

BEAST_DEFINE_TESTSUITE(LedgerConfig, core, peerlend);

}  // namespace test
}  // namespace peerlend
