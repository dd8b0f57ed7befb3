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

#include <peerlend/protocol/jss.h>

#include <xrpl/beast/unit_test.h>

namespace peerlend {
namespace test {

class UtilizationTracker_test : public beast::unit_test::suite
{
    beast::Journal const j_{beast::Journal::getNullSink()};

    void
    testRate()
    {
        testcase("Utilization rate");

        UtilizationTracker tracker(j_);
        AssetKey const token{AssetKind::token, AccountID{7}};

        // Nothing supplied: no utilization, no division by zero.
        BEAST_EXPECT(tracker.utilizationRate(nativeKey()) == 0);
        tracker.update(nativeKey(), 0, 500, 1, true);
        BEAST_EXPECT(tracker.utilizationRate(nativeKey()) == 0);

        tracker.update(nativeKey(), 2000, 0, 0, true);
        BEAST_EXPECT(tracker.utilizationRate(nativeKey()) == 2500);

        // Borrowed can exceed supplied.
        tracker.update(nativeKey(), 0, 3500, 1, true);
        BEAST_EXPECT(tracker.utilizationRate(nativeKey()) == 20000);

        // Other assets are unaffected.
        BEAST_EXPECT(tracker.utilizationRate(token) == 0);
        BEAST_EXPECT(tracker.get(token) == AssetUtilization{});
    }

    void
    testUpdate()
    {
        testcase("Update");

        UtilizationTracker tracker(j_);

        tracker.update(nativeKey(), 100, 200, 2, true);
        auto totals = tracker.get(nativeKey());
        BEAST_EXPECT(totals.totalSupplied == 100);
        BEAST_EXPECT(totals.totalBorrowed == 200);
        BEAST_EXPECT(totals.activeLoans == 2);

        tracker.update(nativeKey(), 40, 50, 1, false);
        totals = tracker.get(nativeKey());
        BEAST_EXPECT(totals.totalSupplied == 60);
        BEAST_EXPECT(totals.totalBorrowed == 150);
        BEAST_EXPECT(totals.activeLoans == 1);

        auto const json = totals.getJson();
        BEAST_EXPECT(json[jss::total_supplied].asString() == "60");
        BEAST_EXPECT(json[jss::total_borrowed].asString() == "150");
        BEAST_EXPECT(json[jss::active_loans].asString() == "1");

        // Each asset is tracked on its own.
        AssetKey const usd{AssetKind::token, AccountID{100}};
        tracker.update(usd, 1000, 0, 0, true);
        BEAST_EXPECT(tracker.entries().size() == 2);
        BEAST_EXPECT(tracker.entries().at(usd).totalSupplied == 1000);
        BEAST_EXPECT(tracker.entries().at(nativeKey()) == totals);
    }

    void
    testFloorClamp()
    {
        testcase("Floor clamp");

        UtilizationTracker tracker(j_);

        // Subtracting from an unknown asset leaves it at zero.
        tracker.update(nativeKey(), 10, 10, 1, false);
        BEAST_EXPECT(tracker.get(nativeKey()) == AssetUtilization{});

        // Each counter clamps on its own.
        tracker.update(nativeKey(), 100, 5, 3, true);
        tracker.update(nativeKey(), 30, 50, 1, false);
        auto const totals = tracker.get(nativeKey());
        BEAST_EXPECT(totals.totalSupplied == 70);
        BEAST_EXPECT(totals.totalBorrowed == 0);
        BEAST_EXPECT(totals.activeLoans == 2);

        // Counters never go negative, whatever the order of operations.
        for (int i = 0; i < 5; ++i)
            tracker.update(nativeKey(), 100, 100, 100, false);
        BEAST_EXPECT(tracker.get(nativeKey()) == AssetUtilization{});
        BEAST_EXPECT(tracker.utilizationRate(nativeKey()) == 0);
    }

public:
    void
    run() override
    {
        testRate();
        testUpdate();
        testFloorClamp();
    }
};

BEAST_DEFINE_TESTSUITE(UtilizationTracker, app, peerlend);

}  // namespace test
}  // namespace peerlend
