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

#include <peerlendd/app/misc/TransferBatch.h>

#include <xrpl/beast/unit_test.h>

namespace peerlend {
namespace test {

class TransferBatch_test : public beast::unit_test::suite
{
    beast::Journal const j_{beast::Journal::getNullSink()};

    void
    testAdd()
    {
        testcase("Add");

        using namespace jtx;
        Account const alice("alice");
        Account const bob("bob");

        TransferBatch batch(j_);
        BEAST_EXPECT(batch.empty());

        // Empty and circular legs are dropped.
        batch.add(0, alice, bob);
        batch.add(10, alice, alice);
        BEAST_EXPECT(batch.empty());

        batch.add(10, alice, bob);
        BEAST_EXPECT(batch.legs().size() == 1);
        BEAST_EXPECT(batch.legs()[0].amount == 10);
        BEAST_EXPECT(batch.legs()[0].from == alice.id());
    }

    void
    testApply()
    {
        testcase("Apply");

        using namespace jtx;
        Account const alice("alice");
        Account const bob("bob");
        Account const carol("carol");

        TestTransferService bank;
        bank.fund(alice, 1000);

        TransferBatch batch(j_);
        batch.add(300, alice, bob);
        batch.add(200, alice, carol);
        batch.add(100, bob, carol);

        BEAST_EXPECT(batch.apply(bank) == tesSUCCESS);
        BEAST_EXPECT(bank.completed() == 3);
        BEAST_EXPECT(bank.balance(alice) == 500);
        BEAST_EXPECT(bank.balance(bob) == 200);
        BEAST_EXPECT(bank.balance(carol) == 300);

        TransferBatch empty(j_);
        BEAST_EXPECT(empty.apply(bank) == tesSUCCESS);
    }

    void
    testUnwind()
    {
        testcase("Unwind");

        using namespace jtx;
        Account const alice("alice");
        Account const bob("bob");
        Account const carol("carol");

        TestTransferService bank;
        bank.fund(alice, 1000);

        TransferBatch batch(j_);
        batch.add(300, alice, bob);
        batch.add(200, alice, carol);
        batch.add(100, bob, carol);

        // The last leg fails: the first two are reversed.
        bank.failOnce(2);
        BEAST_EXPECT(batch.apply(bank) == tecTRANSFER_FAILED);
        BEAST_EXPECT(bank.completed() == 4);
        BEAST_EXPECT(bank.balance(alice) == 1000);
        BEAST_EXPECT(bank.balance(bob) == 0);
        BEAST_EXPECT(bank.balance(carol) == 0);

        // The first leg fails: nothing moved, nothing to reverse.
        bank.failOnce(0);
        BEAST_EXPECT(batch.apply(bank) == tecTRANSFER_FAILED);
        BEAST_EXPECT(bank.completed() == 4);
        BEAST_EXPECT(bank.balance(alice) == 1000);

        // Insufficient funds fail like any other transfer.
        TransferBatch tooMuch(j_);
        tooMuch.add(600, alice, bob);
        tooMuch.add(600, alice, carol);
        BEAST_EXPECT(tooMuch.apply(bank) == tecTRANSFER_FAILED);
        BEAST_EXPECT(bank.balance(alice) == 1000);
        BEAST_EXPECT(bank.balance(bob) == 0);
    }

    void
    testUnwindFailure()
    {
        testcase("Unwind failure");

        using namespace jtx;
        Account const alice("alice");
        Account const bob("bob");

        TestTransferService bank;
        bank.fund(alice, 1000);

        TransferBatch batch(j_);
        batch.add(300, alice, bob);
        batch.add(200, alice, bob);

        // The second leg and the reversal of the first both fail.
        bank.failFrom(1);
        BEAST_EXPECT(batch.apply(bank) == tefBAD_LEDGER);
        BEAST_EXPECT(bank.balance(alice) == 700);
        BEAST_EXPECT(bank.balance(bob) == 300);
    }

public:
    void
    run() override
    {
        testAdd();
        testApply();
        testUnwind();
        testUnwindFailure();
    }
};

BEAST_DEFINE_TESTSUITE(TransferBatch, app, peerlend);

}  // namespace test
}  // namespace peerlend
