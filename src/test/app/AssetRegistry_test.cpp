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

#include <peerlendd/app/misc/AssetRegistry.h>

#include <xrpl/beast/unit_test.h>

namespace peerlend {
namespace test {

class AssetRegistry_test : public beast::unit_test::suite
{
    beast::Journal const j_{beast::Journal::getNullSink()};

    AccountID const usd_{100};
    AccountID const punks_{200};

    void
    testTokens()
    {
        testcase("Tokens");

        AssetRegistry registry;
        Asset const token = TokenAsset{usd_};

        BEAST_EXPECT(!registry.token(usd_));
        BEAST_EXPECT(registry.checkUsable(token, j_) == tecNO_ENTRY);
        BEAST_EXPECT(!registry.disableToken(usd_));

        registry.setToken(usd_, {6, 2, true});
        auto const info = registry.token(usd_);
        if (!BEAST_EXPECT(info.has_value()))
            return;
        BEAST_EXPECT(info->decimals == 6);
        BEAST_EXPECT(info->riskScore == 2);
        BEAST_EXPECT(info->enabled);
        BEAST_EXPECT(registry.checkUsable(token, j_) == tesSUCCESS);

        // Disabling keeps the entry.
        BEAST_EXPECT(registry.disableToken(usd_));
        BEAST_EXPECT(registry.token(usd_).has_value());
        BEAST_EXPECT(!registry.token(usd_)->enabled);
        BEAST_EXPECT(registry.tokens().size() == 1);
        BEAST_EXPECT(
            registry.checkUsable(token, j_) == tecUNSUPPORTED_ASSET);

        // Registering again re-enables it.
        registry.setToken(usd_, {8, 3, true});
        BEAST_EXPECT(registry.checkUsable(token, j_) == tesSUCCESS);
        BEAST_EXPECT(registry.token(usd_)->decimals == 8);
    }

    void
    testCollections()
    {
        testcase("Collections");

        AssetRegistry registry;
        Asset const item = CollectibleAsset{punks_, 1};

        BEAST_EXPECT(registry.checkUsable(item, j_) == tecNO_ENTRY);

        registry.setCollection(punks_, {5'000, 4, true});
        BEAST_EXPECT(registry.checkUsable(item, j_) == tesSUCCESS);
        BEAST_EXPECT(registry.collection(punks_)->floorPrice == 5'000);

        registry.setCollection(punks_, {6'000, 4, false});
        BEAST_EXPECT(
            registry.checkUsable(item, j_) == tecUNSUPPORTED_ASSET);
        BEAST_EXPECT(registry.collections().size() == 1);

        // A token registration does not cover a collection of the same
        // account, nor the other way round.
        BEAST_EXPECT(
            registry.checkUsable(TokenAsset{punks_}, j_) == tecNO_ENTRY);
    }

    void
    testNative()
    {
        testcase("Native");

        AssetRegistry const registry;
        BEAST_EXPECT(registry.checkUsable(NativeAsset{}, j_) == tesSUCCESS);
    }

public:
    void
    run() override
    {
        testTokens();
        testCollections();
        testNative();
    }
};

BEAST_DEFINE_TESTSUITE(AssetRegistry, app, peerlend);

}  // namespace test
}  // namespace peerlend
