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

#ifndef PEERLEND_APP_MISC_ASSETREGISTRY_H_INCLUDED
#define PEERLEND_APP_MISC_ASSETREGISTRY_H_INCLUDED

#include <peerlend/protocol/Asset.h>
#include <peerlend/protocol/LER.h>

#include <xrpl/beast/utility/Journal.h>

#include <cstdint>
#include <map>
#include <optional>

namespace peerlend {

/**
 * Whitelist of the non-native assets the ledger accepts.
 *
 * Tokens and collectible collections are keyed by their contract account.
 * Entries are never removed: disabling an asset only clears its enabled
 * flag, so loans that already reference it remain readable.
 */
class AssetRegistry
{
public:
    struct TokenInfo
    {
        std::uint8_t decimals = 0;
        std::uint8_t riskScore = 0;
        bool enabled = true;
    };

    struct CollectionInfo
    {
        std::uint64_t floorPrice = 0;
        std::uint8_t riskScore = 0;
        bool enabled = true;
    };

private:
    std::map<AccountID, TokenInfo> tokens_;
    std::map<AccountID, CollectionInfo> collections_;

public:
    AssetRegistry() = default;

    std::optional<TokenInfo>
    token(AccountID const& contract) const;

    std::optional<CollectionInfo>
    collection(AccountID const& collection) const;

    /** Register a token or replace its metadata. */
    void
    setToken(AccountID const& contract, TokenInfo const& info);

    /** Clear the enabled flag. Returns false if the token is unknown. */
    bool
    disableToken(AccountID const& contract);

    /** Register a collection or replace its metadata. */
    void
    setCollection(AccountID const& collection, CollectionInfo const& info);

    /**
     * Verify that an asset may be used in a new loan.
     *
     * The native asset is always usable. Tokens and collections must be
     * registered (tecNO_ENTRY) and enabled (tecUNSUPPORTED_ASSET).
     */
    LER
    checkUsable(Asset const& asset, beast::Journal j) const;

    std::map<AccountID, TokenInfo> const&
    tokens() const
    {
        return tokens_;
    }

    std::map<AccountID, CollectionInfo> const&
    collections() const
    {
        return collections_;
    }
};

}  // namespace peerlend

#endif
