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

#ifndef PEERLEND_PROTOCOL_ASSET_H_INCLUDED
#define PEERLEND_PROTOCOL_ASSET_H_INCLUDED

#include <peerlend/protocol/LER.h>

#include <xrpl/basics/Expected.h>
#include <xrpl/json/json_value.h>
#include <xrpl/protocol/AccountID.h>

#include <cstdint>
#include <optional>
#include <string>
#include <tuple>
#include <variant>

namespace peerlend {

using ripple::AccountID;
using ripple::Expected;
using ripple::Unexpected;

/** The kinds of value the ledger can lend or hold as collateral. */
enum class AssetKind : std::uint8_t {
    native = 0,
    token = 1,
    collectible = 2,
};

/** The ledger's own currency. Moved through the TransferService. */
struct NativeAsset
{
    friend bool
    operator==(NativeAsset const&, NativeAsset const&) = default;
};

/** A fungible token identified by its issuing contract. */
struct TokenAsset
{
    AccountID contract;

    friend bool
    operator==(TokenAsset const&, TokenAsset const&) = default;
};

/** A single item of a non-fungible collection. */
struct CollectibleAsset
{
    AccountID collection;
    std::uint64_t itemID = 0;

    friend bool
    operator==(CollectibleAsset const&, CollectibleAsset const&) = default;
};

using Asset = std::variant<NativeAsset, TokenAsset, CollectibleAsset>;

AssetKind
kindOf(Asset const& asset);

/** The registry reference of an asset, if it has one. */
std::optional<AccountID>
referenceOf(Asset const& asset);

/** Decode a numeric kind tag as received from an external caller. */
Expected<AssetKind, LER>
parseAssetKind(std::uint8_t tag);

std::string
to_string(AssetKind kind);

std::string
to_string(Asset const& asset);

Json::Value
getJson(Asset const& asset);

//------------------------------------------------------------------------------

/** Identifies one accounting bucket: an asset kind plus its reference.

    Native assets have no reference. Collectible items of one collection share
    a bucket.
*/
struct AssetKey
{
    AssetKind kind = AssetKind::native;
    std::optional<AccountID> reference;

    AssetKey() = default;

    AssetKey(AssetKind k, std::optional<AccountID> ref)
        : kind(k), reference(std::move(ref))
    {
    }

    explicit AssetKey(Asset const& asset)
        : kind(kindOf(asset)), reference(referenceOf(asset))
    {
    }

    bool
    operator==(AssetKey const& other) const
    {
        return kind == other.kind && reference == other.reference;
    }

    bool
    operator<(AssetKey const& other) const
    {
        return std::tie(kind, reference) <
            std::tie(other.kind, other.reference);
    }
};

std::string
to_string(AssetKey const& key);

/** The bucket for the native asset. */
inline AssetKey
nativeKey()
{
    return AssetKey{AssetKind::native, std::nullopt};
}

}  // namespace peerlend

#endif
