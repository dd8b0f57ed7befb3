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

#include <peerlend/protocol/Asset.h>
#include <peerlend/protocol/jss.h>

#include <type_traits>

namespace peerlend {

AssetKind
kindOf(Asset const& asset)
{
    return std::visit(
        []<class T>(T const&) {
            if constexpr (std::is_same_v<T, NativeAsset>)
                return AssetKind::native;
            else if constexpr (std::is_same_v<T, TokenAsset>)
                return AssetKind::token;
            else
            {
                static_assert(std::is_same_v<T, CollectibleAsset>);
                return AssetKind::collectible;
            }
        },
        asset);
}

std::optional<AccountID>
referenceOf(Asset const& asset)
{
    return std::visit(
        []<class T>(T const& a) -> std::optional<AccountID> {
            if constexpr (std::is_same_v<T, NativeAsset>)
                return std::nullopt;
            else if constexpr (std::is_same_v<T, TokenAsset>)
                return a.contract;
            else
            {
                static_assert(std::is_same_v<T, CollectibleAsset>);
                return a.collection;
            }
        },
        asset);
}

Expected<AssetKind, LER>
parseAssetKind(std::uint8_t tag)
{
    switch (tag)
    {
        case static_cast<std::uint8_t>(AssetKind::native):
            return AssetKind::native;
        case static_cast<std::uint8_t>(AssetKind::token):
            return AssetKind::token;
        case static_cast<std::uint8_t>(AssetKind::collectible):
            return AssetKind::collectible;
        default:
            return Unexpected(temINVALID_COLLATERAL_TYPE);
    }
}

std::string
to_string(AssetKind kind)
{
    switch (kind)
    {
        case AssetKind::native:
            return "native";
        case AssetKind::token:
            return "token";
        case AssetKind::collectible:
            return "collectible";
    }
    return "unknown";  // LCOV_EXCL_LINE
}

std::string
to_string(Asset const& asset)
{
    return std::visit(
        []<class T>(T const& a) -> std::string {
            if constexpr (std::is_same_v<T, NativeAsset>)
                return "native";
            else if constexpr (std::is_same_v<T, TokenAsset>)
                return "token:" + toBase58(a.contract);
            else
            {
                static_assert(std::is_same_v<T, CollectibleAsset>);
                return "collectible:" + toBase58(a.collection) + "#" +
                    std::to_string(a.itemID);
            }
        },
        asset);
}

Json::Value
getJson(Asset const& asset)
{
    Json::Value ret(Json::objectValue);
    ret[jss::kind] = to_string(kindOf(asset));
    std::visit(
        [&ret]<class T>(T const& a) {
            if constexpr (std::is_same_v<T, TokenAsset>)
            {
                ret[jss::contract] = toBase58(a.contract);
            }
            else if constexpr (std::is_same_v<T, CollectibleAsset>)
            {
                ret[jss::collection] = toBase58(a.collection);
                ret[jss::item_id] = std::to_string(a.itemID);
            }
        },
        asset);
    return ret;
}

std::string
to_string(AssetKey const& key)
{
    if (!key.reference)
        return to_string(key.kind);
    return to_string(key.kind) + ":" + toBase58(*key.reference);
}

}  // namespace peerlend
