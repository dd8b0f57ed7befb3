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

#include <xrpl/basics/Log.h>

#include <type_traits>

namespace peerlend {

std::optional<AssetRegistry::TokenInfo>
AssetRegistry::token(AccountID const& contract) const
{
    auto const it = tokens_.find(contract);
    if (it == tokens_.end())
        return std::nullopt;
    return it->second;
}

std::optional<AssetRegistry::CollectionInfo>
AssetRegistry::collection(AccountID const& collection) const
{
    auto const it = collections_.find(collection);
    if (it == collections_.end())
        return std::nullopt;
    return it->second;
}

void
AssetRegistry::setToken(AccountID const& contract, TokenInfo const& info)
{
    tokens_[contract] = info;
}

bool
AssetRegistry::disableToken(AccountID const& contract)
{
    auto const it = tokens_.find(contract);
    if (it == tokens_.end())
        return false;
    it->second.enabled = false;
    return true;
}

void
AssetRegistry::setCollection(
    AccountID const& collection,
    CollectionInfo const& info)
{
    collections_[collection] = info;
}

LER
AssetRegistry::checkUsable(Asset const& asset, beast::Journal j) const
{
    return std::visit(
        [&]<class T>(T const& a) -> LER {
            if constexpr (std::is_same_v<T, NativeAsset>)
            {
                return tesSUCCESS;
            }
            else if constexpr (std::is_same_v<T, TokenAsset>)
            {
                auto const info = token(a.contract);
                if (!info)
                {
                    JLOG(j.warn()) << "Token " << toBase58(a.contract)
                                   << " is not registered.";
                    return tecNO_ENTRY;
                }
                if (!info->enabled)
                {
                    JLOG(j.warn()) << "Token " << toBase58(a.contract)
                                   << " is disabled.";
                    return tecUNSUPPORTED_ASSET;
                }
                return tesSUCCESS;
            }
            else
            {
                static_assert(std::is_same_v<T, CollectibleAsset>);
                auto const info = collection(a.collection);
                if (!info)
                {
                    JLOG(j.warn()) << "Collection " << toBase58(a.collection)
                                   << " is not registered.";
                    return tecNO_ENTRY;
                }
                if (!info->enabled)
                {
                    JLOG(j.warn()) << "Collection " << toBase58(a.collection)
                                   << " is disabled.";
                    return tecUNSUPPORTED_ASSET;
                }
                return tesSUCCESS;
            }
        },
        asset);
}

}  // namespace peerlend
