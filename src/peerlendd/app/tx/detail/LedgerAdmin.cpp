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

#include <peerlendd/app/tx/detail/LedgerAdmin.h>

#include <peerlend/protocol/Protocol.h>

#include <xrpl/basics/Log.h>

#include <type_traits>

namespace peerlend {

static LER
checkReference(AccountID const& ref)
{
    if (ref == beast::zero)
        return temINVALID_TOKEN_CONTRACT;
    return tesSUCCESS;
}

static LER
checkRiskScore(std::uint8_t score)
{
    if (score < minAssetRiskScore || score > maxAssetRiskScore)
        return temINVALID_RISK_SCORE;
    return tesSUCCESS;
}

static LER
checkCollection(
    AccountID const& collection,
    std::uint64_t floorPrice,
    std::uint8_t riskScore)
{
    if (auto const ter = checkReference(collection); !isTesSuccess(ter))
        return ter;
    if (floorPrice == 0)
        return temINVALID_AMOUNT;
    return checkRiskScore(riskScore);
}

LER
LedgerAdmin::preflight(PreflightContext<Request> const& ctx)
{
    // Only the owner learns whether the request itself is well formed.
    if (ctx.account != ctx.config.owner)
    {
        JLOG(ctx.j.warn()) << "LedgerAdmin: " << toBase58(ctx.account)
                           << " is not the platform owner.";
        return tecNO_PERMISSION;
    }

    auto const ter = std::visit(
        []<class T>(T const& op) -> LER {
            if constexpr (std::is_same_v<T, AddToken>)
            {
                if (auto const result = checkReference(op.contract);
                    !isTesSuccess(result))
                    return result;
                if (op.decimals > maxTokenDecimals)
                    return temINVALID_AMOUNT;
                return checkRiskScore(op.riskScore);
            }
            else if constexpr (std::is_same_v<T, RemoveToken>)
            {
                return checkReference(op.contract);
            }
            else if constexpr (std::is_same_v<T, AddCollection>)
            {
                return checkCollection(
                    op.collection, op.floorPrice, op.riskScore);
            }
            else if constexpr (std::is_same_v<T, UpdateCollection>)
            {
                return checkCollection(
                    op.collection, op.floorPrice, op.riskScore);
            }
            else if constexpr (std::is_same_v<T, SetPlatformFee>)
            {
                return checkPlatformFee(op.fee);
            }
            else if constexpr (std::is_same_v<T, SetMinCollateralRatio>)
            {
                return checkMinCollateralRatio(op.ratio);
            }
            else
            {
                static_assert(std::is_same_v<T, SetRateParameters>);
                return checkRateParameters(op.params);
            }
        },
        ctx.tx);

    if (!isTesSuccess(ter))
        JLOG(ctx.j.warn()) << "LedgerAdmin: rejected, " << transHuman(ter);
    return ter;
}

LER
LedgerAdmin::preclaim(PreclaimContext<Request> const& ctx)
{
    auto const& assets = ctx.view.assets();

    if (auto const op = std::get_if<RemoveToken>(&ctx.tx);
        op && !assets.token(op->contract))
    {
        JLOG(ctx.j.warn()) << "LedgerAdmin: token " << toBase58(op->contract)
                           << " is not registered.";
        return tecNO_ENTRY;
    }

    if (auto const op = std::get_if<UpdateCollection>(&ctx.tx);
        op && !assets.collection(op->collection))
    {
        JLOG(ctx.j.warn()) << "LedgerAdmin: collection "
                           << toBase58(op->collection)
                           << " is not registered.";
        return tecNO_ENTRY;
    }

    return tesSUCCESS;
}

LER
LedgerAdmin::doApply()
{
    auto& view = this->view();
    auto& assets = view.assets();
    auto& config = view.config();

    return std::visit(
        [&]<class T>(T const& op) -> LER {
            if constexpr (std::is_same_v<T, AddToken>)
            {
                assets.setToken(op.contract, {op.decimals, op.riskScore, true});
                JLOG(j_.info()) << "Token " << toBase58(op.contract)
                                << " registered";
            }
            else if constexpr (std::is_same_v<T, RemoveToken>)
            {
                if (!assets.disableToken(op.contract))
                    return tefBAD_LEDGER;  // LCOV_EXCL_LINE
                JLOG(j_.info()) << "Token " << toBase58(op.contract)
                                << " disabled";
            }
            else if constexpr (std::is_same_v<T, AddCollection>)
            {
                assets.setCollection(
                    op.collection, {op.floorPrice, op.riskScore, true});
                JLOG(j_.info()) << "Collection " << toBase58(op.collection)
                                << " registered at floor " << op.floorPrice;
            }
            else if constexpr (std::is_same_v<T, UpdateCollection>)
            {
                assets.setCollection(
                    op.collection, {op.floorPrice, op.riskScore, op.enabled});
                JLOG(j_.info()) << "Collection " << toBase58(op.collection)
                                << " updated, floor " << op.floorPrice
                                << (op.enabled ? "" : ", disabled");
            }
            else if constexpr (std::is_same_v<T, SetPlatformFee>)
            {
                config.platformFee = op.fee;
                JLOG(j_.info()) << "Platform fee set to " << op.fee;
            }
            else if constexpr (std::is_same_v<T, SetMinCollateralRatio>)
            {
                config.minCollateralRatio = op.ratio;
                JLOG(j_.info()) << "Minimum collateral ratio set to "
                                << op.ratio;
            }
            else
            {
                static_assert(std::is_same_v<T, SetRateParameters>);
                config.rates = op.params;
                JLOG(j_.info())
                    << "Rate parameters set: base " << op.params.baseRate
                    << ", range [" << op.params.minRate << ", "
                    << op.params.maxRate << "]";
            }
            return tesSUCCESS;
        },
        tx_);
}

}  // namespace peerlend
