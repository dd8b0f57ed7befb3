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

#ifndef PEERLEND_APP_TX_LEDGERADMIN_H_INCLUDED
#define PEERLEND_APP_TX_LEDGERADMIN_H_INCLUDED

#include <peerlendd/app/tx/detail/Transactor.h>
#include <peerlendd/core/LedgerConfig.h>

#include <cstdint>
#include <variant>

namespace peerlend {

/** Privileged changes to the asset whitelist and platform parameters.

    Only the platform owner may submit them.
*/
class LedgerAdmin : public Transactor
{
public:
    struct AddToken
    {
        AccountID contract;
        std::uint8_t decimals = 0;
        std::uint8_t riskScore = 0;
    };

    struct RemoveToken
    {
        AccountID contract;
    };

    struct AddCollection
    {
        AccountID collection;
        std::uint64_t floorPrice = 0;
        std::uint8_t riskScore = 0;
    };

    struct UpdateCollection
    {
        AccountID collection;
        std::uint64_t floorPrice = 0;
        std::uint8_t riskScore = 0;
        bool enabled = true;
    };

    struct SetPlatformFee
    {
        std::uint32_t fee = 0;
    };

    struct SetMinCollateralRatio
    {
        std::uint32_t ratio = 0;
    };

    struct SetRateParameters
    {
        RateParameters params;
    };

    using Request = std::variant<
        AddToken,
        RemoveToken,
        AddCollection,
        UpdateCollection,
        SetPlatformFee,
        SetMinCollateralRatio,
        SetRateParameters>;

private:
    Request const& tx_;

public:
    LedgerAdmin(ApplyContext& ctx, Request const& tx)
        : Transactor(ctx), tx_(tx)
    {
    }

    static LER
    preflight(PreflightContext<Request> const& ctx);

    static LER
    preclaim(PreclaimContext<Request> const& ctx);

protected:
    LER
    doApply() override;
};

}  // namespace peerlend

#endif
