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

#ifndef PEERLEND_APP_TX_LOANCREATE_H_INCLUDED
#define PEERLEND_APP_TX_LOANCREATE_H_INCLUDED

#include <peerlendd/app/misc/RiskScorer.h>
#include <peerlendd/app/tx/detail/Transactor.h>

#include <peerlend/protocol/Asset.h>

#include <cstdint>

namespace peerlend {

/** A borrower requests a loan and posts collateral. The loan starts out
    pending until a lender funds it.
*/
class LoanCreate : public Transactor
{
public:
    struct Request
    {
        std::uint64_t principal = 0;
        Asset loanAsset = NativeAsset{};

        Asset collateralAsset = NativeAsset{};
        // Ignored for collectibles, which are valued at their floor price.
        std::uint64_t collateralAmount = 0;

        // Zero selects the dynamic rate.
        std::uint32_t interestRate = 0;
        std::uint32_t maxAcceptableRate = 0;

        LedgerIndex duration = 0;
    };

    /** The derived terms of a request. */
    struct Terms
    {
        std::uint64_t collateralAmount = 0;
        std::uint64_t collateralRatio = 0;
        RiskTier riskTier = RiskTier::medium;
        std::uint32_t dynamicRate = 0;
        std::uint32_t interestRate = 0;
    };

private:
    Request const& tx_;
    std::uint64_t loanID_ = 0;

public:
    LoanCreate(ApplyContext& ctx, Request const& tx) : Transactor(ctx), tx_(tx)
    {
    }

    static LER
    preflight(PreflightContext<Request> const& ctx);

    static LER
    preclaim(PreclaimContext<Request> const& ctx);

    /** Value the collateral, score the borrower and pick the rate.

        Shared by preclaim and doApply so both see the same terms.
    */
    static Expected<Terms, LER>
    computeTerms(
        LedgerState const& view,
        Request const& tx,
        AccountID const& borrower,
        beast::Journal j);

    /** The id assigned to the new loan. Zero until applied. */
    std::uint64_t
    loanID() const
    {
        return loanID_;
    }

protected:
    LER
    doApply() override;
};

}  // namespace peerlend

#endif
