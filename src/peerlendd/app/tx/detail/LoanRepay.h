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

#ifndef PEERLEND_APP_TX_LOANREPAY_H_INCLUDED
#define PEERLEND_APP_TX_LOANREPAY_H_INCLUDED

#include <peerlendd/app/misc/InterestRateEngine.h>
#include <peerlendd/app/tx/detail/Transactor.h>

#include <cstdint>

namespace peerlend {

/** The borrower settles an active loan: principal plus accrued interest,
    less the platform fee, to the lender. Native collateral is released.
*/
class LoanRepay : public Transactor
{
public:
    struct Request
    {
        std::uint64_t loanID = 0;
    };

private:
    Request const& tx_;
    RepaymentParts parts_;

public:
    LoanRepay(ApplyContext& ctx, Request const& tx) : Transactor(ctx), tx_(tx)
    {
    }

    static LER
    preflight(PreflightContext<Request> const& ctx);

    static LER
    preclaim(PreclaimContext<Request> const& ctx);

    /** What settling the loan at `now` costs the borrower. */
    static Expected<RepaymentParts, LER>
    quote(LoanEntry const& loan, LedgerIndex now, std::uint32_t platformFee);

    /** The amounts paid. Valid once applied. */
    RepaymentParts const&
    parts() const
    {
        return parts_;
    }

protected:
    LER
    doApply() override;
};

}  // namespace peerlend

#endif
