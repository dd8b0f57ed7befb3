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

#include <peerlendd/app/tx/detail/LoanFund.h>

#include <xrpl/basics/Log.h>

namespace peerlend {

LER
LoanFund::preflight(PreflightContext<Request> const& ctx)
{
    if (ctx.tx.entryPoint == AssetKind::collectible)
    {
        JLOG(ctx.j.warn()) << "LoanFund: collectibles can not be lent.";
        return temINVALID_COLLATERAL_TYPE;
    }
    return tesSUCCESS;
}

LER
LoanFund::preclaim(PreclaimContext<Request> const& ctx)
{
    auto const loan = ctx.view.read(ctx.tx.loanID);
    if (!loan)
    {
        JLOG(ctx.j.warn()) << "LoanFund: loan " << ctx.tx.loanID
                           << " does not exist.";
        return tecNO_ENTRY;
    }

    if (loan->status != LoanStatus::pending)
    {
        JLOG(ctx.j.warn()) << "LoanFund: loan " << loan->id << " is "
                           << to_string(loan->status) << ".";
        return tecALREADY_FUNDED;
    }

    if (loan->borrower == ctx.account)
    {
        JLOG(ctx.j.warn()) << "LoanFund: a borrower can not fund their own "
                              "loan.";
        return tecNO_PERMISSION;
    }

    if (kindOf(loan->loanAsset) != ctx.tx.entryPoint)
    {
        JLOG(ctx.j.warn()) << "LoanFund: loan " << loan->id << " lends "
                           << to_string(loan->loanAsset) << ", not "
                           << to_string(ctx.tx.entryPoint) << ".";
        return tecUNSUPPORTED_ASSET;
    }

    return tesSUCCESS;
}

LER
LoanFund::doApply()
{
    auto& view = this->view();

    auto const loan = view.peek(tx_.loanID);
    if (!loan)
        return tefBAD_LEDGER;  // LCOV_EXCL_LINE

    bool const native = kindOf(loan->loanAsset) == AssetKind::native;

    TransferBatch batch(j_);
    if (native)
        batch.add(loan->principal, account_, loan->borrower);
    if (auto const ter = applyTransfers(batch); !isTesSuccess(ter))
        return ter;

    if (!native)
    {
        JLOG(j_.debug()) << "LoanFund: delivery of " << loan->principal
                         << " " << to_string(loan->loanAsset)
                         << " is left to the asset contract.";
    }

    view.utilization().update(
        AssetKey(loan->loanAsset), loan->principal, 0, 0, true);

    loan->status = LoanStatus::active;
    loan->fundedAt = ctx_.now;
    loan->lender = account_;

    view.userStats().onLoanFunded(account_, loan->principal, native);
    view.recordFunded(loan->principal);

    JLOG(j_.debug()) << "LoanFund: loan " << loan->id << " funded by "
                     << toBase58(account_) << ", due at "
                     << loan->dueAt().value_or(0);
    return tesSUCCESS;
}

}  // namespace peerlend
