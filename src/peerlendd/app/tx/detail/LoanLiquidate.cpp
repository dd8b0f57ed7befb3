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

#include <peerlendd/app/tx/detail/LoanLiquidate.h>

#include <xrpl/basics/Log.h>

namespace peerlend {

LER
LoanLiquidate::preflight(PreflightContext<Request> const&)
{
    return tesSUCCESS;
}

LER
LoanLiquidate::preclaim(PreclaimContext<Request> const& ctx)
{
    auto const loan = ctx.view.read(ctx.tx.loanID);
    if (!loan)
    {
        JLOG(ctx.j.warn()) << "LoanLiquidate: loan " << ctx.tx.loanID
                           << " does not exist.";
        return tecNO_ENTRY;
    }

    if (loan->lender != ctx.account)
    {
        JLOG(ctx.j.warn()) << "LoanLiquidate: loan " << loan->id
                           << " can only be liquidated by its lender.";
        return tecNO_PERMISSION;
    }

    if (loan->status != LoanStatus::active)
    {
        JLOG(ctx.j.warn()) << "LoanLiquidate: loan " << loan->id << " is "
                           << to_string(loan->status) << ".";
        return tecLOAN_NOT_ACTIVE;
    }

    if (!loan->isOverdue(ctx.now))
    {
        JLOG(ctx.j.warn()) << "LoanLiquidate: loan " << loan->id
                           << " is not due until "
                           << loan->dueAt().value_or(0) << ".";
        return tecNOT_OVERDUE;
    }

    return tesSUCCESS;
}

LER
LoanLiquidate::doApply()
{
    auto& view = this->view();

    auto const loan = view.peek(tx_.loanID);
    if (!loan)
        return tefBAD_LEDGER;  // LCOV_EXCL_LINE

    TransferBatch batch(j_);
    if (kindOf(loan->collateralAsset) == AssetKind::native)
    {
        batch.add(loan->collateralAmount, view.config().custody, account_);
    }
    else
    {
        JLOG(j_.debug()) << "LoanLiquidate: seizure of "
                         << to_string(loan->collateralAsset)
                         << " is left to the asset contract.";
    }

    if (auto const ter = applyTransfers(batch); !isTesSuccess(ter))
        return ter;

    view.utilization().update(
        AssetKey(loan->loanAsset), 0, loan->principal, 1, false);

    loan->status = LoanStatus::liquidated;
    loan->repaidAt = ctx_.now;

    view.userStats().onLoanDefaulted(loan->borrower);

    JLOG(j_.debug()) << "LoanLiquidate: loan " << loan->id
                     << " liquidated, borrower " << toBase58(loan->borrower)
                     << " defaulted";
    return tesSUCCESS;
}

}  // namespace peerlend
