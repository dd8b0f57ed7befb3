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

#include <peerlendd/app/tx/detail/LoanRepay.h>

#include <xrpl/basics/Log.h>

namespace peerlend {

Expected<RepaymentParts, LER>
LoanRepay::quote(
    LoanEntry const& loan,
    LedgerIndex now,
    std::uint32_t platformFee)
{
    if (loan.status == LoanStatus::pending)
        return Unexpected(tecLOAN_NOT_FUNDED);
    if (loan.status != LoanStatus::active)
        return Unexpected(tecLOAN_NOT_ACTIVE);
    if (!loan.fundedAt)
        return Unexpected(tefBAD_LEDGER);  // LCOV_EXCL_LINE

    LedgerIndex const elapsed = now > *loan.fundedAt ? now - *loan.fundedAt : 0;
    return computeRepayment(
        loan.principal, loan.interestRate, elapsed, loan.duration, platformFee);
}

LER
LoanRepay::preflight(PreflightContext<Request> const&)
{
    return tesSUCCESS;
}

LER
LoanRepay::preclaim(PreclaimContext<Request> const& ctx)
{
    auto const loan = ctx.view.read(ctx.tx.loanID);
    if (!loan)
    {
        JLOG(ctx.j.warn()) << "LoanRepay: loan " << ctx.tx.loanID
                           << " does not exist.";
        return tecNO_ENTRY;
    }

    if (loan->borrower != ctx.account)
    {
        JLOG(ctx.j.warn()) << "LoanRepay: only the borrower can repay loan "
                           << loan->id << ".";
        return tecNO_PERMISSION;
    }

    if (loan->status != LoanStatus::active)
    {
        JLOG(ctx.j.warn()) << "LoanRepay: loan " << loan->id << " is "
                           << to_string(loan->status) << ".";
        return tecLOAN_NOT_ACTIVE;
    }

    auto const parts = quote(*loan, ctx.now, ctx.view.config().platformFee);
    if (!parts)
    {
        JLOG(ctx.j.error()) << "LoanRepay: unable to compute repayment for "
                            << loan->id << ": " << transToken(parts.error());
        return parts.error();
    }

    return tesSUCCESS;
}

LER
LoanRepay::doApply()
{
    auto& view = this->view();
    auto const& config = view.config();

    auto const loan = view.peek(tx_.loanID);
    if (!loan || !loan->lender)
        return tefBAD_LEDGER;  // LCOV_EXCL_LINE

    auto const parts = quote(*loan, ctx_.now, config.platformFee);
    if (!parts)
        return tefINTERNAL;  // LCOV_EXCL_LINE

    TransferBatch batch(j_);
    if (kindOf(loan->loanAsset) == AssetKind::native)
    {
        batch.add(parts->lenderShare, account_, *loan->lender);
        batch.add(parts->fee, account_, config.owner);
    }
    else
    {
        JLOG(j_.debug()) << "LoanRepay: repayment of " << parts->total << " "
                         << to_string(loan->loanAsset)
                         << " is left to the asset contract.";
    }

    if (kindOf(loan->collateralAsset) == AssetKind::native)
    {
        batch.add(loan->collateralAmount, config.custody, account_);
    }
    else
    {
        JLOG(j_.debug()) << "LoanRepay: release of "
                         << to_string(loan->collateralAsset)
                         << " is left to the asset contract.";
    }

    if (auto const ter = applyTransfers(batch); !isTesSuccess(ter))
        return ter;

    view.utilization().update(
        AssetKey(loan->loanAsset), 0, loan->principal, 1, false);

    loan->status = LoanStatus::repaid;
    loan->repaidAt = ctx_.now;

    view.userStats().onLoanRepaid(account_, loan->principal);
    view.recordFee(parts->fee);

    parts_ = *parts;

    JLOG(j_.debug()) << "LoanRepay: loan " << loan->id << " repaid, interest "
                     << parts->interest << ", fee " << parts->fee
                     << ", total " << parts->total;
    return tesSUCCESS;
}

}  // namespace peerlend
