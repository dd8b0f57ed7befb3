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

#include <peerlendd/app/tx/detail/LoanCreate.h>
//
#include <peerlendd/app/misc/InterestRateEngine.h>

#include <xrpl/basics/Log.h>

namespace peerlend {

static LER
checkAssetReference(Asset const& asset)
{
    if (auto const ref = referenceOf(asset); ref && *ref == beast::zero)
        return temINVALID_TOKEN_CONTRACT;
    return tesSUCCESS;
}

LER
LoanCreate::preflight(PreflightContext<Request> const& ctx)
{
    auto const& tx = ctx.tx;

    if (tx.principal == 0)
    {
        JLOG(ctx.j.warn()) << "LoanCreate: principal must be positive.";
        return temINVALID_AMOUNT;
    }

    if (tx.duration == 0 || tx.duration > ctx.config.maxDuration)
    {
        JLOG(ctx.j.warn()) << "LoanCreate: duration " << tx.duration
                           << " outside (0, " << ctx.config.maxDuration
                           << "].";
        return temINVALID_DURATION;
    }

    // Collectibles can secure a loan but cannot be lent.
    if (kindOf(tx.loanAsset) == AssetKind::collectible)
    {
        JLOG(ctx.j.warn()) << "LoanCreate: collectibles can not be lent.";
        return temINVALID_COLLATERAL_TYPE;
    }

    auto const& rates = ctx.config.rates;
    if (tx.interestRate != 0 &&
        (tx.interestRate < rates.minRate || tx.interestRate > rates.maxRate))
    {
        JLOG(ctx.j.warn()) << "LoanCreate: interest rate " << tx.interestRate
                           << " outside [" << rates.minRate << ", "
                           << rates.maxRate << "].";
        return temINVALID_INTEREST;
    }

    if (tx.maxAcceptableRate == 0)
    {
        JLOG(ctx.j.warn()) << "LoanCreate: no acceptable rate given.";
        return temINVALID_INTEREST;
    }

    if (kindOf(tx.collateralAsset) != AssetKind::collectible &&
        tx.collateralAmount == 0)
    {
        JLOG(ctx.j.warn()) << "LoanCreate: collateral must be positive.";
        return temINVALID_AMOUNT;
    }

    if (auto const ter = checkAssetReference(tx.loanAsset); !isTesSuccess(ter))
    {
        JLOG(ctx.j.warn()) << "LoanCreate: loan asset has no contract.";
        return ter;
    }

    if (auto const ter = checkAssetReference(tx.collateralAsset);
        !isTesSuccess(ter))
    {
        JLOG(ctx.j.warn()) << "LoanCreate: collateral asset has no contract.";
        return ter;
    }

    return tesSUCCESS;
}

Expected<LoanCreate::Terms, LER>
LoanCreate::computeTerms(
    LedgerState const& view,
    Request const& tx,
    AccountID const& borrower,
    beast::Journal j)
{
    Terms terms;

    if (auto const* item = std::get_if<CollectibleAsset>(&tx.collateralAsset))
    {
        auto const info = view.assets().collection(item->collection);
        if (!info)
            return Unexpected(tecNO_ENTRY);  // LCOV_EXCL_LINE
        terms.collateralAmount = info->floorPrice;
    }
    else
    {
        terms.collateralAmount = tx.collateralAmount;
    }

    if (terms.collateralAmount == 0)
    {
        JLOG(j.warn()) << "LoanCreate: collateral has no value.";
        return Unexpected(tecINSUFFICIENT_COLLATERAL);
    }

    auto const& config = view.config();
    terms.collateralRatio =
        collateralRatio(terms.collateralAmount, tx.principal);
    if (terms.collateralRatio < config.minCollateralRatio)
    {
        JLOG(j.warn()) << "LoanCreate: collateral ratio "
                       << terms.collateralRatio << " below minimum "
                       << config.minCollateralRatio << ".";
        return Unexpected(tecINSUFFICIENT_COLLATERAL);
    }

    terms.riskTier = RiskScorer(view.userStats())
                         .score(
                             borrower,
                             kindOf(tx.collateralAsset),
                             referenceOf(tx.collateralAsset));

    terms.dynamicRate = InterestRateEngine(view.utilization(), config.rates)
                            .computeRate(
                                AssetKey(tx.loanAsset),
                                terms.riskTier,
                                terms.collateralRatio);

    terms.interestRate =
        tx.interestRate != 0 ? tx.interestRate : terms.dynamicRate;

    if (terms.interestRate > tx.maxAcceptableRate)
    {
        JLOG(j.warn()) << "LoanCreate: rate " << terms.interestRate
                       << " exceeds the acceptable " << tx.maxAcceptableRate
                       << ".";
        return Unexpected(tecRATE_REJECTED);
    }

    return terms;
}

LER
LoanCreate::preclaim(PreclaimContext<Request> const& ctx)
{
    auto const& tx = ctx.tx;
    auto const& assets = ctx.view.assets();

    if (auto const ter = assets.checkUsable(tx.loanAsset, ctx.j);
        !isTesSuccess(ter))
        return ter;

    if (auto const ter = assets.checkUsable(tx.collateralAsset, ctx.j);
        !isTesSuccess(ter))
        return ter;

    if (auto const terms = computeTerms(ctx.view, tx, ctx.account, ctx.j);
        !terms)
        return terms.error();

    return tesSUCCESS;
}

LER
LoanCreate::doApply()
{
    auto& view = this->view();

    auto const terms = computeTerms(view, tx_, account_, j_);
    if (!terms)
    {
        // LCOV_EXCL_START
        JLOG(j_.fatal()) << "LoanCreate: terms changed after preclaim.";
        return tefINTERNAL;
        // LCOV_EXCL_STOP
    }

    // Move value first: nothing below can fail.
    TransferBatch batch(j_);
    if (kindOf(tx_.collateralAsset) == AssetKind::native)
        batch.add(terms->collateralAmount, account_, view.config().custody);
    if (auto const ter = applyTransfers(batch); !isTesSuccess(ter))
        return ter;

    if (kindOf(tx_.collateralAsset) != AssetKind::native)
    {
        JLOG(j_.debug()) << "LoanCreate: custody of "
                         << to_string(tx_.collateralAsset)
                         << " is left to the asset contract.";
    }

    view.utilization().update(
        AssetKey(tx_.loanAsset), 0, tx_.principal, 1, true);

    LoanEntry loan;
    loan.borrower = account_;
    loan.principal = tx_.principal;
    loan.loanAsset = tx_.loanAsset;
    loan.collateralAmount = terms->collateralAmount;
    loan.collateralAsset = tx_.collateralAsset;
    loan.interestRate = terms->interestRate;
    loan.duration = tx_.duration;
    loan.createdAt = ctx_.now;
    loan.status = LoanStatus::pending;
    loan.riskTier = terms->riskTier;
    loan.dynamicRate = terms->dynamicRate;

    loanID_ = view.insert(std::move(loan));
    view.userStats().onLoanCreated(account_);

    JLOG(j_.debug()) << "LoanCreate: loan " << loanID_ << " for "
                     << tx_.principal << " at " << terms->interestRate
                     << " bps, risk " << to_string(terms->riskTier);
    return tesSUCCESS;
}

}  // namespace peerlend
