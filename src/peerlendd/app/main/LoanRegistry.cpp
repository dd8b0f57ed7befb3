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

#include <peerlendd/app/main/LoanRegistry.h>
//
#include <peerlendd/app/misc/RiskScorer.h>
#include <peerlendd/app/tx/detail/LoanFund.h>
#include <peerlendd/app/tx/detail/LoanLiquidate.h>
#include <peerlendd/app/tx/detail/LoanRepay.h>

#include <xrpl/basics/Log.h>

#include <utility>

namespace peerlend {

LoanRegistry::LoanRegistry(
    LedgerState& state,
    TransferService& transfers,
    LedgerClock const& clock,
    beast::Journal journal)
    : state_(state), transfers_(transfers), clock_(clock), j_(journal)
{
}

template <class T, class OnSuccess>
LER
LoanRegistry::apply(
    AccountID const& account,
    typename T::Request const& request,
    OnSuccess&& onSuccess)
{
    std::lock_guard lock(mutex_);

    auto const now = clock_.now();

    if (auto const ter = checkRequest<T>(state_, request, account, now, j_);
        !isTesSuccess(ter))
    {
        JLOG(j_.debug()) << "Rejected request from " << toBase58(account)
                         << ": " << transToken(ter);
        return ter;
    }

    ApplyContext ctx(state_, transfers_, account, now, j_);
    T transactor(ctx, request);
    auto const ter = transactor();
    if (isTesSuccess(ter))
        std::forward<OnSuccess>(onSuccess)(transactor);
    return ter;
}

//------------------------------------------------------------------------------

Expected<std::uint64_t, LER>
LoanRegistry::createLoan(
    AccountID const& borrower,
    LoanCreate::Request const& request)
{
    std::uint64_t loanID = 0;
    auto const ter = apply<LoanCreate>(
        borrower, request, [&](LoanCreate const& tx) { loanID = tx.loanID(); });
    if (!isTesSuccess(ter))
        return Unexpected(ter);
    return loanID;
}

Expected<std::uint64_t, LER>
LoanRegistry::createLoan(
    AccountID const& borrower,
    std::uint64_t principal,
    std::uint64_t collateralAmount,
    std::uint32_t interestRate,
    std::uint32_t maxAcceptableRate,
    LedgerIndex duration)
{
    LoanCreate::Request request;
    request.principal = principal;
    request.loanAsset = NativeAsset{};
    request.collateralAsset = NativeAsset{};
    request.collateralAmount = collateralAmount;
    request.interestRate = interestRate;
    request.maxAcceptableRate = maxAcceptableRate;
    request.duration = duration;
    return createLoan(borrower, request);
}

Expected<std::uint64_t, LER>
LoanRegistry::createLoanWithTokenCollateral(
    AccountID const& borrower,
    std::uint64_t principal,
    AccountID const& tokenContract,
    std::uint64_t collateralAmount,
    std::uint32_t interestRate,
    std::uint32_t maxAcceptableRate,
    LedgerIndex duration)
{
    LoanCreate::Request request;
    request.principal = principal;
    request.loanAsset = NativeAsset{};
    request.collateralAsset = TokenAsset{tokenContract};
    request.collateralAmount = collateralAmount;
    request.interestRate = interestRate;
    request.maxAcceptableRate = maxAcceptableRate;
    request.duration = duration;
    return createLoan(borrower, request);
}

Expected<std::uint64_t, LER>
LoanRegistry::createLoanWithNftCollateral(
    AccountID const& borrower,
    std::uint64_t principal,
    AccountID const& collection,
    std::uint64_t itemID,
    std::uint32_t interestRate,
    std::uint32_t maxAcceptableRate,
    LedgerIndex duration)
{
    LoanCreate::Request request;
    request.principal = principal;
    request.loanAsset = NativeAsset{};
    request.collateralAsset = CollectibleAsset{collection, itemID};
    request.interestRate = interestRate;
    request.maxAcceptableRate = maxAcceptableRate;
    request.duration = duration;
    return createLoan(borrower, request);
}

Expected<std::uint64_t, LER>
LoanRegistry::createTokenLoan(
    AccountID const& borrower,
    AccountID const& tokenContract,
    std::uint64_t principal,
    Asset const& collateralAsset,
    std::uint64_t collateralAmount,
    std::uint32_t interestRate,
    std::uint32_t maxAcceptableRate,
    LedgerIndex duration)
{
    LoanCreate::Request request;
    request.principal = principal;
    request.loanAsset = TokenAsset{tokenContract};
    request.collateralAsset = collateralAsset;
    request.collateralAmount = collateralAmount;
    request.interestRate = interestRate;
    request.maxAcceptableRate = maxAcceptableRate;
    request.duration = duration;
    return createLoan(borrower, request);
}

LER
LoanRegistry::fund(
    AccountID const& lender,
    std::uint64_t loanID,
    AssetKind entryPoint)
{
    LoanFund::Request const request{loanID, entryPoint};
    return apply<LoanFund>(lender, request, [](LoanFund const&) {});
}

LER
LoanRegistry::fundLoan(AccountID const& lender, std::uint64_t loanID)
{
    return fund(lender, loanID, AssetKind::native);
}

LER
LoanRegistry::fundTokenLoan(AccountID const& lender, std::uint64_t loanID)
{
    return fund(lender, loanID, AssetKind::token);
}

Expected<std::uint64_t, LER>
LoanRegistry::repayLoan(AccountID const& borrower, std::uint64_t loanID)
{
    std::uint64_t total = 0;
    LoanRepay::Request const request{loanID};
    auto const ter = apply<LoanRepay>(
        borrower, request, [&](LoanRepay const& tx) {
            total = tx.parts().total;
        });
    if (!isTesSuccess(ter))
        return Unexpected(ter);
    return total;
}

LER
LoanRegistry::liquidateLoan(AccountID const& lender, std::uint64_t loanID)
{
    LoanLiquidate::Request const request{loanID};
    return apply<LoanLiquidate>(lender, request, [](LoanLiquidate const&) {});
}

//------------------------------------------------------------------------------

LER
LoanRegistry::admin(
    AccountID const& caller,
    LedgerAdmin::Request const& request)
{
    return apply<LedgerAdmin>(caller, request, [](LedgerAdmin const&) {});
}

LER
LoanRegistry::addSupportedToken(
    AccountID const& caller,
    AccountID const& contract,
    std::uint8_t decimals,
    std::uint8_t riskScore)
{
    return admin(caller, LedgerAdmin::AddToken{contract, decimals, riskScore});
}

LER
LoanRegistry::removeSupportedToken(
    AccountID const& caller,
    AccountID const& contract)
{
    return admin(caller, LedgerAdmin::RemoveToken{contract});
}

LER
LoanRegistry::addSupportedCollection(
    AccountID const& caller,
    AccountID const& collection,
    std::uint64_t floorPrice,
    std::uint8_t riskScore)
{
    return admin(
        caller, LedgerAdmin::AddCollection{collection, floorPrice, riskScore});
}

LER
LoanRegistry::updateCollection(
    AccountID const& caller,
    AccountID const& collection,
    std::uint64_t floorPrice,
    std::uint8_t riskScore,
    bool enabled)
{
    return admin(
        caller,
        LedgerAdmin::UpdateCollection{
            collection, floorPrice, riskScore, enabled});
}

LER
LoanRegistry::setPlatformFee(AccountID const& caller, std::uint32_t fee)
{
    return admin(caller, LedgerAdmin::SetPlatformFee{fee});
}

LER
LoanRegistry::setMinCollateralRatio(
    AccountID const& caller,
    std::uint32_t ratio)
{
    return admin(caller, LedgerAdmin::SetMinCollateralRatio{ratio});
}

LER
LoanRegistry::setDynamicRateParams(
    AccountID const& caller,
    std::uint32_t baseRate,
    std::uint32_t utilizationMultiplier,
    std::uint32_t riskMultiplier,
    std::uint32_t maxRate,
    std::uint32_t minRate)
{
    RateParameters params;
    params.baseRate = baseRate;
    params.utilizationMultiplier = utilizationMultiplier;
    params.riskMultiplier = riskMultiplier;
    params.minRate = minRate;
    params.maxRate = maxRate;
    return admin(caller, LedgerAdmin::SetRateParameters{params});
}

//------------------------------------------------------------------------------

Expected<LoanEntry, LER>
LoanRegistry::getLoan(std::uint64_t loanID) const
{
    std::lock_guard lock(mutex_);
    auto const loan = state_.read(loanID);
    if (!loan)
        return Unexpected(tecNO_ENTRY);
    return *loan;
}

UserStats
LoanRegistry::getUserStats(AccountID const& account) const
{
    std::lock_guard lock(mutex_);
    return state_.userStats().get(account);
}

AssetUtilization
LoanRegistry::getAssetUtilization(AssetKey const& key) const
{
    std::lock_guard lock(mutex_);
    return state_.utilization().get(key);
}

std::uint32_t
LoanRegistry::getDynamicRate(
    AccountID const& borrower,
    Asset const& loanAsset,
    std::uint64_t collateralRatio) const
{
    std::lock_guard lock(mutex_);
    // A prospective borrower has no collateral on the ledger yet.
    auto const tier = RiskScorer(state_.userStats())
                          .score(borrower, AssetKind::native, std::nullopt);
    return InterestRateEngine(state_.utilization(), state_.config().rates)
        .computeRate(AssetKey(loanAsset), tier, collateralRatio);
}

PlatformStats
LoanRegistry::getPlatformStats() const
{
    std::lock_guard lock(mutex_);
    return state_.getPlatformStats();
}

bool
LoanRegistry::isLoanOverdue(std::uint64_t loanID) const
{
    std::lock_guard lock(mutex_);
    auto const loan = state_.read(loanID);
    return loan && loan->isOverdue(clock_.now());
}

Expected<RepaymentParts, LER>
LoanRegistry::getRepaymentQuote(std::uint64_t loanID) const
{
    std::lock_guard lock(mutex_);
    auto const loan = state_.read(loanID);
    if (!loan)
        return Unexpected(tecNO_ENTRY);
    return LoanRepay::quote(*loan, clock_.now(), state_.config().platformFee);
}

}  // namespace peerlend
