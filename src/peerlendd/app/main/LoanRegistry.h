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

#ifndef PEERLEND_APP_MAIN_LOANREGISTRY_H_INCLUDED
#define PEERLEND_APP_MAIN_LOANREGISTRY_H_INCLUDED

#include <peerlendd/app/ledger/LedgerState.h>
#include <peerlendd/app/misc/InterestRateEngine.h>
#include <peerlendd/app/misc/TransferService.h>
#include <peerlendd/app/tx/detail/LedgerAdmin.h>
#include <peerlendd/app/tx/detail/LoanCreate.h>

#include <peerlend/protocol/Asset.h>
#include <peerlend/protocol/LER.h>

#include <xrpl/beast/utility/Journal.h>

#include <cstdint>
#include <mutex>

namespace peerlend {

/**
 * Entry point to the lending ledger.
 *
 * Every public member runs as one indivisible operation: a single mutex is
 * held for its duration and the clock is read once. Mutating operations
 * either succeed completely or return the reason they failed and leave the
 * ledger untouched.
 *
 * The caller identity passed to each mutating operation is assumed to be
 * authenticated already.
 */
class LoanRegistry
{
    LedgerState& state_;
    TransferService& transfers_;
    LedgerClock const& clock_;
    beast::Journal const j_;

    mutable std::mutex mutex_;

public:
    LoanRegistry(
        LedgerState& state,
        TransferService& transfers,
        LedgerClock const& clock,
        beast::Journal journal);

    LoanRegistry(LoanRegistry const&) = delete;
    LoanRegistry&
    operator=(LoanRegistry const&) = delete;

    //--------------------------------------------------------------------------
    //
    // Loan lifecycle
    //
    //--------------------------------------------------------------------------

    /** Request a native loan secured by native collateral.

        @param interestRate the rate to charge, or zero for the dynamic rate.
        @return the id of the new loan.
    */
    Expected<std::uint64_t, LER>
    createLoan(
        AccountID const& borrower,
        std::uint64_t principal,
        std::uint64_t collateralAmount,
        std::uint32_t interestRate,
        std::uint32_t maxAcceptableRate,
        LedgerIndex duration);

    /** Request a native loan secured by a whitelisted token. */
    Expected<std::uint64_t, LER>
    createLoanWithTokenCollateral(
        AccountID const& borrower,
        std::uint64_t principal,
        AccountID const& tokenContract,
        std::uint64_t collateralAmount,
        std::uint32_t interestRate,
        std::uint32_t maxAcceptableRate,
        LedgerIndex duration);

    /** Request a native loan secured by one collectible item. The item is
        valued at its collection's floor price.
    */
    Expected<std::uint64_t, LER>
    createLoanWithNftCollateral(
        AccountID const& borrower,
        std::uint64_t principal,
        AccountID const& collection,
        std::uint64_t itemID,
        std::uint32_t interestRate,
        std::uint32_t maxAcceptableRate,
        LedgerIndex duration);

    /** Request a loan of a whitelisted token, secured by any asset. */
    Expected<std::uint64_t, LER>
    createTokenLoan(
        AccountID const& borrower,
        AccountID const& tokenContract,
        std::uint64_t principal,
        Asset const& collateralAsset,
        std::uint64_t collateralAmount,
        std::uint32_t interestRate,
        std::uint32_t maxAcceptableRate,
        LedgerIndex duration);

    Expected<std::uint64_t, LER>
    createLoan(AccountID const& borrower, LoanCreate::Request const& request);

    /** Fund a pending native loan. The principal moves to the borrower. */
    LER
    fundLoan(AccountID const& lender, std::uint64_t loanID);

    /** Fund a pending token loan. Delivery happens outside the ledger. */
    LER
    fundTokenLoan(AccountID const& lender, std::uint64_t loanID);

    /** Settle an active loan.

        @return the total paid by the borrower, principal plus interest.
    */
    Expected<std::uint64_t, LER>
    repayLoan(AccountID const& borrower, std::uint64_t loanID);

    LER
    liquidateLoan(AccountID const& lender, std::uint64_t loanID);

    //--------------------------------------------------------------------------
    //
    // Administration
    //
    //--------------------------------------------------------------------------

    LER
    addSupportedToken(
        AccountID const& caller,
        AccountID const& contract,
        std::uint8_t decimals,
        std::uint8_t riskScore);

    LER
    removeSupportedToken(AccountID const& caller, AccountID const& contract);

    LER
    addSupportedCollection(
        AccountID const& caller,
        AccountID const& collection,
        std::uint64_t floorPrice,
        std::uint8_t riskScore);

    LER
    updateCollection(
        AccountID const& caller,
        AccountID const& collection,
        std::uint64_t floorPrice,
        std::uint8_t riskScore,
        bool enabled);

    LER
    setPlatformFee(AccountID const& caller, std::uint32_t fee);

    LER
    setMinCollateralRatio(AccountID const& caller, std::uint32_t ratio);

    LER
    setDynamicRateParams(
        AccountID const& caller,
        std::uint32_t baseRate,
        std::uint32_t utilizationMultiplier,
        std::uint32_t riskMultiplier,
        std::uint32_t maxRate,
        std::uint32_t minRate);

    //--------------------------------------------------------------------------
    //
    // Reads
    //
    //--------------------------------------------------------------------------

    Expected<LoanEntry, LER>
    getLoan(std::uint64_t loanID) const;

    UserStats
    getUserStats(AccountID const& account) const;

    AssetUtilization
    getAssetUtilization(AssetKey const& key) const;

    /** The rate a new loan of `loanAsset` by `borrower` would be offered. */
    std::uint32_t
    getDynamicRate(
        AccountID const& borrower,
        Asset const& loanAsset,
        std::uint64_t collateralRatio) const;

    PlatformStats
    getPlatformStats() const;

    /** False for unknown, unfunded and closed loans. */
    bool
    isLoanOverdue(std::uint64_t loanID) const;

    /** What repaying the loan right now would cost. */
    Expected<RepaymentParts, LER>
    getRepaymentQuote(std::uint64_t loanID) const;

private:
    template <class T, class OnSuccess>
    LER
    apply(
        AccountID const& account,
        typename T::Request const& request,
        OnSuccess&& onSuccess);

    LER
    admin(AccountID const& caller, LedgerAdmin::Request const& request);

    LER
    fund(AccountID const& lender, std::uint64_t loanID, AssetKind entryPoint);
};

}  // namespace peerlend

#endif
