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

#ifndef PEERLEND_APP_LEDGER_LOANENTRY_H_INCLUDED
#define PEERLEND_APP_LEDGER_LOANENTRY_H_INCLUDED

#include <peerlendd/app/misc/RiskScorer.h>

#include <peerlend/protocol/Asset.h>
#include <peerlend/protocol/Protocol.h>

#include <xrpl/json/json_value.h>

#include <cstdint>
#include <optional>
#include <string>

namespace peerlend {

/** Lifecycle of a loan.

    Pending -> Active -> Repaid
                      -> Liquidated

    Repaid and Liquidated are terminal.
*/
enum class LoanStatus : std::uint8_t {
    pending = 0,
    active = 1,
    repaid = 2,
    liquidated = 3,
};

std::string
to_string(LoanStatus status);

/** One loan, from request to settlement. Loans are never erased. */
struct LoanEntry
{
    std::uint64_t id = 0;

    AccountID borrower;
    std::optional<AccountID> lender;

    std::uint64_t principal = 0;
    Asset loanAsset;

    // For collectibles this is the collection floor price when the loan was
    // requested.
    std::uint64_t collateralAmount = 0;
    Asset collateralAsset;

    std::uint32_t interestRate = 0;
    LedgerIndex duration = 0;

    LedgerIndex createdAt = 0;
    std::optional<LedgerIndex> fundedAt;

    // Set when the loan is repaid or liquidated.
    std::optional<LedgerIndex> repaidAt;

    LoanStatus status = LoanStatus::pending;

    // Snapshots taken at creation.
    RiskTier riskTier = RiskTier::medium;
    std::uint32_t dynamicRate = 0;

    /** The first ledger at which an active loan may be liquidated. */
    std::optional<LedgerIndex>
    dueAt() const;

    bool
    isOverdue(LedgerIndex now) const;

    Json::Value
    getJson() const;
};

}  // namespace peerlend

#endif
