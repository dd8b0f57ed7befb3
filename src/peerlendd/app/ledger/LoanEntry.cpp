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

#include <peerlendd/app/ledger/LoanEntry.h>

#include <peerlend/protocol/jss.h>

#include <limits>

namespace peerlend {

std::string
to_string(LoanStatus status)
{
    switch (status)
    {
        case LoanStatus::pending:
            return "pending";
        case LoanStatus::active:
            return "active";
        case LoanStatus::repaid:
            return "repaid";
        case LoanStatus::liquidated:
            return "liquidated";
    }
    return "unknown";  // LCOV_EXCL_LINE
}

std::optional<LedgerIndex>
LoanEntry::dueAt() const
{
    if (!fundedAt)
        return std::nullopt;
    // Saturate. A due ledger past the end of the sequence is never reached.
    if (*fundedAt > std::numeric_limits<LedgerIndex>::max() - duration)
        return std::numeric_limits<LedgerIndex>::max();
    return *fundedAt + duration;
}

bool
LoanEntry::isOverdue(LedgerIndex now) const
{
    if (status != LoanStatus::active)
        return false;
    auto const due = dueAt();
    return due && now >= *due;
}

Json::Value
LoanEntry::getJson() const
{
    Json::Value ret(Json::objectValue);
    ret[jss::id] = std::to_string(id);
    ret[jss::borrower] = toBase58(borrower);
    if (lender)
        ret[jss::lender] = toBase58(*lender);
    ret[jss::principal] = std::to_string(principal);
    ret[jss::loan_asset] = peerlend::getJson(loanAsset);
    ret[jss::collateral_amount] = std::to_string(collateralAmount);
    ret[jss::collateral_asset] = peerlend::getJson(collateralAsset);
    ret[jss::interest_rate] = interestRate;
    ret[jss::duration] = duration;
    ret[jss::created_at] = createdAt;
    if (fundedAt)
        ret[jss::funded_at] = *fundedAt;
    if (auto const due = dueAt())
        ret[jss::due_at] = *due;
    if (repaidAt)
        ret[jss::repaid_at] = *repaidAt;
    ret[jss::status] = to_string(status);
    ret[jss::risk_tier] = to_string(riskTier);
    ret[jss::dynamic_rate] = dynamicRate;
    return ret;
}

}  // namespace peerlend
