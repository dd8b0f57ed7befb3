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

#ifndef PEERLEND_APP_MISC_USERSTATSSTORE_H_INCLUDED
#define PEERLEND_APP_MISC_USERSTATSSTORE_H_INCLUDED

#include <peerlend/protocol/Asset.h>

#include <xrpl/json/json_value.h>

#include <cstdint>
#include <map>

namespace peerlend {

/** Lending history of one account. */
struct UserStats
{
    std::uint64_t loansCreated = 0;
    std::uint64_t loansFunded = 0;
    std::uint64_t totalBorrowed = 0;
    std::uint64_t totalLent = 0;

    // Grows by one for every loan created or funded. Never decreases.
    std::uint64_t reputation = 0;

    // Grows by one for every liquidation suffered as borrower.
    std::uint64_t defaults = 0;

    bool
    operator==(UserStats const&) const = default;

    Json::Value
    getJson() const;
};

/** Per-account lending counters. Entries are created on first write and
    never removed.
*/
class UserStatsStore
{
    std::map<AccountID, UserStats> stats_;

public:
    UserStatsStore() = default;

    /** Counters for an account. Unknown accounts read as all zero and are
        not added to the store.
    */
    UserStats
    get(AccountID const& account) const;

    bool
    exists(AccountID const& account) const
    {
        return stats_.find(account) != stats_.end();
    }

    void
    onLoanCreated(AccountID const& borrower);

    /** Record a funding. Lent volume is only tracked for native loans, whose
        principal actually moved through the ledger.
    */
    void
    onLoanFunded(
        AccountID const& lender,
        std::uint64_t principal,
        bool trackVolume);

    void
    onLoanRepaid(AccountID const& borrower, std::uint64_t principal);

    void
    onLoanDefaulted(AccountID const& borrower);

    std::size_t
    size() const
    {
        return stats_.size();
    }

private:
    UserStats&
    peek(AccountID const& account);
};

}  // namespace peerlend

#endif
