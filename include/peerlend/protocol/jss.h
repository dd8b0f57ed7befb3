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

#ifndef PEERLEND_PROTOCOL_JSS_H_INCLUDED
#define PEERLEND_PROTOCOL_JSS_H_INCLUDED

#include <xrpl/json/json_value.h>

namespace peerlend {
namespace jss {

// JSON static strings

#define JSS(x) constexpr ::Json::StaticString x(#x)

/* These "StaticString" field names are used instead of string literals to
   optimize the performance of accessing properties of Json::Value objects.

   Names are kept in alphabetical order.
*/

JSS(active);                  // out: PlatformStats
JSS(active_loans);            // out: AssetUtilization
JSS(base_rate);               // out: PlatformStats
JSS(borrower);                // out: Loan
JSS(collateral_amount);       // out: Loan
JSS(collateral_asset);        // out: Loan
JSS(collection);              // out: Asset
JSS(contract);                // out: Asset
JSS(created_at);              // out: Loan
JSS(custody);                 // out: PlatformStats
JSS(defaults);                // out: UserStats
JSS(due_at);                  // out: Loan
JSS(duration);                // out: Loan
JSS(dynamic_rate);            // out: Loan
JSS(fee);                     // out: RepaymentParts
JSS(fees_collected);          // out: PlatformStats
JSS(funded_at);               // out: Loan
JSS(id);                      // out: Loan
JSS(interest);                // out: RepaymentParts
JSS(interest_rate);           // out: Loan
JSS(item_id);                 // out: Asset
JSS(kind);                    // out: Asset
JSS(lender);                  // out: Loan
JSS(lender_share);            // out: RepaymentParts
JSS(liquidated);              // out: PlatformStats
JSS(loan_asset);              // out: Loan
JSS(loan_counter);            // out: PlatformStats
JSS(loans_created);           // out: UserStats
JSS(loans_funded);            // out: UserStats
JSS(max_duration);            // out: PlatformStats
JSS(max_rate);                // out: PlatformStats
JSS(min_collateral_ratio);    // out: PlatformStats
JSS(min_rate);                // out: PlatformStats
JSS(owner);                   // out: PlatformStats
JSS(pending);                 // out: PlatformStats
JSS(platform_fee);            // out: PlatformStats
JSS(principal);               // out: Loan
JSS(repaid);                  // out: PlatformStats
JSS(repaid_at);               // out: Loan
JSS(reputation);              // out: UserStats
JSS(risk_multiplier);         // out: PlatformStats
JSS(risk_tier);               // out: Loan
JSS(status);                  // out: Loan
JSS(total);                   // out: RepaymentParts
JSS(total_borrowed);          // out: UserStats, AssetUtilization
JSS(total_funded);            // out: PlatformStats
JSS(total_lent);              // out: UserStats
JSS(total_originated);        // out: PlatformStats
JSS(total_supplied);          // out: AssetUtilization
JSS(utilization);             // out: AssetUtilization
JSS(utilization_multiplier);  // out: PlatformStats

#undef JSS

}  // namespace jss
}  // namespace peerlend

#endif
