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

#ifndef PEERLEND_APP_MISC_TRANSFERSERVICE_H_INCLUDED
#define PEERLEND_APP_MISC_TRANSFERSERVICE_H_INCLUDED

#include <peerlend/protocol/Asset.h>
#include <peerlend/protocol/LER.h>
#include <peerlend/protocol/Protocol.h>

#include <cstdint>

namespace peerlend {

/** Moves native value between accounts.

    The ledger does not hold balances itself. Every native movement (posting
    collateral, funding, repayment, returning or seizing collateral) goes
    through this interface.
*/
class TransferService
{
public:
    virtual ~TransferService() = default;

    /** Move `amount` from one account to another.

        @return tesSUCCESS, or the reason the movement did not happen. A
                failed transfer must leave both balances untouched.
    */
    virtual LER
    transfer(
        std::uint64_t amount,
        AccountID const& from,
        AccountID const& to) = 0;
};

/** Source of the current ledger sequence. Never decreases. */
class LedgerClock
{
public:
    virtual ~LedgerClock() = default;

    virtual LedgerIndex
    now() const = 0;
};

}  // namespace peerlend

#endif
