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

#ifndef PEERLEND_APP_MISC_TRANSFERBATCH_H_INCLUDED
#define PEERLEND_APP_MISC_TRANSFERBATCH_H_INCLUDED

#include <peerlendd/app/misc/TransferService.h>

#include <xrpl/beast/utility/Journal.h>

#include <cstdint>
#include <vector>

namespace peerlend {

/**
 * A group of native transfers that happen together or not at all.
 *
 * Legs are applied in the order they were added. If one fails, the legs
 * already applied are reversed, newest first, and the failure is reported.
 * If a reversal fails too the ledger no longer matches the balances, and
 * apply() returns tefBAD_LEDGER.
 */
class TransferBatch
{
public:
    struct Leg
    {
        std::uint64_t amount;
        AccountID from;
        AccountID to;
    };

private:
    std::vector<Leg> legs_;
    beast::Journal const j_;

public:
    explicit TransferBatch(beast::Journal journal) : j_(journal)
    {
    }

    /** Queue a transfer. Zero amounts and transfers to oneself are dropped. */
    void
    add(std::uint64_t amount, AccountID const& from, AccountID const& to);

    bool
    empty() const
    {
        return legs_.empty();
    }

    std::vector<Leg> const&
    legs() const
    {
        return legs_;
    }

    /** Run every queued leg through the service.

        @return tesSUCCESS if all legs applied, tecTRANSFER_FAILED if a leg
                failed and the earlier ones were reversed, tefBAD_LEDGER if a
                reversal failed.
    */
    LER
    apply(TransferService& service) const;
};

}  // namespace peerlend

#endif
