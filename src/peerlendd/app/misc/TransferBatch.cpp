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

#include <peerlendd/app/misc/TransferBatch.h>

#include <xrpl/basics/Log.h>

namespace peerlend {

void
TransferBatch::add(
    std::uint64_t amount,
    AccountID const& from,
    AccountID const& to)
{
    if (amount == 0 || from == to)
        return;
    legs_.push_back({amount, from, to});
}

LER
TransferBatch::apply(TransferService& service) const
{
    for (std::size_t i = 0; i < legs_.size(); ++i)
    {
        auto const& leg = legs_[i];
        auto const ter = service.transfer(leg.amount, leg.from, leg.to);
        if (isTesSuccess(ter))
            continue;

        JLOG(j_.warn()) << "Transfer of " << leg.amount << " from "
                        << toBase58(leg.from) << " to " << toBase58(leg.to)
                        << " failed: " << transToken(ter);

        // Put back what already moved.
        for (auto j = i; j-- > 0;)
        {
            auto const& done = legs_[j];
            auto const undo = service.transfer(done.amount, done.to, done.from);
            if (!isTesSuccess(undo))
            {
                JLOG(j_.fatal())
                    << "Unable to reverse transfer of " << done.amount
                    << " from " << toBase58(done.from) << " to "
                    << toBase58(done.to) << ": " << transToken(undo);
                return tefBAD_LEDGER;
            }
        }
        return tecTRANSFER_FAILED;
    }

    return tesSUCCESS;
}

}  // namespace peerlend
