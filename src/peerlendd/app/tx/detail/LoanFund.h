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

#ifndef PEERLEND_APP_TX_LOANFUND_H_INCLUDED
#define PEERLEND_APP_TX_LOANFUND_H_INCLUDED

#include <peerlendd/app/tx/detail/Transactor.h>

#include <peerlend/protocol/Asset.h>

#include <cstdint>

namespace peerlend {

/** A lender takes up a pending loan, which becomes active. */
class LoanFund : public Transactor
{
public:
    struct Request
    {
        std::uint64_t loanID = 0;

        // The kind of loan asset the caller expects to provide. Native and
        // token loans are funded through separate entry points.
        AssetKind entryPoint = AssetKind::native;
    };

private:
    Request const& tx_;

public:
    LoanFund(ApplyContext& ctx, Request const& tx) : Transactor(ctx), tx_(tx)
    {
    }

    static LER
    preflight(PreflightContext<Request> const& ctx);

    static LER
    preclaim(PreclaimContext<Request> const& ctx);

protected:
    LER
    doApply() override;
};

}  // namespace peerlend

#endif
