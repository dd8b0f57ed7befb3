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

#include <peerlendd/app/tx/detail/Transactor.h>

#include <xrpl/basics/Log.h>

namespace peerlend {

ApplyContext::ApplyContext(
    LedgerState& view,
    TransferService& transfers,
    AccountID const& account_,
    LedgerIndex now_,
    beast::Journal journal_)
    : view_(view)
    , transfers_(transfers)
    , account(account_)
    , now(now_)
    , journal(journal_)
{
}

//------------------------------------------------------------------------------

Transactor::Transactor(ApplyContext& ctx)
    : ctx_(ctx), j_(ctx.journal), account_(ctx.account)
{
}

LER
Transactor::applyTransfers(TransferBatch const& batch)
{
    if (batch.empty())
        return tesSUCCESS;
    return batch.apply(ctx_.transfers());
}

LER
Transactor::operator()()
{
    JLOG(j_.trace()) << "apply: account " << toBase58(account_)
                     << " at ledger " << ctx_.now;

    auto const result = doApply();

    if (isTesSuccess(result))
    {
        JLOG(j_.debug()) << "apply: " << transToken(result);
    }
    else if (isTefFailure(result))
    {
        JLOG(j_.fatal()) << "apply: " << transToken(result) << ", "
                         << transHuman(result);
    }
    else
    {
        JLOG(j_.warn()) << "apply: " << transToken(result) << ", "
                        << transHuman(result);
    }
    return result;
}

}  // namespace peerlend
