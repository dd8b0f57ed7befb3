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

#ifndef PEERLEND_APP_TX_TRANSACTOR_H_INCLUDED
#define PEERLEND_APP_TX_TRANSACTOR_H_INCLUDED

#include <peerlendd/app/ledger/LedgerState.h>
#include <peerlendd/app/misc/TransferBatch.h>
#include <peerlendd/app/misc/TransferService.h>
#include <peerlendd/core/LedgerConfig.h>

#include <peerlend/protocol/LER.h>

#include <xrpl/beast/utility/Journal.h>

namespace peerlend {

/** State information when preflighting a request.

    Only the request, the caller and the configuration are visible. Checks
    made here do not depend on any loan or ledger entry.
*/
template <class Request>
struct PreflightContext
{
    Request const& tx;
    AccountID const& account;
    LedgerConfig const& config;
    beast::Journal const j;
};

/** State information when determining if a request is likely to succeed.

    The ledger may be read but not written.
*/
template <class Request>
struct PreclaimContext
{
    LedgerState const& view;
    Request const& tx;
    AccountID const& account;
    LedgerIndex const now;
    beast::Journal const j;
};

/** State and services available while applying a request. */
class ApplyContext
{
    LedgerState& view_;
    TransferService& transfers_;

public:
    AccountID const account;
    LedgerIndex const now;
    beast::Journal const journal;

    ApplyContext(
        LedgerState& view,
        TransferService& transfers,
        AccountID const& account,
        LedgerIndex now,
        beast::Journal journal);

    LedgerState&
    view()
    {
        return view_;
    }

    TransferService&
    transfers()
    {
        return transfers_;
    }
};

//------------------------------------------------------------------------------

/**
 * Base class for the ledger operations.
 *
 * Every operation is split in three steps:
 *
 *   - static preflight(PreflightContext const&): stateless checks on the
 *     request itself,
 *   - static preclaim(PreclaimContext const&): read-only checks against the
 *     ledger,
 *   - doApply(): moves value and writes the ledger.
 *
 * doApply() only runs once both checks returned tesSUCCESS. Its single
 * fallible step is the native transfer, which must happen before anything
 * is written so that a failure leaves the ledger exactly as it was.
 */
class Transactor
{
protected:
    ApplyContext& ctx_;
    beast::Journal const j_;

    AccountID const account_;

    explicit Transactor(ApplyContext& ctx);

public:
    virtual ~Transactor() = default;

    Transactor(Transactor const&) = delete;
    Transactor&
    operator=(Transactor const&) = delete;

    /** Apply the operation. Validation must already have passed. */
    LER
    operator()();

protected:
    virtual LER
    doApply() = 0;

    /** Move the batched native value. On failure nothing has moved. */
    LER
    applyTransfers(TransferBatch const& batch);

    LedgerState&
    view()
    {
        return ctx_.view();
    }
};

/** Run preflight and then, if it passed, preclaim for transactor type T. */
template <class T>
LER
checkRequest(
    LedgerState const& view,
    typename T::Request const& tx,
    AccountID const& account,
    LedgerIndex now,
    beast::Journal j)
{
    PreflightContext<typename T::Request> const pfctx{
        tx, account, view.config(), j};
    if (auto const ter = T::preflight(pfctx); !isTesSuccess(ter))
        return ter;

    PreclaimContext<typename T::Request> const pcctx{
        view, tx, account, now, j};
    return T::preclaim(pcctx);
}

}  // namespace peerlend

#endif
