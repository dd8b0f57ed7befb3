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

#ifndef PEERLEND_TEST_JTX_LENDINGENV_H_INCLUDED
#define PEERLEND_TEST_JTX_LENDINGENV_H_INCLUDED

#include <peerlendd/app/ledger/LedgerState.h>
#include <peerlendd/app/main/LoanRegistry.h>
#include <peerlendd/app/misc/TransferService.h>
#include <peerlendd/core/LedgerConfig.h>

#include <xrpl/beast/utility/Journal.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace peerlend {
namespace test {
namespace jtx {

/** A test account, derived deterministically from its name. */
class Account
{
    std::string name_;
    AccountID id_;

public:
    explicit Account(std::string name);

    std::string const&
    name() const
    {
        return name_;
    }

    AccountID const&
    id() const
    {
        return id_;
    }

    /** The base58 encoding of the account id. */
    std::string
    human() const;

    operator AccountID const&() const
    {
        return id_;
    }
};

/** A ledger clock the test moves by hand. */
class ManualClock : public LedgerClock
{
    LedgerIndex now_;

public:
    explicit ManualClock(LedgerIndex start = 1000) : now_(start)
    {
    }

    LedgerIndex
    now() const override
    {
        return now_;
    }

    void
    set(LedgerIndex seq)
    {
        now_ = seq;
    }

    void
    advance(LedgerIndex ledgers)
    {
        now_ += ledgers;
    }
};

/**
 * In-memory native balances.
 *
 * A transfer fails if the sender lacks the funds. Failures can also be
 * injected: the n-th transfer from now fails once, or every transfer from
 * the n-th on fails.
 */
class TestTransferService : public TransferService
{
    std::map<AccountID, std::uint64_t> balances_;
    std::size_t calls_ = 0;
    std::size_t completed_ = 0;
    std::optional<std::size_t> failOnce_;
    std::optional<std::size_t> failFrom_;

public:
    LER
    transfer(
        std::uint64_t amount,
        AccountID const& from,
        AccountID const& to) override;

    void
    fund(AccountID const& account, std::uint64_t amount)
    {
        balances_[account] += amount;
    }

    std::uint64_t
    balance(AccountID const& account) const;

    /** Fail only the transfer `after` calls from now. */
    void
    failOnce(std::size_t after)
    {
        failOnce_ = calls_ + after;
    }

    /** Fail every transfer starting `after` calls from now. */
    void
    failFrom(std::size_t after)
    {
        failFrom_ = calls_ + after;
    }

    /** Transfers that actually moved value. */
    std::size_t
    completed() const
    {
        return completed_;
    }
};

/** A configuration owned by the "owner" account with funds held by
    "custody", and otherwise default values.
*/
LedgerConfig
envconfig();

/** A complete lending ledger wired to test doubles. */
class LendingEnv
{
public:
    beast::Journal const journal;

    Account const owner;
    Account const custody;

    ManualClock clock;
    TestTransferService bank;
    LedgerState state;
    LoanRegistry registry;

    explicit LendingEnv(LedgerConfig const& config = envconfig());

    std::uint64_t
    balance(Account const& account) const
    {
        return bank.balance(account);
    }

    void
    fund(Account const& account, std::uint64_t amount)
    {
        bank.fund(account, amount);
    }

    /** Move the clock forward. */
    void
    close(LedgerIndex ledgers = 1)
    {
        clock.advance(ledgers);
    }

    LedgerIndex
    now() const
    {
        return clock.now();
    }

    /** Whitelist a token as the owner. */
    void
    addToken(Account const& contract, std::uint8_t riskScore = 2);

    /** Whitelist a collection as the owner. */
    void
    addCollection(
        Account const& collection,
        std::uint64_t floorPrice,
        std::uint8_t riskScore = 3);
};

}  // namespace jtx
}  // namespace test
}  // namespace peerlend

#endif
