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

#include <test/jtx/LendingEnv.h>

#include <xrpl/basics/contract.h>
#include <xrpl/protocol/KeyType.h>
#include <xrpl/protocol/SecretKey.h>
#include <xrpl/protocol/Seed.h>

#include <stdexcept>
#include <utility>

namespace peerlend {
namespace test {
namespace jtx {

Account::Account(std::string name) : name_(std::move(name))
{
    auto const keys = ripple::generateKeyPair(
        ripple::KeyType::secp256k1, ripple::generateSeed(name_));
    id_ = ripple::calcAccountID(keys.first);
}

std::string
Account::human() const
{
    return toBase58(id_);
}

//------------------------------------------------------------------------------

LER
TestTransferService::transfer(
    std::uint64_t amount,
    AccountID const& from,
    AccountID const& to)
{
    auto const call = calls_++;

    if (failOnce_ && *failOnce_ == call)
    {
        failOnce_.reset();
        return tecTRANSFER_FAILED;
    }
    if (failFrom_ && call >= *failFrom_)
        return tecTRANSFER_FAILED;

    auto& source = balances_[from];
    if (source < amount)
        return tecTRANSFER_FAILED;

    source -= amount;
    balances_[to] += amount;
    ++completed_;
    return tesSUCCESS;
}

std::uint64_t
TestTransferService::balance(AccountID const& account) const
{
    auto const it = balances_.find(account);
    if (it == balances_.end())
        return 0;
    return it->second;
}

//------------------------------------------------------------------------------

LedgerConfig
envconfig()
{
    LedgerConfig config;
    config.owner = Account("owner").id();
    config.custody = Account("custody").id();
    return config;
}

LendingEnv::LendingEnv(LedgerConfig const& config)
    : journal(beast::Journal::getNullSink())
    , owner("owner")
    , custody("custody")
    , state(config, journal)
    , registry(state, bank, clock, journal)
{
}

void
LendingEnv::addToken(Account const& contract, std::uint8_t riskScore)
{
    auto const ter =
        registry.addSupportedToken(owner, contract, 6, riskScore);
    if (!isTesSuccess(ter))
        ripple::Throw<std::runtime_error>(
            "addToken: " + transToken(ter));
}

void
LendingEnv::addCollection(
    Account const& collection,
    std::uint64_t floorPrice,
    std::uint8_t riskScore)
{
    auto const ter = registry.addSupportedCollection(
        owner, collection, floorPrice, riskScore);
    if (!isTesSuccess(ter))
        ripple::Throw<std::runtime_error>(
            "addCollection: " + transToken(ter));
}

}  // namespace jtx
}  // namespace test
}  // namespace peerlend
