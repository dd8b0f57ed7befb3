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

#ifndef PEERLEND_APP_LEDGER_LEDGERSTATE_H_INCLUDED
#define PEERLEND_APP_LEDGER_LEDGERSTATE_H_INCLUDED

#include <peerlendd/app/ledger/LoanEntry.h>
#include <peerlendd/app/misc/AssetRegistry.h>
#include <peerlendd/app/misc/UserStatsStore.h>
#include <peerlendd/app/misc/UtilizationTracker.h>
#include <peerlendd/core/LedgerConfig.h>

#include <xrpl/beast/utility/Journal.h>
#include <xrpl/json/json_value.h>

#include <cstdint>
#include <map>

namespace peerlend {

/** Aggregate view of the whole ledger. */
struct PlatformStats
{
    std::uint64_t loanCounter = 0;

    std::uint64_t pending = 0;
    std::uint64_t active = 0;
    std::uint64_t repaid = 0;
    std::uint64_t liquidated = 0;

    std::uint64_t totalOriginated = 0;
    std::uint64_t totalFunded = 0;
    std::uint64_t feesCollected = 0;

    LedgerConfig config;

    Json::Value
    getJson() const;
};

/**
 * Everything the lending ledger knows.
 *
 * Owns the loans, the per-account and per-asset accounting, the asset
 * whitelist and the platform configuration. Transactors read it during
 * validation and write to it only from doApply().
 *
 * Loan ids are assigned sequentially starting at 1.
 */
class LedgerState
{
    LedgerConfig config_;

    std::map<std::uint64_t, LoanEntry> loans_;
    std::uint64_t loanCounter_ = 0;

    UserStatsStore userStats_;
    UtilizationTracker utilization_;
    AssetRegistry assets_;

    std::uint64_t totalOriginated_ = 0;
    std::uint64_t totalFunded_ = 0;
    std::uint64_t feesCollected_ = 0;

public:
    LedgerState(LedgerConfig const& config, beast::Journal journal);

    LedgerState(LedgerState const&) = delete;
    LedgerState&
    operator=(LedgerState const&) = delete;

    LedgerConfig const&
    config() const
    {
        return config_;
    }

    LedgerConfig&
    config()
    {
        return config_;
    }

    /** The loan with this id, or nullptr. */
    LoanEntry const*
    read(std::uint64_t id) const;

    /** Mutable access for doApply(). */
    LoanEntry*
    peek(std::uint64_t id);

    /** Store a new loan under the next id and return that id. */
    std::uint64_t
    insert(LoanEntry entry);

    std::uint64_t
    loanCounter() const
    {
        return loanCounter_;
    }

    UserStatsStore const&
    userStats() const
    {
        return userStats_;
    }

    UserStatsStore&
    userStats()
    {
        return userStats_;
    }

    UtilizationTracker const&
    utilization() const
    {
        return utilization_;
    }

    UtilizationTracker&
    utilization()
    {
        return utilization_;
    }

    AssetRegistry const&
    assets() const
    {
        return assets_;
    }

    AssetRegistry&
    assets()
    {
        return assets_;
    }

    void
    recordFunded(std::uint64_t principal)
    {
        totalFunded_ += principal;
    }

    void
    recordFee(std::uint64_t fee)
    {
        feesCollected_ += fee;
    }

    PlatformStats
    getPlatformStats() const;
};

}  // namespace peerlend

#endif
