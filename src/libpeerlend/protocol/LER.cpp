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

#include <peerlend/protocol/LER.h>

#include <boost/range/adaptor/transformed.hpp>
#include <boost/range/iterator_range_core.hpp>

namespace peerlend {

std::unordered_map<
    LERUnderlyingType,
    std::pair<char const* const, char const* const>> const&
transResults()
{
    // clang-format off

#define MAKE_ERROR(code, desc) { code, { #code, desc } }

    static
    std::unordered_map<
        LERUnderlyingType,
        std::pair<char const* const, char const* const>> const results
    {
        MAKE_ERROR(temMALFORMED,                "Malformed request."),
        MAKE_ERROR(temINVALID_AMOUNT,           "Amount is zero or outside the permitted range."),
        MAKE_ERROR(temINVALID_DURATION,         "Loan duration is zero or exceeds the maximum duration."),
        MAKE_ERROR(temINVALID_INTEREST,         "Interest rate is outside the permitted range."),
        MAKE_ERROR(temINVALID_RISK_SCORE,       "Risk score is outside the permitted range."),
        MAKE_ERROR(temINVALID_COLLATERAL_TYPE,  "Asset kind is not permitted in this position."),
        MAKE_ERROR(temINVALID_TOKEN_CONTRACT,   "Asset reference is missing or malformed."),

        MAKE_ERROR(tefFAILURE,                  "Failed to apply."),
        MAKE_ERROR(tefBAD_LEDGER,               "Ledger in unexpected state."),
        MAKE_ERROR(tefINTERNAL,                 "Internal error."),

        MAKE_ERROR(tesSUCCESS,                  "The operation was applied."),

        MAKE_ERROR(tecCLAIM,                    "Rejected by ledger state. No action."),
        MAKE_ERROR(tecNO_ENTRY,                 "No matching entry found."),
        MAKE_ERROR(tecNO_PERMISSION,            "Caller is not permitted to perform this operation."),
        MAKE_ERROR(tecINSUFFICIENT_COLLATERAL,  "Collateral ratio is below the platform minimum."),
        MAKE_ERROR(tecLOAN_NOT_ACTIVE,          "Loan is not active."),
        MAKE_ERROR(tecLOAN_NOT_FUNDED,          "Loan has not been funded."),
        MAKE_ERROR(tecALREADY_FUNDED,           "Loan is no longer pending funding."),
        MAKE_ERROR(tecNOT_OVERDUE,              "Loan has not reached its due ledger."),
        MAKE_ERROR(tecUNSUPPORTED_ASSET,        "Asset is disabled or does not match the entry point."),
        MAKE_ERROR(tecRATE_REJECTED,            "Interest rate exceeds the maximum acceptable rate."),
        MAKE_ERROR(tecTRANSFER_FAILED,          "Value transfer failed. No action."),
    };
    // clang-format on

#undef MAKE_ERROR

    return results;
}

bool
transResultInfo(LER code, std::string& token, std::string& text)
{
    auto& results = transResults();

    auto const r = results.find(static_cast<LERUnderlyingType>(code));

    if (r == results.end())
        return false;

    token = r->second.first;
    text = r->second.second;
    return true;
}

std::string
transToken(LER code)
{
    std::string token;
    std::string text;

    return transResultInfo(code, token, text) ? token : "-";
}

std::string
transHuman(LER code)
{
    std::string token;
    std::string text;

    return transResultInfo(code, token, text) ? text : "-";
}

std::optional<LER>
transCode(std::string const& token)
{
    static auto const results = [] {
        auto& byLer = transResults();
        auto range = boost::make_iterator_range(byLer.begin(), byLer.end());
        auto tRange = boost::adaptors::transform(range, [](auto const& r) {
            return std::make_pair(std::string{r.second.first}, r.first);
        });
        std::unordered_map<std::string, LERUnderlyingType> const byToken(
            tRange.begin(), tRange.end());
        return byToken;
    }();

    auto const r = results.find(token);

    if (r == results.end())
        return std::nullopt;

    return static_cast<LER>(r->second);
}

}  // namespace peerlend
