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

#ifndef PEERLEND_PROTOCOL_LER_H_INCLUDED
#define PEERLEND_PROTOCOL_LER_H_INCLUDED

#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <utility>

namespace peerlend {

// "Ledger Engine Result"
//
// Every mutating ledger operation reports exactly one of these codes. Any
// code other than tesSUCCESS means the ledger was left untouched.
//
using LERUnderlyingType = int;

enum LER : LERUnderlyingType {
    // -299 .. -200: M Malformed request.
    // The request was rejected before any ledger state was read. Correct the
    // input and resubmit.
    temMALFORMED = -299,

    temINVALID_AMOUNT,
    temINVALID_DURATION,
    temINVALID_INTEREST,
    temINVALID_RISK_SCORE,
    temINVALID_COLLATERAL_TYPE,
    temINVALID_TOKEN_CONTRACT,

    // -199 .. -100: F Failure in the engine itself.
    // The ledger is not in the state the operation expected. These are never
    // caused by caller input.
    tefFAILURE = -199,
    tefBAD_LEDGER,
    tefINTERNAL,

    // 0: S Success.
    tesSUCCESS = 0,

    // 100 .. 199: C Claim rejected.
    // The request was well formed but the current ledger state does not allow
    // it. Retrying can succeed once the state changes.
    tecCLAIM = 100,
    tecNO_ENTRY = 101,
    tecNO_PERMISSION = 102,
    tecINSUFFICIENT_COLLATERAL = 103,
    tecLOAN_NOT_ACTIVE = 104,
    tecLOAN_NOT_FUNDED = 105,
    tecALREADY_FUNDED = 106,
    tecNOT_OVERDUE = 107,
    tecUNSUPPORTED_ASSET = 108,
    tecRATE_REJECTED = 109,
    tecTRANSFER_FAILED = 110,
};

//------------------------------------------------------------------------------

inline bool
isTemMalformed(LER x)
{
    return ((x) >= temMALFORMED && (x) < tefFAILURE);
}

inline bool
isTefFailure(LER x)
{
    return ((x) >= tefFAILURE && (x) < tesSUCCESS);
}

inline bool
isTesSuccess(LER x)
{
    return ((x) == tesSUCCESS);
}

inline bool
isTecClaim(LER x)
{
    return ((x) >= tecCLAIM);
}

std::unordered_map<
    LERUnderlyingType,
    std::pair<char const* const, char const* const>> const&
transResults();

bool
transResultInfo(LER code, std::string& token, std::string& text);

std::string
transToken(LER code);

std::string
transHuman(LER code);

std::optional<LER>
transCode(std::string const& token);

inline std::ostream&
operator<<(std::ostream& os, LER code)
{
    return os << transToken(code);
}

}  // namespace peerlend

#endif
