//------------------------------------------------------------------------------
/*
    This file is part of chainscreen.
    Copyright (c) 2026 The chainscreen developers.

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

#ifndef CHAINSCREEN_SCREEN_SCREEN_H_INCLUDED
#define CHAINSCREEN_SCREEN_SCREEN_H_INCLUDED

#include <chainscreen/screen/ListVersion.h>
#include <chainscreen/screen/SanctionedSet.h>

#include <json/value.h>

#include <cstdint>
#include <string>

namespace chainscreen {

/** Classification attached to every screening result. */
enum class ScreenReason {
    invalidAddressSyntax,
    noExactMatch,
    exactMatchAuthoritative,
};

/** The wire tag of a reason, e.g. "no_exact_match". */
std::string
to_string(ScreenReason reason);

/// Risk score of an exact hit on an authoritative list.
constexpr std::uint8_t maxRiskScore = 100;

/// Risk score of every non-match.
constexpr std::uint8_t minRiskScore = 0;

/** Outcome of screening one address. */
struct ScreenResult
{
    /// The address exactly as the caller supplied it
    std::string inputAddress;

    /// The chain exactly as the caller declared it
    std::string chain;

    bool match = false;
    std::uint8_t riskScore = minRiskScore;
    ScreenReason reason = ScreenReason::noExactMatch;

    /// Version of the list the verdict was reached against
    ListVersion listVersion;

    /// False when the chain is not in the chain table and the pass-through
    /// rule was applied; informational only
    bool chainRecognized = false;
};

/**
 * Screen one address by exact match against a sanctioned set.
 *
 * A syntactically invalid address is classified without consulting the
 * set. Otherwise the canonical form is looked up under the resolved chain.
 * The function has no side effects and may be called concurrently against
 * a shared set.
 */
ScreenResult
screen(
    std::string const& chain,
    std::string const& address,
    SanctionedSet const& sanctioned,
    ListVersion const& version);

/** Screen against a loaded list, annotating with its version. */
ScreenResult
screen(
    std::string const& chain,
    std::string const& address,
    SanctionedList const& list);

Json::Value
getJson(ScreenResult const& result);

}  // namespace chainscreen

#endif
