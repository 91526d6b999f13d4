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

#ifndef CHAINSCREEN_SCREEN_LISTVERSION_H_INCLUDED
#define CHAINSCREEN_SCREEN_LISTVERSION_H_INCLUDED

#include <chainscreen/basics/chrono.h>

#include <json/value.h>

#include <string>

namespace chainscreen {

/**
 * Identifies the sanctions-list retrieval a sanctioned set was built from.
 *
 * Every screening result carries the version in force so a verdict can be
 * audited against a specific point-in-time source document.
 */
struct ListVersion
{
    /// Tag of the originating list, e.g. "OFAC_SDN"
    std::string source;

    /// When the source document was retrieved
    UtcClock::time_point retrievedAt;

    /// Hex digest of the exact source bytes
    std::string contentHash;

    /// Where the source document was retrieved from
    std::string uri;
};

bool
operator==(ListVersion const& lhs, ListVersion const& rhs);

inline bool
operator!=(ListVersion const& lhs, ListVersion const& rhs)
{
    return !(lhs == rhs);
}

Json::Value
getJson(ListVersion const& version);

}  // namespace chainscreen

#endif
