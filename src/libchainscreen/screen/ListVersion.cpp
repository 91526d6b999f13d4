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

#include <chainscreen/protocol/jss.h>
#include <chainscreen/screen/ListVersion.h>

namespace chainscreen {

bool
operator==(ListVersion const& lhs, ListVersion const& rhs)
{
    return lhs.source == rhs.source && lhs.retrievedAt == rhs.retrievedAt &&
        lhs.contentHash == rhs.contentHash && lhs.uri == rhs.uri;
}

Json::Value
getJson(ListVersion const& version)
{
    Json::Value ret(Json::objectValue);
    ret[jss::source] = version.source;
    ret[jss::retrieved_at_utc] = toIso8601(version.retrievedAt);
    ret[jss::sha256] = version.contentHash;
    ret[jss::uri] = version.uri;
    return ret;
}

}  // namespace chainscreen
