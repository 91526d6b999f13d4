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

#ifndef CHAINSCREEN_BASICS_CHRONO_H_INCLUDED
#define CHAINSCREEN_BASICS_CHRONO_H_INCLUDED

#include <chrono>
#include <optional>
#include <string>

namespace chainscreen {

using UtcClock = std::chrono::system_clock;

/** Parse an ISO-8601 date or date-time into a UTC time point.

    Accepted forms are `YYYY-MM-DD` and `YYYY-MM-DDTHH:MM:SS[.ffffff]`,
    optionally followed by `Z` or a `+HH:MM`/`-HH:MM` offset. A date-time
    without a suffix is taken as UTC.

    @return The time point, or nullopt if the text is not a valid timestamp.
*/
std::optional<UtcClock::time_point>
parseIso8601(std::string const& text);

/** Render a time point as `YYYY-MM-DDTHH:MM:SSZ`, keeping any fraction. */
std::string
toIso8601(UtcClock::time_point tp);

}  // namespace chainscreen

#endif
