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

#include <chainscreen/basics/chrono.h>

#include <boost/algorithm/string.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

#include <regex>

namespace chainscreen {

namespace {

boost::posix_time::ptime const&
unixEpoch()
{
    static boost::posix_time::ptime const epoch(
        boost::gregorian::date(1970, 1, 1));
    return epoch;
}

}  // namespace

std::optional<UtcClock::time_point>
parseIso8601(std::string const& text)
{
    // <date> [ 'T' <time> [ <fraction> ] [ 'Z' | <offset> ] ]
    static std::regex const reIso(
        "^(\\d{4}-\\d{2}-\\d{2})"
        "(?:[T ](\\d{2}:\\d{2}:\\d{2}(?:\\.\\d{1,9})?)"
        "(Z|[+-]\\d{2}:\\d{2})?)?$",
        std::regex_constants::optimize);

    std::string const trimmed = boost::trim_copy(text);

    std::smatch match;
    if (!std::regex_match(trimmed, match, reIso))
        return std::nullopt;

    std::string const time =
        match[2].matched ? match[2].str() : std::string("00:00:00");

    // Boost rolls out-of-range fields over instead of rejecting them
    if (std::stoi(time.substr(0, 2)) > 23 ||
        std::stoi(time.substr(3, 2)) > 59 || std::stoi(time.substr(6, 2)) > 59)
        return std::nullopt;

    std::string const stamp = match[1].str() + "T" + time;

    boost::posix_time::ptime pt;
    try
    {
        pt = boost::posix_time::from_iso_extended_string(stamp);
    }
    catch (std::exception const&)
    {
        return std::nullopt;
    }

    if (pt.is_special())
        return std::nullopt;

    if (match[3].matched && match[3].str() != "Z")
    {
        std::string const offset = match[3].str();
        int const hours = std::stoi(offset.substr(1, 2));
        int const minutes = std::stoi(offset.substr(4, 2));
        if (hours > 23 || minutes > 59)
            return std::nullopt;

        auto const delta =
            boost::posix_time::hours(hours) + boost::posix_time::minutes(minutes);

        // Local time is ahead of UTC by a positive offset
        if (offset[0] == '+')
            pt -= delta;
        else
            pt += delta;
    }

    auto const since = pt - unixEpoch();
    return UtcClock::time_point{std::chrono::duration_cast<UtcClock::duration>(
        std::chrono::microseconds{since.total_microseconds()})};
}

std::string
toIso8601(UtcClock::time_point tp)
{
    auto const us = std::chrono::duration_cast<std::chrono::microseconds>(
        tp.time_since_epoch());

    auto const pt = unixEpoch() + boost::posix_time::microseconds(us.count());

    // Boost separates the fraction with a comma
    auto text = boost::posix_time::to_iso_extended_string(pt);
    boost::replace_first(text, ",", ".");
    return text + "Z";
}

}  // namespace chainscreen
