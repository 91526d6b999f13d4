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

#include <chainscreend/app/BatchInput.h>

#include <boost/algorithm/string.hpp>

#include <algorithm>
#include <stdexcept>

namespace chainscreen {

std::vector<ScreeningService::Request>
readBatch(std::istream& in, std::string const& name)
{
    std::vector<ScreeningService::Request> requests;

    std::string line;
    std::size_t lineNo = 0;
    while (std::getline(in, line))
    {
        ++lineNo;

        auto const comment = line.find('#');
        if (comment != std::string::npos)
            line.erase(comment);

        boost::trim(line);
        if (line.empty())
            continue;

        std::vector<std::string> fields;
        boost::split(
            fields, line, boost::is_any_of(" \t"), boost::token_compress_on);

        if (fields.size() != 2)
            throw std::runtime_error(
                name + ":" + std::to_string(lineNo) +
                ": expected '<chain> <address>'");

        requests.emplace_back(fields[0], fields[1]);
    }

    if (in.bad())
        throw std::runtime_error("Unable to read batch input: " + name);

    return requests;
}

int
exitStatus(std::vector<ScreenResult> const& results)
{
    bool const matched = std::any_of(
        results.begin(), results.end(), [](ScreenResult const& result) {
            return result.match;
        });

    return matched ? exitMatch : exitNoMatch;
}

}  // namespace chainscreen
