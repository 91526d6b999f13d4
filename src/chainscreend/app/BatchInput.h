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

#ifndef CHAINSCREEN_APP_BATCHINPUT_H_INCLUDED
#define CHAINSCREEN_APP_BATCHINPUT_H_INCLUDED

#include <chainscreend/app/ScreeningService.h>

#include <istream>
#include <string>
#include <vector>

namespace chainscreen {

// Process exit status of the chainscreen tool
int const exitNoMatch = 0;
int const exitFailure = 1;
int const exitMatch = 2;

/**
 * Read screening requests, one "<chain> <address>" pair per line.
 *
 * Blank lines and lines starting with '#' are skipped, and a '#' later in
 * a line starts a trailing comment.
 *
 * @param in The batch text
 * @param name Source name used in error messages
 * @throws std::runtime_error if a line does not hold exactly two fields or
 *         the stream fails
 */
std::vector<ScreeningService::Request>
readBatch(std::istream& in, std::string const& name);

/** exitMatch if any result matched, else exitNoMatch. */
int
exitStatus(std::vector<ScreenResult> const& results);

}  // namespace chainscreen

#endif
