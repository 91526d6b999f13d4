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

#ifndef CHAINSCREEN_SCREEN_SANCTIONEDLISTLOADER_H_INCLUDED
#define CHAINSCREEN_SCREEN_SANCTIONEDLISTLOADER_H_INCLUDED

#include <chainscreen/basics/Log.h>
#include <chainscreen/screen/SanctionedSet.h>

#include <memory>
#include <stdexcept>
#include <string>

namespace chainscreen {

/** A list document that must not be screened against. */
class MalformedListError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/**
 * Build a sanctioned list from a normalized list document.
 *
 * Format:
 *
 *   {
 *     "metadata": {
 *       "source": "OFAC_SDN",
 *       "retrieved_at_utc": "2026-02-15T00:00:00",
 *       "sha256": "abc123...",
 *       "uri": "https://..."
 *     },
 *     "addresses": [
 *       {"chain": "ETH", "address": "0x..."},
 *       {"chain": "XBT", "address": "bc1..."}
 *     ]
 *   }
 *
 * Absent metadata fields take defaults ("unknown" source, the Unix epoch,
 * empty hash and uri). A missing "addresses" array or any entry without a
 * string "chain" and "address" rejects the whole document.
 *
 * @param content The document text
 * @param j Journal for load diagnostics
 * @return The immutable list
 * @throws MalformedListError if the document is structurally invalid
 */
std::shared_ptr<SanctionedList const>
parseSanctionedList(std::string const& content, Journal j);

/**
 * Read and parse a list document from disk.
 * @throws std::runtime_error if the file cannot be read
 * @throws MalformedListError if the document is structurally invalid
 */
std::shared_ptr<SanctionedList const>
loadSanctionedList(std::string const& path, Journal j);

}  // namespace chainscreen

#endif
