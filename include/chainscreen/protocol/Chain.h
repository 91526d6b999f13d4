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

#ifndef CHAINSCREEN_PROTOCOL_CHAIN_H_INCLUDED
#define CHAINSCREEN_PROTOCOL_CHAIN_H_INCLUDED

#include <string>

namespace chainscreen {

/** Address encoding families with their own validation and case rules. */
enum class ChainFamily {
    evm,      // 20-byte hex account addresses, case-insensitive
    bitcoin,  // base58 legacy and bech32 native segwit
    unknown   // no rule known: pass through untouched
};

std::string
to_string(ChainFamily family);

/**
 * Resolve a raw ticker to its canonical chain tag.
 *
 * The ticker is trimmed and upper-cased, then mapped through the alias
 * table (e.g. XBT -> BTC). Tickers without an alias resolve to themselves.
 * The loader and the screening path both key the sanctioned set on this
 * value.
 */
std::string
resolveChain(std::string const& chain);

/** Family of the chain that @p chain resolves to. */
ChainFamily
chainFamily(std::string const& chain);

/**
 * Check whether @p chain resolves to a ticker the chain table knows.
 *
 * A recognized chain may still lack address rules; it then uses the
 * pass-through rule like any unrecognized ticker.
 */
bool
isRecognizedChain(std::string const& chain);

}  // namespace chainscreen

#endif
