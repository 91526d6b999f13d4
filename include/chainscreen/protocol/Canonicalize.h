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

#ifndef CHAINSCREEN_PROTOCOL_CANONICALIZE_H_INCLUDED
#define CHAINSCREEN_PROTOCOL_CANONICALIZE_H_INCLUDED

#include <string>

namespace chainscreen {

/**
 * Map an address to the single form used for exact-match comparison.
 *
 * Surrounding whitespace is trimmed, then the rule of the chain's family
 * applies: EVM addresses fold to lower case, Bitcoin bech32 addresses fold
 * to lower case, Bitcoin base58 and unknown chains are left as given.
 *
 * The function is total and idempotent. The loader and the screening
 * engine must both go through it or matches are silently lost.
 *
 * @param chain Declared chain ticker; used only to pick the rule
 * @param address Raw address as supplied
 * @return The canonical address
 */
std::string
canonicalize(std::string const& chain, std::string const& address);

}  // namespace chainscreen

#endif
