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

#ifndef CHAINSCREEN_PROTOCOL_ADDRESSSYNTAX_H_INCLUDED
#define CHAINSCREEN_PROTOCOL_ADDRESSSYNTAX_H_INCLUDED

#include <string>

namespace chainscreen {

/**
 * Check that an address is structurally plausible for its chain.
 *
 * The address is trimmed first. Chains without a known rule are always
 * valid: the absence of a rule is not evidence of invalidity.
 *
 * @param chain Declared chain ticker
 * @param address Raw address as supplied
 * @return true if the address may be looked up
 */
bool
isSyntacticallyValid(std::string const& chain, std::string const& address);

}  // namespace chainscreen

#endif
