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

#ifndef CHAINSCREEN_PROTOCOL_ADDRESSRULES_H_INCLUDED
#define CHAINSCREEN_PROTOCOL_ADDRESSRULES_H_INCLUDED

#include <chainscreen/protocol/Chain.h>

#include <string>
#include <variant>

namespace chainscreen {

/*
    Each chain family supplies one rule type with two members:

        isValid(address)       structural check of a trimmed address
        canonicalize(address)  normal form of a trimmed address

    Both receive an address that has already been trimmed. Adding a family
    means adding a rule type here, an alternative to AddressRules and a
    case to addressRulesFor().
*/

/** Ethereum and chains sharing its 20-byte hex account addresses. */
struct EvmAddressRules
{
    static bool
    isValid(std::string const& address);

    static std::string
    canonicalize(std::string const& address);
};

/** Bitcoin legacy base58 and native segwit bech32 addresses. */
struct BitcoinAddressRules
{
    /** True for the case-insensitive bc1, tb1 and bcrt1 prefixes. */
    static bool
    hasSegwitPrefix(std::string const& address);

    static bool
    isValid(std::string const& address);

    static std::string
    canonicalize(std::string const& address);
};

/** Chains without a known rule: everything is valid and kept as given. */
struct PassThroughAddressRules
{
    static bool
    isValid(std::string const&)
    {
        return true;
    }

    static std::string
    canonicalize(std::string const& address)
    {
        return address;
    }
};

using AddressRules = std::
    variant<EvmAddressRules, BitcoinAddressRules, PassThroughAddressRules>;

/** The rule set that applies to addresses on @p chain. */
AddressRules
addressRulesFor(std::string const& chain);

}  // namespace chainscreen

#endif
