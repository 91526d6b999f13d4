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

#include <chainscreen/protocol/AddressRules.h>

#include <boost/algorithm/string.hpp>

#include <regex>

namespace chainscreen {

bool
EvmAddressRules::isValid(std::string const& address)
{
    static std::regex const reEvm(
        "^(?:0x)?[0-9a-fA-F]{40}$", std::regex_constants::optimize);

    return std::regex_match(address, reEvm);
}

std::string
EvmAddressRules::canonicalize(std::string const& address)
{
    // The mixed-case form is an EIP-55 checksum, not a different address
    return boost::to_lower_copy(address);
}

//------------------------------------------------------------------------------

bool
BitcoinAddressRules::hasSegwitPrefix(std::string const& address)
{
    return boost::istarts_with(address, "bc1") ||
        boost::istarts_with(address, "tb1") ||
        boost::istarts_with(address, "bcrt1");
}

bool
BitcoinAddressRules::isValid(std::string const& address)
{
    static std::regex const reBech32(
        "^(?:bc1|tb1|bcrt1)[a-z0-9]{20,90}$",
        std::regex_constants::icase | std::regex_constants::optimize);

    // Base58 excludes 0, O, I and l
    static std::regex const reBase58(
        "^[13][a-km-zA-HJ-NP-Z1-9]{25,34}$", std::regex_constants::optimize);

    return std::regex_match(address, reBech32) ||
        std::regex_match(address, reBase58);
}

std::string
BitcoinAddressRules::canonicalize(std::string const& address)
{
    // bech32 is case-insensitive; base58 is not and must be kept as given
    if (hasSegwitPrefix(address))
        return boost::to_lower_copy(address);

    return address;
}

//------------------------------------------------------------------------------

AddressRules
addressRulesFor(std::string const& chain)
{
    switch (chainFamily(chain))
    {
        case ChainFamily::evm:
            return EvmAddressRules{};
        case ChainFamily::bitcoin:
            return BitcoinAddressRules{};
        case ChainFamily::unknown:
            break;
    }
    return PassThroughAddressRules{};
}

}  // namespace chainscreen
