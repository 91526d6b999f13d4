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

#include <chainscreen/protocol/Chain.h>

#include <boost/algorithm/string.hpp>

#include <unordered_map>

namespace chainscreen {

namespace {

// Tickers that name the same chain under a different code.
std::unordered_map<std::string, std::string> const&
chainAliases()
{
    static std::unordered_map<std::string, std::string> const aliases = {
        {"XBT", "BTC"},
    };
    return aliases;
}

// Every canonical chain tag the screening engine knows about. Chains that
// appear in sanctions extracts without an address rule map to unknown.
std::unordered_map<std::string, ChainFamily> const&
chainFamilies()
{
    static std::unordered_map<std::string, ChainFamily> const families = {
        {"BTC", ChainFamily::bitcoin},

        {"ETH", ChainFamily::evm},
        {"EVM", ChainFamily::evm},
        {"ARB", ChainFamily::evm},
        {"OP", ChainFamily::evm},
        {"MATIC", ChainFamily::evm},
        {"BSC", ChainFamily::evm},
        {"ETC", ChainFamily::evm},

        {"TRX", ChainFamily::unknown},
        {"LTC", ChainFamily::unknown},
        {"XMR", ChainFamily::unknown},
        {"ZEC", ChainFamily::unknown},
        {"DASH", ChainFamily::unknown},
        {"BSV", ChainFamily::unknown},
        {"BCH", ChainFamily::unknown},
        {"BTG", ChainFamily::unknown},
        {"XVG", ChainFamily::unknown},
        {"USDT", ChainFamily::unknown},
    };
    return families;
}

}  // namespace

std::string
to_string(ChainFamily family)
{
    switch (family)
    {
        case ChainFamily::evm:
            return "evm";
        case ChainFamily::bitcoin:
            return "bitcoin";
        case ChainFamily::unknown:
            break;
    }
    return "unknown";
}

std::string
resolveChain(std::string const& chain)
{
    auto ticker = boost::to_upper_copy(boost::trim_copy(chain));

    auto const& aliases = chainAliases();
    if (auto const iter = aliases.find(ticker); iter != aliases.end())
        return iter->second;

    return ticker;
}

ChainFamily
chainFamily(std::string const& chain)
{
    auto const& families = chainFamilies();
    if (auto const iter = families.find(resolveChain(chain));
        iter != families.end())
        return iter->second;

    return ChainFamily::unknown;
}

bool
isRecognizedChain(std::string const& chain)
{
    return chainFamilies().count(resolveChain(chain)) != 0;
}

}  // namespace chainscreen
