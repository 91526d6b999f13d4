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

#include <chainscreen/protocol/AddressSyntax.h>
#include <chainscreen/protocol/Canonicalize.h>
#include <chainscreen/protocol/Chain.h>
#include <chainscreen/protocol/jss.h>
#include <chainscreen/screen/Screen.h>

namespace chainscreen {

std::string
to_string(ScreenReason reason)
{
    switch (reason)
    {
        case ScreenReason::invalidAddressSyntax:
            return "invalid_address_syntax";
        case ScreenReason::noExactMatch:
            return "no_exact_match";
        case ScreenReason::exactMatchAuthoritative:
            return "exact_match_authoritative_sanctions_address";
    }
    return "unknown";
}

ScreenResult
screen(
    std::string const& chain,
    std::string const& address,
    SanctionedSet const& sanctioned,
    ListVersion const& version)
{
    ScreenResult result;
    result.inputAddress = address;
    result.chain = chain;
    result.listVersion = version;
    result.chainRecognized = isRecognizedChain(chain);

    if (!isSyntacticallyValid(chain, address))
    {
        result.match = false;
        result.riskScore = minRiskScore;
        result.reason = ScreenReason::invalidAddressSyntax;
        return result;
    }

    if (sanctioned.contains(chain, canonicalize(chain, address)))
    {
        // Deterministic hit on an authoritative list: no gradation
        result.match = true;
        result.riskScore = maxRiskScore;
        result.reason = ScreenReason::exactMatchAuthoritative;
        return result;
    }

    result.match = false;
    result.riskScore = minRiskScore;
    result.reason = ScreenReason::noExactMatch;
    return result;
}

ScreenResult
screen(
    std::string const& chain,
    std::string const& address,
    SanctionedList const& list)
{
    return screen(chain, address, list.addresses, list.version);
}

Json::Value
getJson(ScreenResult const& result)
{
    Json::Value ret(Json::objectValue);
    ret[jss::address] = result.inputAddress;
    ret[jss::chain] = result.chain;
    ret[jss::match] = result.match;
    ret[jss::risk_score] = static_cast<Json::UInt>(result.riskScore);
    ret[jss::reason] = to_string(result.reason);
    ret[jss::chain_recognized] = result.chainRecognized;
    ret[jss::family] = to_string(chainFamily(result.chain));
    ret[jss::list_version] = getJson(result.listVersion);
    return ret;
}

}  // namespace chainscreen
