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

#include <chainscreend/app/ScreeningService.h>
#include <chainscreend/core/Config.h>

#include <chainscreen/basics/chrono.h>
#include <chainscreen/protocol/jss.h>
#include <chainscreen/screen/SanctionedListLoader.h>

#include <stdexcept>

namespace chainscreen {

ScreeningService::ScreeningService(Config const& config, Journal journal)
    : j_(journal), warnUnknownChains_(config.WARN_UNKNOWN_CHAINS)
{
}

void
ScreeningService::load(std::string const& path)
{
    // Build outside the lock; in-flight screening keeps the old snapshot
    auto list = loadSanctionedList(path, j_);
    install(std::move(list));
}

void
ScreeningService::install(std::shared_ptr<SanctionedList const> list)
{
    if (!list)
        throw std::invalid_argument("ScreeningService: null sanctions list");

    JLOG(j_.info()) << "ScreeningService: Installing " << list->version.source
                    << " list retrieved "
                    << toIso8601(list->version.retrievedAt) << " with "
                    << list->addresses.size() << " entries";

    std::lock_guard lock(mutex_);
    list_ = std::move(list);
}

std::shared_ptr<SanctionedList const>
ScreeningService::current() const
{
    return snapshot();
}

std::shared_ptr<SanctionedList const>
ScreeningService::snapshot() const
{
    std::lock_guard lock(mutex_);
    return list_;
}

ScreenResult
ScreeningService::screen(
    std::string const& chain,
    std::string const& address) const
{
    auto const list = snapshot();
    if (!list)
        throw std::runtime_error("ScreeningService: No sanctions list loaded");

    return screen(*list, chain, address);
}

std::vector<ScreenResult>
ScreeningService::screenBatch(std::vector<Request> const& requests) const
{
    auto const list = snapshot();
    if (!list)
        throw std::runtime_error("ScreeningService: No sanctions list loaded");

    std::vector<ScreenResult> results;
    results.reserve(requests.size());

    for (auto const& [chain, address] : requests)
        results.push_back(screen(*list, chain, address));

    JLOG(j_.debug()) << "ScreeningService: Screened " << results.size()
                     << " addresses against " << list->version.source;

    return results;
}

ScreenResult
ScreeningService::screen(
    SanctionedList const& list,
    std::string const& chain,
    std::string const& address) const
{
    auto result = chainscreen::screen(chain, address, list);

    if (!result.chainRecognized && warnUnknownChains_)
    {
        JLOG(j_.warn()) << "ScreeningService: Unknown chain '" << chain
                        << "', screening by trimmed exact match only";
    }

    if (result.match)
    {
        JLOG(j_.info()) << "ScreeningService: Sanctioned address " << address
                        << " on " << chain << " (" << list.version.source
                        << ")";
    }

    return result;
}

Json::Value
ScreeningService::getJson() const
{
    Json::Value ret(Json::objectValue);

    auto const list = snapshot();
    ret[jss::loaded] = static_cast<bool>(list);
    if (!list)
        return ret;

    ret[jss::list_version] = chainscreen::getJson(list->version);
    ret[jss::entries] = static_cast<Json::UInt>(list->addresses.size());

    Json::Value& byChain = (ret[jss::by_chain] = Json::objectValue);
    for (auto const& [chain, count] : list->addresses.countByChain())
        byChain[chain] = static_cast<Json::UInt>(count);

    return ret;
}

}  // namespace chainscreen
