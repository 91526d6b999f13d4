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

#include <chainscreend/core/Config.h>

#include <boost/algorithm/string.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace chainscreen {

namespace {

bool
parseFlag(std::string const& name, std::string const& value)
{
    auto const v = boost::algorithm::to_lower_copy(boost::trim_copy(value));

    if (v == "1" || v == "true" || v == "yes")
        return true;

    if (v == "0" || v == "false" || v == "no")
        return false;

    throw std::runtime_error(
        "Invalid value '" + value + "' for " + name + ": expected 0 or 1");
}

}  // namespace

void
Config::setup(std::string const& strConf, bool bQuiet, bool bVerbose)
{
    if (!strConf.empty())
    {
        std::ifstream in(strConf);
        if (!in)
            throw std::runtime_error(
                "Unable to open configuration file: " + strConf);

        std::ostringstream contents;
        contents << in.rdbuf();
        if (in.bad())
            throw std::runtime_error(
                "Unable to read configuration file: " + strConf);

        loadFromString(contents.str());
    }

    // Command line flags win over [log_level]
    if (bQuiet)
        LOG_LEVEL = Journal::kError;
    else if (bVerbose)
        LOG_LEVEL = Journal::kDebug;
}

void
Config::loadFromString(std::string const& fileContents)
{
    IniFileSections secConfig = parseIniFile(fileContents, true);

    build(secConfig);

    if (exists(SECTION_SANCTIONS_LIST))
        SANCTIONS_LIST_PATH = section(SECTION_SANCTIONS_LIST).legacy();

    if (exists(SECTION_DEBUG_LOGFILE))
        DEBUG_LOGFILE = section(SECTION_DEBUG_LOGFILE).legacy();

    if (exists(SECTION_LOG_LEVEL))
    {
        auto const level = section(SECTION_LOG_LEVEL).legacy();
        if (auto const severity = Logs::fromString(level))
            LOG_LEVEL = *severity;
        else
            throw std::runtime_error(
                "Invalid value '" + level + "' in [" SECTION_LOG_LEVEL "]");
    }

    if (exists(SECTION_SCREENING))
    {
        auto const& screening = section(SECTION_SCREENING);
        if (auto const warn = screening.get("warn_unknown_chains"))
            WARN_UNKNOWN_CHAINS = parseFlag("warn_unknown_chains", *warn);
    }
}

}  // namespace chainscreen
