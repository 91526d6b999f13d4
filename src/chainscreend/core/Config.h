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

#ifndef CHAINSCREEN_CORE_CONFIG_H_INCLUDED
#define CHAINSCREEN_CORE_CONFIG_H_INCLUDED

#include <chainscreen/basics/BasicConfig.h>
#include <chainscreen/basics/Log.h>

#include <string>

namespace chainscreen {

// Section names
#define SECTION_DEBUG_LOGFILE "debug_logfile"
#define SECTION_LOG_LEVEL "log_level"
#define SECTION_SANCTIONS_LIST "sanctions_list"
#define SECTION_SCREENING "screening"

class Config : public BasicConfig
{
public:
    // Normalized sanctions list document to screen against
    std::string SANCTIONS_LIST_PATH;

    // Log file; empty for console only
    std::string DEBUG_LOGFILE;

    Journal::Severity LOG_LEVEL = Journal::kWarning;

    // Log a warning whenever an address is screened on an unknown ticker
    bool WARN_UNKNOWN_CHAINS = true;

public:
    Config() = default;

    /** Load the configuration file.
        @param strConf Path of the file; empty to use defaults only
        @param bQuiet Lower the console log threshold to errors
        @param bVerbose Raise the console log threshold to debug
        @throws std::runtime_error if the file or a value is invalid
    */
    void
    setup(std::string const& strConf, bool bQuiet, bool bVerbose);

    /** Load the configuration from a string.
        @throws std::runtime_error if a value is invalid
    */
    void
    loadFromString(std::string const& fileContents);
};

}  // namespace chainscreen

#endif
