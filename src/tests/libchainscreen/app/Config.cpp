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

#include <boost/filesystem.hpp>

#include <doctest/doctest.h>

#include <fstream>
#include <stdexcept>

using namespace chainscreen;

TEST_SUITE_BEGIN("Config");

TEST_CASE("defaults")
{
    Config config;
    config.setup("", false, false);

    CHECK(config.SANCTIONS_LIST_PATH.empty());
    CHECK(config.DEBUG_LOGFILE.empty());
    CHECK(config.LOG_LEVEL == Journal::kWarning);
    CHECK(config.WARN_UNKNOWN_CHAINS);
}

TEST_CASE("sections are read")
{
    Config config;
    config.loadFromString(
        "# chainscreen configuration\n"
        "[sanctions_list]\n"
        "/var/lib/chainscreen/ofac.json\n"
        "\n"
        "[debug_logfile]\n"
        "/var/log/chainscreen/debug.log\n"
        "\n"
        "[log_level]\n"
        "info\n"
        "\n"
        "[screening]\n"
        "warn_unknown_chains=0\n");

    CHECK(config.SANCTIONS_LIST_PATH == "/var/lib/chainscreen/ofac.json");
    CHECK(config.DEBUG_LOGFILE == "/var/log/chainscreen/debug.log");
    CHECK(config.LOG_LEVEL == Journal::kInfo);
    CHECK_FALSE(config.WARN_UNKNOWN_CHAINS);
}

TEST_CASE("invalid values are rejected")
{
    {
        Config config;
        CHECK_THROWS_AS(
            config.loadFromString("[log_level]\nloud\n"), std::runtime_error);
    }
    {
        Config config;
        CHECK_THROWS_AS(
            config.loadFromString("[screening]\nwarn_unknown_chains=maybe\n"),
            std::runtime_error);
    }
    {
        Config config;
        CHECK_THROWS_AS(
            config.loadFromString("[sanctions_list]\n/a.json\n/b.json\n"),
            std::runtime_error);
    }
}

TEST_CASE("command line flags override the log level")
{
    auto const path = boost::filesystem::temp_directory_path() /
        boost::filesystem::unique_path("chainscreen-%%%%-%%%%.cfg");
    {
        std::ofstream out(path.string());
        out << "[log_level]\ntrace\n[sanctions_list]\n/tmp/list.json\n";
    }

    Config quiet;
    quiet.setup(path.string(), true, false);
    CHECK(quiet.SANCTIONS_LIST_PATH == "/tmp/list.json");
    CHECK(quiet.LOG_LEVEL == Journal::kError);

    Config verbose;
    verbose.setup(path.string(), false, true);
    CHECK(verbose.LOG_LEVEL == Journal::kDebug);

    Config plain;
    plain.setup(path.string(), false, false);
    CHECK(plain.LOG_LEVEL == Journal::kTrace);

    boost::filesystem::remove(path);
}

TEST_CASE("a missing configuration file is an error")
{
    Config config;
    CHECK_THROWS_AS(
        config.setup("/nonexistent/chainscreen.cfg", false, false),
        std::runtime_error);
}

TEST_SUITE_END();
