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

#include <chainscreend/app/BatchInput.h>
#include <chainscreend/app/ScreeningService.h>
#include <chainscreend/core/Config.h>

#include <chainscreen/basics/Log.h>
#include <chainscreen/screen/SanctionedListLoader.h>

#include <boost/program_options.hpp>

#include <json/writer.h>

#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace po = boost::program_options;

namespace chainscreen {

namespace {

char const* const versionString = "chainscreen 1.0.0";

void
printHelp(po::options_description const& desc)
{
    std::cerr << "chainscreen [options] [<chain> <address>]\n"
              << desc << std::endl
              << "Screens blockchain addresses by exact match against a "
                 "normalized sanctions list.\n"
                 "Exit status is 0 when nothing matched, 2 when at least one "
                 "address is sanctioned and 1 on error.\n"
                 "\n"
                 "Examples:\n"
                 "     chainscreen --list ofac.json ETH "
                 "0x7f367cc41522ce07553e823bf3be79a889debe1b\n"
                 "     chainscreen --conf chainscreen.cfg --batch "
                 "addresses.txt\n"
                 "     chainscreen --list ofac.json --summary\n";
}

std::string
toJsonString(Json::Value const& value)
{
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, value);
}

int
run(int argc, char** argv)
{
    po::variables_map vm;

    // Set up option parsing.
    //
    po::options_description gen("General Options");
    gen.add_options()(
        "conf", po::value<std::string>(), "Specify the configuration file.")(
        "list",
        po::value<std::string>(),
        "Sanctions list document; overrides [" SECTION_SANCTIONS_LIST "].")(
        "batch",
        po::value<std::string>(),
        "Screen '<chain> <address>' lines from a file, '-' for stdin.")(
        "summary", "Print the loaded list version and entry counts.")(
        "help,h", "Display this message.")(
        "quiet,q", "Reduce diagnostics.")(
        "verbose,v", "Verbose logging.")(
        "version", "Display the build version.");

    // Interpret positional arguments as --parameters.
    po::options_description hidden("Hidden Options");
    hidden.add_options()(
        "parameters",
        po::value<std::vector<std::string>>(),
        "Chain and address to screen.");

    po::options_description all;
    all.add(gen).add(hidden);

    po::positional_options_description p;
    p.add("parameters", -1);

    try
    {
        po::store(
            po::command_line_parser(argc, argv)
                .options(all)
                .positional(p)
                .run(),
            vm);
        po::notify(vm);
    }
    catch (std::exception const& ex)
    {
        std::cerr << "chainscreen: " << ex.what() << std::endl;
        std::cerr << "Try 'chainscreen --help' for a list of options."
                  << std::endl;
        return exitFailure;
    }

    if (vm.count("help"))
    {
        printHelp(gen);
        return exitNoMatch;
    }

    if (vm.count("version"))
    {
        std::cout << versionString << std::endl;
        return exitNoMatch;
    }

    std::vector<std::string> parameters;
    if (vm.count("parameters"))
        parameters = vm["parameters"].as<std::vector<std::string>>();

    bool const summary = vm.count("summary") != 0;
    bool const batch = vm.count("batch") != 0;

    if (!summary && !batch && parameters.size() != 2)
    {
        std::cerr << "chainscreen: expected <chain> <address>, --batch or "
                     "--summary"
                  << std::endl;
        return exitFailure;
    }

    if ((summary || batch) && !parameters.empty())
    {
        std::cerr << "chainscreen: <chain> <address> cannot be combined with "
                     "--batch or --summary"
                  << std::endl;
        return exitFailure;
    }

    if (summary && batch)
    {
        std::cerr << "chainscreen: --batch and --summary are exclusive"
                  << std::endl;
        return exitFailure;
    }

    auto config = std::make_unique<Config>();
    config->setup(
        vm.count("conf") ? vm["conf"].as<std::string>() : std::string{},
        vm.count("quiet") != 0,
        vm.count("verbose") != 0);

    if (vm.count("list"))
        config->SANCTIONS_LIST_PATH = vm["list"].as<std::string>();

    Logs logs(config->LOG_LEVEL);
    if (!config->DEBUG_LOGFILE.empty() && !logs.open(config->DEBUG_LOGFILE))
    {
        std::cerr << "chainscreen: unable to open log file "
                  << config->DEBUG_LOGFILE << std::endl;
        return exitFailure;
    }

    auto const j = logs.journal("Main");

    if (config->SANCTIONS_LIST_PATH.empty())
    {
        JLOG(j.fatal()) << "No sanctions list: use --list or ["
                        << SECTION_SANCTIONS_LIST << "]";
        return exitFailure;
    }

    ScreeningService service(*config, logs.journal("ScreeningService"));
    service.load(config->SANCTIONS_LIST_PATH);

    if (summary)
    {
        std::cout << toJsonString(service.getJson()) << std::endl;
        return exitNoMatch;
    }

    std::vector<ScreenResult> results;
    if (batch)
    {
        auto const name = vm["batch"].as<std::string>();
        if (name == "-")
        {
            results = service.screenBatch(readBatch(std::cin, "stdin"));
        }
        else
        {
            std::ifstream in(name);
            if (!in)
                throw std::runtime_error("Unable to open batch file: " + name);
            results = service.screenBatch(readBatch(in, name));
        }

        Json::Value out(Json::arrayValue);
        for (auto const& result : results)
            out.append(getJson(result));
        std::cout << toJsonString(out) << std::endl;
    }
    else
    {
        results.push_back(service.screen(parameters[0], parameters[1]));
        std::cout << toJsonString(getJson(results.front())) << std::endl;
    }

    return exitStatus(results);
}

}  // namespace

}  // namespace chainscreen

int
main(int argc, char** argv)
{
    try
    {
        return chainscreen::run(argc, argv);
    }
    catch (chainscreen::MalformedListError const& e)
    {
        std::cerr << "chainscreen: malformed sanctions list: " << e.what()
                  << std::endl;
    }
    catch (std::exception const& e)
    {
        std::cerr << "chainscreen: " << e.what() << std::endl;
    }
    return chainscreen::exitFailure;
}
