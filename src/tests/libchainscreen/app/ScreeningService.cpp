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

#include <chainscreen/protocol/jss.h>
#include <chainscreen/screen/SanctionedListLoader.h>

#include <boost/filesystem.hpp>

#include <doctest/doctest.h>

#include <atomic>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace chainscreen;

namespace {

std::string const tornado = "0x7f367cc41522ce07553e823bf3be79a889debe1b";
std::string const bech32 = "bc1qxy2kgdygjrsqtzq2n0yrf2493p83kkfjhx0wlh";

class CaptureSink : public Journal::Sink
{
public:
    explicit CaptureSink(Journal::Severity thresh) : Sink(thresh, false)
    {
    }

    void
    write(Journal::Severity, std::string const& text) override
    {
        std::lock_guard lock(mutex_);
        messages_.push_back(text);
    }

    std::size_t
    count(std::string const& needle) const
    {
        std::lock_guard lock(mutex_);
        std::size_t n = 0;
        for (auto const& m : messages_)
            if (m.find(needle) != std::string::npos)
                ++n;
        return n;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> messages_;
};

std::shared_ptr<SanctionedList const>
makeList(
    std::string const& source,
    std::vector<ScreeningService::Request> const& entries)
{
    auto list = std::make_shared<SanctionedList>();
    list->version.source = source;
    for (auto const& [chain, address] : entries)
        list->addresses.insert(chain, address);
    return list;
}

}  // namespace

TEST_SUITE_BEGIN("ScreeningService");

TEST_CASE("screening needs a list")
{
    Config config;
    ScreeningService service(config, Journal(Journal::getNullSink()));

    CHECK(service.current() == nullptr);
    CHECK_THROWS_AS(service.screen("ETH", tornado), std::runtime_error);
    CHECK_THROWS_AS(
        service.screenBatch({{"ETH", tornado}}), std::runtime_error);
    CHECK_THROWS_AS(service.install(nullptr), std::invalid_argument);
    CHECK_FALSE(service.getJson()[jss::loaded].asBool());
}

TEST_CASE("screening against the installed list")
{
    Config config;
    ScreeningService service(config, Journal(Journal::getNullSink()));
    service.install(makeList("OFAC_SDN", {{"ETH", tornado}, {"XBT", bech32}}));

    auto const hit =
        service.screen("ETH", "0x7F367CC41522CE07553E823BF3BE79A889DEBE1B");
    CHECK(hit.match);
    CHECK(hit.listVersion.source == "OFAC_SDN");

    auto const results = service.screenBatch({
        {"ETH", "0x0000000000000000000000000000000000000000"},
        {"BTC", "BC1QXY2KGDYGJRSQTZQ2N0YRF2493P83KKFJHX0WLH"},
        {"ETH", "invalid"},
    });
    REQUIRE(results.size() == 3);
    CHECK(results[0].reason == ScreenReason::noExactMatch);
    CHECK(results[1].reason == ScreenReason::exactMatchAuthoritative);
    CHECK(results[2].reason == ScreenReason::invalidAddressSyntax);
}

TEST_CASE("summary json")
{
    Config config;
    ScreeningService service(config, Journal(Journal::getNullSink()));
    service.install(makeList(
        "OFAC_SDN",
        {{"ETH", tornado},
         {"XBT", bech32},
         {"BTC", "1A1zP1eP5QGefi2DMPTfTL5SLmv7DivfNa"}}));

    auto const json = service.getJson();
    CHECK(json[jss::loaded].asBool());
    CHECK(json[jss::entries].asUInt() == 3);
    CHECK(json[jss::by_chain]["BTC"].asUInt() == 2);
    CHECK(json[jss::by_chain]["ETH"].asUInt() == 1);
    CHECK(json[jss::list_version][jss::source].asString() == "OFAC_SDN");
}

TEST_CASE("a failed refresh keeps the list in force")
{
    auto const dir = boost::filesystem::temp_directory_path() /
        boost::filesystem::unique_path("chainscreen-%%%%-%%%%");
    boost::filesystem::create_directories(dir);
    auto const good = (dir / "good.json").string();
    auto const bad = (dir / "bad.json").string();

    {
        std::ofstream out(good);
        out << R"({"metadata": {"source": "OFAC_SDN"}, "addresses": [{"chain": "ETH", "address": ")"
            << tornado << R"("}]})";
    }
    {
        std::ofstream out(bad);
        out << R"({"metadata": {"source": "BROKEN"}})";
    }

    Config config;
    ScreeningService service(config, Journal(Journal::getNullSink()));
    service.load(good);
    auto const before = service.current();
    REQUIRE(before);

    CHECK_THROWS_AS(service.load(bad), MalformedListError);
    CHECK(service.current() == before);
    CHECK(service.screen("ETH", tornado).match);

    CHECK_THROWS_AS(
        service.load((dir / "missing.json").string()), std::runtime_error);
    CHECK(service.current() == before);

    boost::filesystem::remove_all(dir);
}

TEST_CASE("unknown chains are reported without changing the verdict")
{
    CaptureSink sink(Journal::kWarning);

    Config config;
    ScreeningService service(config, Journal(sink));
    service.install(makeList("TEST", {{"SOMECHAIN", "addr-1"}}));

    auto const r = service.screen("SOMECHAIN", " addr-1 ");
    CHECK(r.match);
    CHECK_FALSE(r.chainRecognized);
    CHECK(sink.count("Unknown chain 'SOMECHAIN'") == 1);

    service.screen("TRX", "TNPeeaaFB7K9cmo4uQpcU32zGK8G1NYqeL");
    CHECK(sink.count("Unknown chain") == 1);

    Config quiet;
    quiet.WARN_UNKNOWN_CHAINS = false;
    CaptureSink quietSink(Journal::kWarning);
    ScreeningService silent(quiet, Journal(quietSink));
    silent.install(makeList("TEST", {}));
    silent.screen("SOMECHAIN", "addr-1");
    CHECK(quietSink.count("Unknown chain") == 0);
}

TEST_CASE("screening during refresh sees whole snapshots")
{
    // Version A lists the address, version B does not
    auto const listA = makeList("A", {{"ETH", tornado}});
    auto const listB = makeList("B", {{"BTC", bech32}});

    Config config;
    ScreeningService service(config, Journal(Journal::getNullSink()));
    service.install(listA);

    std::atomic<bool> stop{false};
    std::atomic<int> inconsistent{0};
    std::atomic<int> screened{0};

    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i)
    {
        readers.emplace_back([&]() {
            do
            {
                auto const batch =
                    service.screenBatch({{"ETH", tornado}, {"BTC", bech32}});
                auto const& source = batch[0].listVersion.source;

                bool const consistent = batch[1].listVersion.source == source &&
                    batch[0].match == (source == "A") &&
                    batch[1].match == (source == "B");
                if (!consistent)
                    ++inconsistent;
                ++screened;
            } while (!stop);
        });
    }

    for (int i = 0; i < 200; ++i)
        service.install(i % 2 ? listA : listB);

    stop = true;
    for (auto& t : readers)
        t.join();

    CHECK(inconsistent.load() == 0);
    CHECK(screened.load() > 0);
}

TEST_SUITE_END();
