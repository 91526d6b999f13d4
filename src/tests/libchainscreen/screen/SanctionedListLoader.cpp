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

#include <chainscreen/basics/chrono.h>
#include <chainscreen/screen/SanctionedListLoader.h>
#include <chainscreen/screen/Screen.h>

#include <boost/filesystem.hpp>

#include <doctest/doctest.h>

#include <fstream>
#include <string>

using namespace chainscreen;

namespace {

std::string const fullDocument = R"({
    "metadata": {
        "source": "OFAC_SDN",
        "retrieved_at_utc": "2026-02-15T00:00:00",
        "sha256": "abc123",
        "uri": "https://sanctionslist.ofac.treas.gov/sdn_advanced.xml"
    },
    "addresses": [
        {"chain": "ETH", "address": "0x7F367CC41522CE07553E823BF3BE79A889DEBE1B"},
        {"chain": "XBT", "address": "BC1QXY2KGDYGJRSQTZQ2N0YRF2493P83KKFJHX0WLH"},
        {"chain": "BTC", "address": "1A1zP1eP5QGefi2DMPTfTL5SLmv7DivfNa"},
        {"chain": "eth", "address": "0x7f367cc41522ce07553e823bf3be79a889debe1b"},
        {"chain": "TRX", "address": "TNPeeaaFB7K9cmo4uQpcU32zGK8G1NYqeL"}
    ]
})";

Journal
nullJournal()
{
    return Journal(Journal::getNullSink());
}

void
checkMalformed(std::string const& document)
{
    CAPTURE(document);
    CHECK_THROWS_AS(
        parseSanctionedList(document, nullJournal()), MalformedListError);
}

class TempFile
{
public:
    explicit TempFile(std::string const& contents)
        : path_(
              boost::filesystem::temp_directory_path() /
              boost::filesystem::unique_path("chainscreen-%%%%-%%%%.json"))
    {
        std::ofstream out(path_.string());
        out << contents;
    }

    ~TempFile()
    {
        boost::system::error_code ec;
        boost::filesystem::remove(path_, ec);
    }

    std::string
    path() const
    {
        return path_.string();
    }

private:
    boost::filesystem::path path_;
};

}  // namespace

TEST_SUITE_BEGIN("SanctionedListLoader");

TEST_CASE("a full document loads")
{
    auto const list = parseSanctionedList(fullDocument, nullJournal());
    REQUIRE(list);

    CHECK(list->version.source == "OFAC_SDN");
    CHECK(toIso8601(list->version.retrievedAt) == "2026-02-15T00:00:00Z");
    CHECK(list->version.contentHash == "abc123");
    CHECK(
        list->version.uri ==
        "https://sanctionslist.ofac.treas.gov/sdn_advanced.xml");

    // The two ETH spellings collapse into one entry
    CHECK(list->addresses.size() == 4);

    auto const counts = list->addresses.countByChain();
    CHECK(counts.at("BTC") == 2);
    CHECK(counts.at("ETH") == 1);
    CHECK(counts.at("TRX") == 1);
}

TEST_CASE("entries are canonicalized like screened addresses")
{
    auto const list = parseSanctionedList(fullDocument, nullJournal());

    CHECK(screen("ETH", "0x7f367cc41522ce07553e823bf3be79a889debe1b", *list)
              .match);
    CHECK(screen("BTC", "bc1qxy2kgdygjrsqtzq2n0yrf2493p83kkfjhx0wlh", *list)
              .match);
    CHECK(screen("XBT", "1A1zP1eP5QGefi2DMPTfTL5SLmv7DivfNa", *list).match);
    CHECK_FALSE(
        screen("BTC", "1a1zP1eP5QGefi2DMPTfTL5SLmv7DivfNa", *list).match);
}

TEST_CASE("absent metadata takes defaults")
{
    auto const bare = parseSanctionedList(
        R"({"addresses": [{"chain": "ETH", "address": "0x7f367cc41522ce07553e823bf3be79a889debe1b"}]})",
        nullJournal());
    CHECK(bare->version.source == "unknown");
    CHECK(bare->version.retrievedAt == UtcClock::time_point{});
    CHECK(bare->version.contentHash.empty());
    CHECK(bare->version.uri.empty());
    CHECK(bare->addresses.size() == 1);

    auto const partial = parseSanctionedList(
        R"({"metadata": {"source": "UN_CONSOLIDATED", "sha256": null}, "addresses": []})",
        nullJournal());
    CHECK(partial->version.source == "UN_CONSOLIDATED");
    CHECK(partial->version.retrievedAt == UtcClock::time_point{});
    CHECK(partial->version.contentHash.empty());
    CHECK(partial->addresses.empty());
}

TEST_CASE("a document without addresses is rejected")
{
    checkMalformed(R"({"metadata": {"source": "OFAC_SDN"}})");
    checkMalformed(R"({})");
}

TEST_CASE("structural errors are rejected")
{
    checkMalformed("");
    checkMalformed("not json");
    checkMalformed(R"({"addresses": []} trailing)");
    checkMalformed(R"([{"chain": "ETH", "address": "0x00"}])");
    checkMalformed(R"({"addresses": {"chain": "ETH"}})");
    checkMalformed(R"({"addresses": null})");
    checkMalformed(R"({"metadata": "OFAC", "addresses": []})");
    checkMalformed(R"({"metadata": {"source": 7}, "addresses": []})");
    checkMalformed(
        R"({"metadata": {"retrieved_at_utc": "last week"}, "addresses": []})");
    checkMalformed(
        R"({"metadata": {"retrieved_at_utc": "2026-02-15T25:00:00"}, "addresses": []})");
    checkMalformed(
        R"({"metadata": {"retrieved_at_utc": "2026-02-15T00:60:00"}, "addresses": []})");
    checkMalformed(
        R"({"metadata": {"retrieved_at_utc": "2026-02-15T00:00:60"}, "addresses": []})");
}

TEST_CASE("malformed entries reject the whole document")
{
    std::string const good =
        R"({"chain": "ETH", "address": "0x7f367cc41522ce07553e823bf3be79a889debe1b"})";

    checkMalformed(R"({"addresses": [)" + good + R"(, "ETH"]})");
    checkMalformed(
        R"({"addresses": [)" + good +
        R"(, {"address": "0x0000000000000000000000000000000000000000"}]})");
    checkMalformed(R"({"addresses": [)" + good + R"(, {"chain": "ETH"}]})");
    checkMalformed(
        R"({"addresses": [{"chain": 1, "address": "0x7f367cc41522ce07553e823bf3be79a889debe1b"}]})");
    checkMalformed(R"({"addresses": [{"chain": "ETH", "address": null}]})");
    checkMalformed(R"({"addresses": [{"chain": "ETH", "address": "   "}]})");
    checkMalformed(
        R"({"addresses": [{"chain": "", "address": "0x7f367cc41522ce07553e823bf3be79a889debe1b"}]})");
}

TEST_CASE("list files load from disk")
{
    TempFile file(fullDocument);
    auto const list = loadSanctionedList(file.path(), nullJournal());
    REQUIRE(list);
    CHECK(list->version.source == "OFAC_SDN");
    CHECK(list->addresses.size() == 4);

    TempFile broken(R"({"metadata": {}})");
    CHECK_THROWS_AS(
        loadSanctionedList(broken.path(), nullJournal()), MalformedListError);
}

TEST_CASE("a missing file is not a malformed list")
{
    bool malformed = false;
    bool failed = false;
    try
    {
        loadSanctionedList("/nonexistent/chainscreen/list.json", nullJournal());
    }
    catch (MalformedListError const&)
    {
        malformed = true;
    }
    catch (std::runtime_error const&)
    {
        failed = true;
    }

    CHECK_FALSE(malformed);
    CHECK(failed);
}

TEST_SUITE_END();
