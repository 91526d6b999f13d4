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

#include <doctest/doctest.h>

#include <sstream>
#include <stdexcept>
#include <string>

using namespace chainscreen;

namespace {

ScreenResult
resultWithMatch(bool match)
{
    ScreenResult result;
    result.match = match;
    return result;
}

}  // namespace

TEST_SUITE_BEGIN("BatchInput");

TEST_CASE("batch lines become requests")
{
    std::istringstream in(
        "# sanctioned candidates\n"
        "ETH 0x7f367cc41522ce07553e823bf3be79a889debe1b\n"
        "\n"
        "   \t\n"
        "  XBT\t\tbc1qxy2kgdygjrsqtzq2n0yrf2493p83kkfjhx0wlh  \n"
        "TRX TNPeeaaFB7K9cmo4uQpcU32zGK8G1NYqeL # from case 42\n"
        "BTC 1A1zP1eP5QGefi2DMPTfTL5SLmv7DivfNa");

    auto const requests = readBatch(in, "batch.txt");
    REQUIRE(requests.size() == 4);
    CHECK(requests[0].first == "ETH");
    CHECK(requests[0].second == "0x7f367cc41522ce07553e823bf3be79a889debe1b");
    CHECK(requests[1].first == "XBT");
    CHECK(requests[1].second == "bc1qxy2kgdygjrsqtzq2n0yrf2493p83kkfjhx0wlh");
    CHECK(requests[2].first == "TRX");
    CHECK(requests[2].second == "TNPeeaaFB7K9cmo4uQpcU32zGK8G1NYqeL");
    CHECK(requests[3].first == "BTC");
    CHECK(requests[3].second == "1A1zP1eP5QGefi2DMPTfTL5SLmv7DivfNa");
}

TEST_CASE("empty batches are allowed")
{
    std::istringstream in("\n# nothing to screen\n\n");
    CHECK(readBatch(in, "stdin").empty());
}

TEST_CASE("lines without exactly two fields are rejected")
{
    {
        std::istringstream in("ETH\n");
        CHECK_THROWS_AS(readBatch(in, "batch.txt"), std::runtime_error);
    }
    {
        std::istringstream in(
            "ETH 0x7f367cc41522ce07553e823bf3be79a889debe1b\n"
            "ETH 0x7f367cc41522ce07553e823bf3be79a889debe1b extra\n");
        try
        {
            readBatch(in, "batch.txt");
            FAIL("three fields accepted");
        }
        catch (std::runtime_error const& e)
        {
            CHECK(std::string(e.what()).find("batch.txt:2") == 0);
        }
    }
}

TEST_CASE("exit status reflects any match")
{
    CHECK(exitStatus({}) == exitNoMatch);
    CHECK(exitStatus({resultWithMatch(false)}) == exitNoMatch);
    CHECK(
        exitStatus({resultWithMatch(false), resultWithMatch(true)}) ==
        exitMatch);
    CHECK(exitNoMatch == 0);
    CHECK(exitFailure == 1);
    CHECK(exitMatch == 2);
}

TEST_SUITE_END();
