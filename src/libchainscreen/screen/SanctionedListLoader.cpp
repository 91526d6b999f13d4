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
#include <chainscreen/protocol/AddressSyntax.h>
#include <chainscreen/protocol/Chain.h>
#include <chainscreen/protocol/jss.h>
#include <chainscreen/screen/SanctionedListLoader.h>

#include <boost/algorithm/string.hpp>

#include <json/reader.h>

#include <fstream>
#include <sstream>

namespace chainscreen {

namespace {

Json::Value
parseDocument(std::string const& content)
{
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    builder["failIfExtra"] = true;
    std::unique_ptr<Json::CharReader> const reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(
            content.data(), content.data() + content.size(), &root, &errors))
        throw MalformedListError("List document is not valid JSON: " + errors);

    if (!root.isObject())
        throw MalformedListError("List document must be a JSON object");

    return root;
}

// Absent and null fields take the fallback; any other non-string is an error.
std::string
metadataField(
    Json::Value const& metadata,
    Json::StaticString const& field,
    std::string const& fallback)
{
    if (!metadata.isMember(field) || metadata[field].isNull())
        return fallback;

    if (!metadata[field].isString())
        throw MalformedListError(
            std::string("Metadata field '") + field.c_str() +
            "' must be a string");

    return metadata[field].asString();
}

ListVersion
parseListVersion(Json::Value const& root)
{
    static Json::Value const empty(Json::objectValue);

    Json::Value const* metadata = &empty;
    if (root.isMember(jss::metadata) && !root[jss::metadata].isNull())
    {
        if (!root[jss::metadata].isObject())
            throw MalformedListError("'metadata' must be a JSON object");
        metadata = &root[jss::metadata];
    }

    ListVersion version;
    version.source = metadataField(*metadata, jss::source, "unknown");
    version.contentHash = metadataField(*metadata, jss::sha256, "");
    version.uri = metadataField(*metadata, jss::uri, "");

    auto const retrieved = metadataField(*metadata, jss::retrieved_at_utc, "");
    if (retrieved.empty())
    {
        version.retrievedAt = UtcClock::time_point{};
    }
    else if (auto const tp = parseIso8601(retrieved))
    {
        version.retrievedAt = *tp;
    }
    else
    {
        throw MalformedListError(
            "Metadata field 'retrieved_at_utc' is not an ISO-8601 "
            "timestamp: " +
            retrieved);
    }

    return version;
}

std::string
entryField(
    Json::Value const& entry,
    Json::StaticString const& field,
    Json::ArrayIndex index)
{
    if (!entry.isMember(field))
        throw MalformedListError(
            "addresses[" + std::to_string(index) + "] is missing '" +
            field.c_str() + "'");

    if (!entry[field].isString())
        throw MalformedListError(
            "addresses[" + std::to_string(index) + "]." + field.c_str() +
            " must be a string");

    auto value = boost::trim_copy(entry[field].asString());
    if (value.empty())
        throw MalformedListError(
            "addresses[" + std::to_string(index) + "]." + field.c_str() +
            " is empty");

    return value;
}

}  // namespace

std::shared_ptr<SanctionedList const>
parseSanctionedList(std::string const& content, Journal j)
{
    auto const root = parseDocument(content);

    if (!root.isMember(jss::addresses))
        throw MalformedListError("List document has no 'addresses' array");

    Json::Value const& addresses = root[jss::addresses];
    if (!addresses.isArray())
        throw MalformedListError("'addresses' must be a JSON array");

    auto list = std::make_shared<SanctionedList>();
    list->version = parseListVersion(root);

    std::size_t duplicates = 0;
    std::size_t unusable = 0;
    std::size_t unrecognized = 0;

    for (Json::ArrayIndex i = 0; i < addresses.size(); ++i)
    {
        Json::Value const& entry = addresses[i];
        if (!entry.isObject())
            throw MalformedListError(
                "addresses[" + std::to_string(i) + "] is not a JSON object");

        auto const chain = entryField(entry, jss::chain, i);
        auto const address = entryField(entry, jss::address, i);

        // Screening rejects these before lookup, so they can never match
        if (!isSyntacticallyValid(chain, address))
        {
            ++unusable;
            JLOG(j.debug()) << "Entry " << i << " (" << chain << ", " << address
                            << ") fails address syntax for its chain";
        }

        if (!isRecognizedChain(chain))
            ++unrecognized;

        if (!list->addresses.insert(chain, address))
            ++duplicates;
    }

    if (duplicates != 0)
    {
        JLOG(j.debug()) << "Collapsed " << duplicates
                        << " duplicate entries after canonicalization";
    }

    if (unusable != 0)
    {
        JLOG(j.warn()) << unusable << " of " << addresses.size()
                       << " entries fail address syntax and cannot match";
    }

    if (unrecognized != 0)
    {
        JLOG(j.info()) << unrecognized
                       << " entries use chains without a known ticker";
    }

    JLOG(j.info()) << "Loaded " << list->addresses.size()
                   << " sanctioned addresses from " << list->version.source
                   << " retrieved " << toIso8601(list->version.retrievedAt);

    return list;
}

std::shared_ptr<SanctionedList const>
loadSanctionedList(std::string const& path, Journal j)
{
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in)
        throw std::runtime_error("Unable to open sanctions list: " + path);

    std::ostringstream contents;
    contents << in.rdbuf();
    if (in.bad())
        throw std::runtime_error("Unable to read sanctions list: " + path);

    JLOG(j.debug()) << "Read " << contents.str().size() << " bytes from "
                    << path;

    try
    {
        return parseSanctionedList(contents.str(), j);
    }
    catch (MalformedListError const& e)
    {
        JLOG(j.error()) << "Rejected sanctions list " << path << ": "
                        << e.what();
        throw;
    }
}

}  // namespace chainscreen
