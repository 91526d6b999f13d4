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

#ifndef CHAINSCREEN_APP_SCREENINGSERVICE_H_INCLUDED
#define CHAINSCREEN_APP_SCREENINGSERVICE_H_INCLUDED

#include <chainscreen/basics/Log.h>
#include <chainscreen/screen/SanctionedSet.h>
#include <chainscreen/screen/Screen.h>

#include <json/value.h>

#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace chainscreen {

class Config;

/**
 * ScreeningService owns the sanctions list in force and screens addresses
 * against it.
 *
 * The list is an immutable snapshot. A refresh builds a complete new list
 * and swaps the pointer, so a screening call observes either the old or
 * the new list in full, never a partially populated one. A failed refresh
 * leaves the previous snapshot in force.
 */
class ScreeningService
{
public:
    using Request = std::pair<std::string, std::string>;

    ScreeningService(Config const& config, Journal journal);
    ~ScreeningService() = default;

    /**
     * Load a list document and make it the snapshot in force.
     * @throws std::runtime_error or MalformedListError; the previous
     *         snapshot is kept
     */
    void
    load(std::string const& path);

    /** Make an already built list the snapshot in force. */
    void
    install(std::shared_ptr<SanctionedList const> list);

    /** The snapshot in force, or nullptr before the first load. */
    std::shared_ptr<SanctionedList const>
    current() const;

    /**
     * Screen one address against the snapshot in force.
     * @throws std::runtime_error if no list has been loaded
     */
    ScreenResult
    screen(std::string const& chain, std::string const& address) const;

    /**
     * Screen a batch of (chain, address) requests against one snapshot.
     * @throws std::runtime_error if no list has been loaded
     */
    std::vector<ScreenResult>
    screenBatch(std::vector<Request> const& requests) const;

    /** Version and size of the snapshot in force. */
    Json::Value
    getJson() const;

private:
    std::shared_ptr<SanctionedList const>
    snapshot() const;

    ScreenResult
    screen(
        SanctionedList const& list,
        std::string const& chain,
        std::string const& address) const;

    Journal j_;
    bool const warnUnknownChains_;

    mutable std::mutex mutex_;
    std::shared_ptr<SanctionedList const> list_;
};

}  // namespace chainscreen

#endif
