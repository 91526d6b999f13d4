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

#ifndef CHAINSCREEN_SCREEN_SANCTIONEDSET_H_INCLUDED
#define CHAINSCREEN_SCREEN_SANCTIONEDSET_H_INCLUDED

#include <chainscreen/screen/ListVersion.h>

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <unordered_set>

namespace chainscreen {

/** A normalized (chain, canonical address) pair. */
struct SanctionedEntry
{
    std::string chain;
    std::string address;

    bool
    operator==(SanctionedEntry const& other) const
    {
        return chain == other.chain && address == other.address;
    }
};

}  // namespace chainscreen

namespace std {

template <>
struct hash<chainscreen::SanctionedEntry>
{
    std::size_t
    operator()(chainscreen::SanctionedEntry const& entry) const;
};

}  // namespace std

namespace chainscreen {

/**
 * Set of sanctioned addresses keyed by resolved chain and canonical address.
 *
 * Entries are canonicalized on insertion with the same rules the screening
 * engine applies, so callers pass addresses exactly as the list carries them.
 * Once built, a set is only read and may be shared between threads.
 */
class SanctionedSet
{
public:
    SanctionedSet() = default;

    /**
     * Canonicalize and insert an address.
     * @return false if the canonical pair was already present
     */
    bool
    insert(std::string const& chain, std::string const& address);

    /**
     * Membership test for an address that is already canonical.
     * @param chain Any ticker; it is resolved through the alias table
     */
    bool
    contains(std::string const& chain, std::string const& canonical) const;

    std::size_t
    size() const
    {
        return entries_.size();
    }

    bool
    empty() const
    {
        return entries_.empty();
    }

    /** Number of entries per resolved chain. */
    std::map<std::string, std::size_t>
    countByChain() const;

private:
    std::unordered_set<SanctionedEntry> entries_;
};

/** A sanctioned set together with the list version it was built from. */
struct SanctionedList
{
    ListVersion version;
    SanctionedSet addresses;
};

}  // namespace chainscreen

#endif
