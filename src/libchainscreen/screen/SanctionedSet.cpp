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

#include <chainscreen/protocol/Canonicalize.h>
#include <chainscreen/protocol/Chain.h>
#include <chainscreen/screen/SanctionedSet.h>

#include <boost/container_hash/hash.hpp>

#include <utility>

namespace std {

std::size_t
hash<chainscreen::SanctionedEntry>::operator()(
    chainscreen::SanctionedEntry const& entry) const
{
    std::size_t seed = 0;
    boost::hash_combine(seed, entry.chain);
    boost::hash_combine(seed, entry.address);
    return seed;
}

}  // namespace std

namespace chainscreen {

bool
SanctionedSet::insert(std::string const& chain, std::string const& address)
{
    SanctionedEntry entry{resolveChain(chain), canonicalize(chain, address)};
    return entries_.insert(std::move(entry)).second;
}

bool
SanctionedSet::contains(
    std::string const& chain,
    std::string const& canonical) const
{
    return entries_.count(SanctionedEntry{resolveChain(chain), canonical}) != 0;
}

std::map<std::string, std::size_t>
SanctionedSet::countByChain() const
{
    std::map<std::string, std::size_t> counts;
    for (auto const& entry : entries_)
        ++counts[entry.chain];
    return counts;
}

}  // namespace chainscreen
