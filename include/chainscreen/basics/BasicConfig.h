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

#ifndef CHAINSCREEN_BASICS_BASICCONFIG_H_INCLUDED
#define CHAINSCREEN_BASICS_BASICCONFIG_H_INCLUDED

#include <boost/lexical_cast.hpp>

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace chainscreen {

using IniFileSections =
    std::unordered_map<std::string, std::vector<std::string>>;

//------------------------------------------------------------------------------

/** Holds a collection of configuration values.
    A configuration file contains zero or more sections.
*/
class Section
{
private:
    std::string name_;
    std::unordered_map<std::string, std::string> lookup_;
    std::vector<std::string> lines_;

public:
    /** Create an empty section. */
    explicit Section(std::string const& name = "");

    /** Get the legacy value for this section.
        @return The retrieved value. A section with an empty legacy value
                returns an empty string.
        @throws std::runtime_error if the section holds more than one line
    */
    std::string
    legacy() const;

    /** Set a key/value pair.
        The previous value is discarded.
    */
    void
    set(std::string const& key, std::string const& value);

    /** Append a set of lines to this section.
        Lines containing key/value pairs are added to the map. Everything is
        added to the lines list.
    */
    void
    append(std::vector<std::string> const& lines);

    template <class T = std::string>
    std::optional<T>
    get(std::string const& name) const
    {
        auto const iter = lookup_.find(name);
        if (iter == lookup_.end())
            return std::nullopt;
        return boost::lexical_cast<T>(iter->second);
    }
};

//------------------------------------------------------------------------------

/** Holds unparsed configuration information.
    The raw data sections are processed with intermediate parsers specific
    to each module instead of being all parsed in a central location.
*/
class BasicConfig
{
private:
    std::unordered_map<std::string, Section> map_;

public:
    virtual ~BasicConfig() = default;

    /** Returns `true` if a section with the given name exists. */
    bool
    exists(std::string const& name) const;

    /** Returns the section with the given name.
        If the section does not exist, an empty section is returned.
    */
    Section const&
    section(std::string const& name) const;

protected:
    void
    build(IniFileSections const& ifs);
};

//------------------------------------------------------------------------------

/** Parse an INI-style document into its sections.
    Lines starting with '#' are comments. Text before the first section
    header lands in the unnamed section.
*/
IniFileSections
parseIniFile(std::string const& strInput, bool const bTrim);

}  // namespace chainscreen

#endif
