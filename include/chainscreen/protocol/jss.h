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

#ifndef CHAINSCREEN_PROTOCOL_JSONFIELDS_H_INCLUDED
#define CHAINSCREEN_PROTOCOL_JSONFIELDS_H_INCLUDED

#include <json/value.h>

namespace chainscreen {
namespace jss {

// JSON static strings

#define JSS(x) inline ::Json::StaticString const x(#x)

/* The "StaticString" field names are used instead of string literals to
   optimize the performance of accessing properties of Json::Value objects.

   Most strings have a trailing comment. Here is the legend:

   in: Read by the given loader or command line option
   out: Written by the given object or command
*/

JSS(address);            // in: list entry; out: ScreenResult
JSS(addresses);          // in: list document
JSS(by_chain);           // out: ScreeningService
JSS(chain);              // in: list entry; out: ScreenResult
JSS(chain_recognized);   // out: ScreenResult
JSS(entries);            // out: ScreeningService
JSS(error);              // out: chainscreen
JSS(error_message);      // out: chainscreen
JSS(family);             // out: ScreenResult
JSS(list_version);       // out: ScreenResult, ScreeningService
JSS(loaded);             // out: ScreeningService
JSS(match);              // out: ScreenResult
JSS(metadata);           // in: list document
JSS(reason);             // out: ScreenResult
JSS(retrieved_at_utc);   // in: list metadata; out: ListVersion
JSS(risk_score);         // out: ScreenResult
JSS(sha256);             // in: list metadata; out: ListVersion
JSS(source);             // in: list metadata; out: ListVersion
JSS(uri);                // in: list metadata; out: ListVersion

#undef JSS

}  // namespace jss
}  // namespace chainscreen

#endif
