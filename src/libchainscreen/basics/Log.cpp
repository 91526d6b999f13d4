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

#include <chainscreen/basics/Log.h>

#include <boost/algorithm/string.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

#include <iostream>

namespace chainscreen {

Journal::Sink::Sink(Severity thresh, bool console)
    : thresh_(thresh), console_(console)
{
}

bool
Journal::Sink::active(Severity level) const
{
    return level >= thresh_;
}

bool
Journal::Sink::console() const
{
    return console_;
}

void
Journal::Sink::console(bool output)
{
    console_ = output;
}

Journal::Severity
Journal::Sink::threshold() const
{
    return thresh_;
}

void
Journal::Sink::threshold(Severity thresh)
{
    thresh_ = thresh;
}

//------------------------------------------------------------------------------

namespace {

class NullJournalSink : public Journal::Sink
{
public:
    NullJournalSink() : Sink(Journal::kDisabled, false)
    {
    }

    ~NullJournalSink() override = default;

    bool
    active(Journal::Severity) const override
    {
        return false;
    }

    bool
    console() const override
    {
        return false;
    }

    void
    console(bool) override
    {
    }

    Journal::Severity
    threshold() const override
    {
        return Journal::kDisabled;
    }

    void
    threshold(Journal::Severity) override
    {
    }

    void
    write(Journal::Severity, std::string const&) override
    {
    }
};

}  // namespace

Journal::Sink&
Journal::getNullSink()
{
    static NullJournalSink sink;
    return sink;
}

//------------------------------------------------------------------------------

Journal::ScopedStream::ScopedStream(Sink& sink, Severity level)
    : sink_(sink), level_(level)
{
    // Modifiers applied from all ctors
    ostream_ << std::boolalpha << std::showbase;
}

Journal::ScopedStream::~ScopedStream()
{
    std::string const& s(ostream_.str());
    if (!s.empty())
    {
        if (s == "\n")
            sink_.write(level_, "");
        else
            sink_.write(level_, s);
    }
}

//------------------------------------------------------------------------------

Logs::Sink::Sink(
    std::string const& partition,
    Journal::Severity thresh,
    Logs& logs)
    : Journal::Sink(thresh, false), logs_(logs), partition_(partition)
{
}

void
Logs::Sink::write(Journal::Severity level, std::string const& text)
{
    if (level < threshold())
        return;

    logs_.write(level, partition_, text, console());
}

//------------------------------------------------------------------------------

bool
Logs::File::isOpen() const noexcept
{
    return stream_ != nullptr;
}

bool
Logs::File::open(std::string const& path)
{
    close();

    auto stream =
        std::make_unique<std::ofstream>(path, std::ios::out | std::ios::app);

    if (!stream->good())
        return false;

    stream_ = std::move(stream);
    path_ = path;
    return true;
}

void
Logs::File::close()
{
    stream_ = nullptr;
}

void
Logs::File::writeln(std::string const& text)
{
    if (stream_ != nullptr)
    {
        (*stream_) << text << std::endl;
    }
}

//------------------------------------------------------------------------------

Logs::Logs(Journal::Severity thresh) : thresh_(thresh)
{
}

bool
Logs::open(std::string const& pathToLogFile)
{
    std::lock_guard lock(mutex_);
    return file_.open(pathToLogFile);
}

Journal::Sink&
Logs::get(std::string const& name)
{
    std::lock_guard lock(mutex_);
    auto const result = sinks_.emplace(name, makeSink(name, thresh_));
    return *result.first->second;
}

Journal::Sink&
Logs::operator[](std::string const& name)
{
    return get(name);
}

Journal
Logs::journal(std::string const& name)
{
    return Journal(get(name));
}

Journal::Severity
Logs::threshold() const
{
    std::lock_guard lock(mutex_);
    return thresh_;
}

void
Logs::threshold(Journal::Severity thresh)
{
    std::lock_guard lock(mutex_);
    thresh_ = thresh;
    for (auto& sink : sinks_)
        sink.second->threshold(thresh);
}

void
Logs::write(
    Journal::Severity level,
    std::string const& partition,
    std::string const& text,
    bool console)
{
    std::string const s = format(partition, level, text);

    std::lock_guard lock(mutex_);
    file_.writeln(s);
    if (!silent_ || console)
        std::cerr << s << '\n';
}

std::unique_ptr<Journal::Sink>
Logs::makeSink(std::string const& name, Journal::Severity threshold)
{
    return std::make_unique<Sink>(name, threshold, *this);
}

std::string
Logs::toString(Journal::Severity s)
{
    switch (s)
    {
        case Journal::kTrace:
            return "Trace";
        case Journal::kDebug:
            return "Debug";
        case Journal::kInfo:
            return "Info";
        case Journal::kWarning:
            return "Warning";
        case Journal::kError:
            return "Error";
        case Journal::kFatal:
            return "Fatal";
        default:
            break;
    }
    return "Unknown";
}

std::optional<Journal::Severity>
Logs::fromString(std::string const& s)
{
    auto const level = boost::algorithm::to_lower_copy(boost::trim_copy(s));

    if (level == "trace")
        return Journal::kTrace;

    if (level == "debug")
        return Journal::kDebug;

    if (level == "info" || level == "information")
        return Journal::kInfo;

    if (level == "warn" || level == "warning" || level == "warnings")
        return Journal::kWarning;

    if (level == "error" || level == "errors")
        return Journal::kError;

    if (level == "fatal" || level == "fatals")
        return Journal::kFatal;

    return std::nullopt;
}

std::string
Logs::format(
    std::string const& partition,
    Journal::Severity severity,
    std::string const& message)
{
    std::string output;
    output.reserve(message.size() + partition.size() + 48);

    output = boost::posix_time::to_simple_string(
        boost::posix_time::microsec_clock::universal_time());
    output += " UTC ";

    if (!partition.empty())
        output += partition + ":";

    switch (severity)
    {
        case Journal::kTrace:
            output += "TRC ";
            break;
        case Journal::kDebug:
            output += "DBG ";
            break;
        case Journal::kInfo:
            output += "NFO ";
            break;
        case Journal::kWarning:
            output += "WRN ";
            break;
        case Journal::kError:
            output += "ERR ";
            break;
        default:
            output += "FTL ";
            break;
    }

    output += message;

    // Limit the maximum length of the output
    if (output.size() > 8192)
    {
        output.resize(8192 - 3);
        output += "...";
    }

    return output;
}

}  // namespace chainscreen
