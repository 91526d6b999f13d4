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

#ifndef CHAINSCREEN_BASICS_LOG_H_INCLUDED
#define CHAINSCREEN_BASICS_LOG_H_INCLUDED

#include <atomic>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace chainscreen {

/** A generic endpoint for log messages.

    The Journal has a single stream for each severity level. Messages are
    assembled in a ScopedStream and handed to the Sink when the statement
    completes, so a line is only written if its severity is active.
*/
class Journal
{
public:
    /** Severity level of the message. */
    enum Severity {
        kAll = 0,

        kTrace = kAll,
        kDebug,
        kInfo,
        kWarning,
        kError,
        kFatal,

        kDisabled,
        kNone = kDisabled
    };

    /** Abstraction for the underlying message destination. */
    class Sink
    {
    protected:
        Sink(Severity thresh, bool console);

    public:
        Sink() = delete;
        Sink(Sink const&) = delete;
        Sink&
        operator=(Sink const&) = delete;

        virtual ~Sink() = default;

        /** Returns `true` if text at the passed severity produces output. */
        virtual bool
        active(Severity level) const;

        /** Returns `true` if a message is also written to the console. */
        virtual bool
        console() const;

        virtual void
        console(bool output);

        virtual Severity
        threshold() const;

        virtual void
        threshold(Severity thresh);

        /** Write text to the sink at the specified severity. */
        virtual void
        write(Severity level, std::string const& text) = 0;

    private:
        std::atomic<Severity> thresh_;
        std::atomic<bool> console_;
    };

    class Stream;

    /** Scoped ostream-based container for writing messages to a Journal. */
    class ScopedStream
    {
    public:
        ScopedStream(ScopedStream const& other)
            : ScopedStream(other.sink_, other.level_)
        {
        }

        ScopedStream(Sink& sink, Severity level);

        template <typename T>
        ScopedStream(Stream const& stream, T const& t);

        ScopedStream&
        operator=(ScopedStream const&) = delete;

        ~ScopedStream();

        std::ostringstream&
        ostream() const
        {
            return ostream_;
        }

        template <typename T>
        std::ostream&
        operator<<(T const& t) const
        {
            ostream_ << t;
            return ostream_;
        }

    private:
        Sink& sink_;
        Severity const level_;
        std::ostringstream mutable ostream_;
    };

    /** Provide a light-weight way to check active() before string formatting */
    class Stream
    {
    public:
        Stream(Sink& sink, Severity level) : sink_(sink), level_(level)
        {
        }

        Stream(Stream const& other) : Stream(other.sink_, other.level_)
        {
        }

        Stream&
        operator=(Stream const& other) = delete;

        Sink&
        sink() const
        {
            return sink_;
        }

        Severity
        level() const
        {
            return level_;
        }

        bool
        active() const
        {
            return sink_.active(level_);
        }

        explicit
        operator bool() const
        {
            return active();
        }

        template <typename T>
        ScopedStream
        operator<<(T const& t) const
        {
            return ScopedStream(*this, t);
        }

    private:
        Sink& sink_;
        Severity const level_;
    };

    Journal() = delete;

    explicit Journal(Sink& sink) : sink_(&sink)
    {
    }

    Sink&
    sink() const
    {
        return *sink_;
    }

    Stream
    stream(Severity level) const
    {
        return Stream(*sink_, level);
    }

    bool
    active(Severity level) const
    {
        return sink_->active(level);
    }

    Stream
    trace() const
    {
        return {*sink_, kTrace};
    }

    Stream
    debug() const
    {
        return {*sink_, kDebug};
    }

    Stream
    info() const
    {
        return {*sink_, kInfo};
    }

    Stream
    warn() const
    {
        return {*sink_, kWarning};
    }

    Stream
    error() const
    {
        return {*sink_, kError};
    }

    Stream
    fatal() const
    {
        return {*sink_, kFatal};
    }

    /** Returns a Sink which does nothing. */
    static Sink&
    getNullSink();

private:
    Sink* sink_;
};

template <typename T>
Journal::ScopedStream::ScopedStream(Stream const& stream, T const& t)
    : ScopedStream(stream.sink(), stream.level())
{
    ostream_ << t;
}

//------------------------------------------------------------------------------

/** Manages partitions for logging. */
class Logs
{
private:
    class Sink : public Journal::Sink
    {
    private:
        Logs& logs_;
        std::string partition_;

    public:
        Sink(
            std::string const& partition,
            Journal::Severity thresh,
            Logs& logs);

        Sink(Sink const&) = delete;
        Sink&
        operator=(Sink const&) = delete;

        void
        write(Journal::Severity level, std::string const& text) override;
    };

    /** Manages a system file containing logged output. */
    class File
    {
    public:
        File() = default;
        ~File() = default;

        bool
        isOpen() const noexcept;

        bool
        open(std::string const& path);

        void
        close();

        void
        writeln(std::string const& text);

    private:
        std::unique_ptr<std::ofstream> stream_;
        std::string path_;
    };

    std::mutex mutable mutex_;
    std::map<std::string, std::unique_ptr<Journal::Sink>> sinks_;
    Journal::Severity thresh_;
    File file_;
    std::atomic<bool> silent_{false};

public:
    explicit Logs(Journal::Severity level);

    Logs(Logs const&) = delete;
    Logs&
    operator=(Logs const&) = delete;

    virtual ~Logs() = default;

    /** Open the debug log file; returns false if it cannot be opened. */
    bool
    open(std::string const& pathToLogFile);

    Journal::Sink&
    get(std::string const& name);

    Journal::Sink&
    operator[](std::string const& name);

    Journal
    journal(std::string const& name);

    Journal::Severity
    threshold() const;

    /** Set the threshold of every partition, present and future. */
    void
    threshold(Journal::Severity thresh);

    void
    write(
        Journal::Severity level,
        std::string const& partition,
        std::string const& text,
        bool console);

    /** Suppress console output; the log file still receives every line. */
    void
    silent(bool bSilent)
    {
        silent_ = bSilent;
    }

    static std::string
    toString(Journal::Severity s);

    static std::optional<Journal::Severity>
    fromString(std::string const& s);

    static std::string
    format(
        std::string const& partition,
        Journal::Severity severity,
        std::string const& message);

protected:
    virtual std::unique_ptr<Journal::Sink>
    makeSink(std::string const& partition, Journal::Severity startingLevel);
};

// Wraps a Journal::Stream to skip evaluation of expensive argument lists
// if the stream is not active.
#ifndef JLOG
#define JLOG(x) \
    if (!x)     \
    {           \
    }           \
    else        \
        x
#endif

}  // namespace chainscreen

#endif
