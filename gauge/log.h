#ifndef __GAUGE_LOG_H__
#define __GAUGE_LOG_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <list>
#include <set>
#include <sstream>
#include <string>

#include <boost/date_time/posix_time/ptime.hpp>
#include <boost/enable_shared_from_this.hpp>
#include <boost/function.hpp>
#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/weak_ptr.hpp>

#include "predef.h"
// For tid_t
#include "thread.h"

namespace Gauge {

class Logger;
class LogSink;
class Stream;

/// Access to the process-wide tree of Loggers
/// @sa LogMacros
class Log
{
private:
    Log();

public:
    enum Level {
        NONE,
        FATAL,
        ERROR,
        WARNING,
        INFO,
        VERBOSE,
        DEBUG,
        TRACE
    };

    /// @return The Logger named name, creating it (and any missing
    /// ancestors) if necessary.  Names are ':' separated, e.g.
    /// "gauge:streams:fd"
    static boost::shared_ptr<Logger> lookup(const std::string &name);
    /// @return The root Logger; every other Logger descends from it
    static boost::shared_ptr<Logger> root();

    /// Call dg for every Logger, breadth first from the root
    static void visit(boost::function<void (boost::shared_ptr<Logger>)> dg);
};

/// Abstract base class for receiving log messages
/// @sa Log
class LogSink
{
    friend class Logger;
public:
    typedef boost::shared_ptr<LogSink> ptr;
public:

    virtual ~LogSink() {}
    /// @brief Receives details of a single log message
    /// @param logger The Logger that generated the message
    /// @param now The timestamp when the message was generated
    /// @param elapsed Microseconds since the process started when the message
    /// was generated
    /// @param thread The id of the thread that generated the message
    /// @param level The level of the message
    /// @param str The log message itself
    /// @param file The source file where the message was generated
    /// @param line The source line where the message was generated
    virtual void log(const std::string &logger,
        boost::posix_time::ptime now, unsigned long long elapsed,
        tid_t thread, Log::Level level, const std::string &str,
        const char *file, int line) = 0;
};

/// A LogSink that dumps message to stdout (std::cout)
class StdoutLogSink : public LogSink
{
public:
    void log(const std::string &logger,
        boost::posix_time::ptime now, unsigned long long elapsed,
        tid_t thread, Log::Level level, const std::string &str,
        const char *file, int line);
};

/// A LogSink that sends messages to syslog
class SyslogLogSink : public LogSink
{
public:
    /// @param facility The facility to mark messages with
    SyslogLogSink(int facility);

    void log(const std::string &logger,
        boost::posix_time::ptime now, unsigned long long elapsed,
        tid_t thread, Log::Level level, const std::string &str,
        const char *file, int line);

    int facility() const { return m_facility; }

    /// @return The syslog facility named str, or -1
    static int facilityFromString(const char *str);
    static const char *facilityToString(int facility);

private:
    int m_facility;
};

/// A LogSink that appends messages to a file
///
/// The file is opened in append mode, so multiple processes and threads can
/// log to the same file simultaneously; each message is written atomically
class FileLogSink : public LogSink
{
public:
    /// @param file The file to open and log to.  If it does not exist, it is
    /// created.
    FileLogSink(const std::string &file);

    void log(const std::string &logger,
        boost::posix_time::ptime now, unsigned long long elapsed,
        tid_t thread, Log::Level level, const std::string &str,
        const char *file, int line);

    std::string file() const { return m_file; }

private:
    std::string m_file;
    boost::shared_ptr<Stream> m_stream;
};

/// LogEvent is an intermediary class.  It is returned by Logger::log, owns a
/// std::ostream, and on destruction it will log whatever was streamed to it.
/// It *is* copyable, because it is returned from Logger::log, but shouldn't
/// be copied, because when it destructs it will log whatever was built up so
/// far, in addition to the copy logging it.
struct LogEvent
{
    friend class Logger;
private:
    LogEvent(boost::shared_ptr<Logger> logger, Log::Level level,
        const char *file, int line)
        : m_logger(logger),
          m_level(level),
          m_file(file),
          m_line(line)
    {}

public:
    LogEvent(const LogEvent &copy)
        : m_logger(copy.m_logger),
          m_level(copy.m_level),
          m_file(copy.m_file),
          m_line(copy.m_line)
    {}

    ~LogEvent();
    std::ostream &os() { return m_os; }

private:
    boost::shared_ptr<Logger> m_logger;
    Log::Level m_level;
    const char *m_file;
    int m_line;
    std::ostringstream m_os;
};

/// Temporarily disables logging for this thread
struct LogDisabler : boost::noncopyable
{
    LogDisabler();
    ~LogDisabler();

private:
    bool m_disabled;
};

struct LoggerLess
{
    bool operator()(const boost::shared_ptr<Logger> &lhs,
        const boost::shared_ptr<Logger> &rhs) const;
};

/// An individual Logger.
/// @sa Log
/// @sa LogMacros
class Logger : public boost::enable_shared_from_this<Logger>,
    boost::noncopyable
{
    friend class Log;
    friend struct LoggerLess;
public:
    typedef boost::shared_ptr<Logger> ptr;
private:
    Logger();
    Logger(const std::string &name, Logger::ptr parent);

public:
    /// @return If this logger is enabled at level
    bool enabled(Log::Level level);
    /// Set this logger to level
    /// @param level The level to set it to
    /// @param propagate Automatically set all child Loggers to this level also
    void level(Log::Level level, bool propagate = true);
    /// @return The current level this Logger is set to
    Log::Level level() const { return m_level; }

    /// @return If this logger will inherit LogSinks from its parent
    bool inheritSinks() const { return m_inheritSinks; }
    /// Set if this logger will inherit LogSinks from its parent
    void inheritSinks(bool inherit) { m_inheritSinks = inherit; }
    /// Add sink to this Logger
    void addSink(LogSink::ptr sink) { m_sinks.push_back(sink); }
    /// Remove sink from this Logger
    void removeSink(LogSink::ptr sink);
    /// Remove all LogSinks from this logger
    void clearSinks() { m_sinks.clear(); }

    /// Return a LogEvent to use to stream a log message applicable to this
    /// Logger
    /// @param level The level this message will be
    LogEvent log(Log::Level level, const char *file = NULL, int line = -1)
    { return LogEvent(shared_from_this(), level, file, line); }
    /// Log a message from this Logger
    /// @param level The level of this message
    /// @param str The message
    void log(Log::Level level, const std::string &str,
        const char *file = NULL, int line = 0);

    /// @return The full name of this Logger
    std::string name() const { return m_name; }

    /// @return The list of sinks for this Logger
    const std::list<LogSink::ptr> &sinks() const { return m_sinks; }

private:
    std::string m_name;
    boost::weak_ptr<Logger> m_parent;
    std::set<Logger::ptr, LoggerLess> m_children;
    Log::Level m_level;
    std::list<LogSink::ptr> m_sinks;
    bool m_inheritSinks;
};

/// @defgroup LogMacros Logging Macros
/// Macros that automatically capture the current file and line, and return
/// a std::ostream & to stream the log message to.  Note that it is *not* an
/// rvalue, because it is put inside an un-scoped if statement, so that the
/// entire streaming of the log statement can be skipped if the Logger is not
/// enabled at the specified level.
/// @sa Log
/// @{

/// @brief Log at a particular level
/// @param level The level to log at
#define GAUGE_LOG_LEVEL(lg, level) if ((lg)->enabled(level))                    \
    (lg)->log(level, __FILE__, __LINE__).os()
/// Log a fatal error
#define GAUGE_LOG_FATAL(log) GAUGE_LOG_LEVEL(log, ::Gauge::Log::FATAL)
/// Log an error
#define GAUGE_LOG_ERROR(log) GAUGE_LOG_LEVEL(log, ::Gauge::Log::ERROR)
/// Log a warning
#define GAUGE_LOG_WARNING(log) GAUGE_LOG_LEVEL(log, ::Gauge::Log::WARNING)
/// Log an informational message
#define GAUGE_LOG_INFO(log) GAUGE_LOG_LEVEL(log, ::Gauge::Log::INFO)
/// Log a verbose message
#define GAUGE_LOG_VERBOSE(log) GAUGE_LOG_LEVEL(log, ::Gauge::Log::VERBOSE)
/// Log a debug message
#define GAUGE_LOG_DEBUG(log) GAUGE_LOG_LEVEL(log, ::Gauge::Log::DEBUG)
/// Log a trace message
#define GAUGE_LOG_TRACE(log) GAUGE_LOG_LEVEL(log, ::Gauge::Log::TRACE)
/// @}

/// Streams a Log::Level as a string, instead of an integer
std::ostream &operator <<(std::ostream &os, Gauge::Log::Level level);
/// Parses a level name ("error", "WARN", "debug", ...) as streamed by
/// operator <<; case insensitive
std::istream &operator >>(std::istream &is, Gauge::Log::Level &level);

}

#endif
