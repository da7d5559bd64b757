#ifndef __GAUGE_READ_LOGGER_STREAM_H__
#define __GAUGE_READ_LOGGER_STREAM_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <iosfwd>
#include <string>

#include <boost/noncopyable.hpp>

#include "filter.h"
#include "gauge/log.h"

namespace Gauge {

/// Counters kept by a ReadStatsLogger
struct ReadStats
{
    ReadStats()
        : readCount(0),
          bytesTotal(0)
    {}

    /// Number of reads that returned, including those that hit EOF
    unsigned long long readCount;
    /// Sum of the byte counts those reads returned
    unsigned long long bytesTotal;
};

std::ostream &operator <<(std::ostream &os, const ReadStats &stats);

/// @brief Keeps read statistics and reports every read to a Logger
/// @details
/// On construction a header line declaring the fields is logged:
/// @code
/// Initialize Read logger 'READ',tag,begin,end,length,request_length,count,bytes_total
/// @endcode
/// and then one line per read:
/// @code
/// Read 0-236 (237 bytes). Total requests: 1 (237 bytes),READ,0,236,237,8192,1,237
/// @endcode
/// begin and end are offsets into the bytes seen so far, not stream
/// positions; an empty read logs end == begin - 1.
class ReadStatsLogger : boost::noncopyable
{
public:
    ReadStatsLogger(Logger::ptr logger, Log::Level level,
        const std::string &tag);

    /// Record one read that returned length bytes for a request of requested
    void log(size_t length, size_t requested);

    const ReadStats &stats() const { return m_stats; }
    const std::string &tag() const { return m_tag; }
    Log::Level level() const { return m_level; }

private:
    Logger::ptr m_logger;
    Log::Level m_level;
    std::string m_tag;
    ReadStats m_stats;
};

/// @brief Counts and logs every read that passes through it
/// @details
/// Data, seeks and errors are passed through untouched.  A read that throws
/// is neither counted nor logged.  Seeks are not counted either, so after a
/// seek the logged ranges keep counting from the bytes read so far rather
/// than following the parent's position.
class ReadLoggerStream : public FilterStream
{
public:
    typedef boost::shared_ptr<ReadLoggerStream> ptr;

public:
    /// Log to the "gauge:streams:readlogger" Logger
    ReadLoggerStream(Stream::ptr parent, Log::Level level,
        const std::string &tag, bool own = true);
    ReadLoggerStream(Stream::ptr parent, Logger::ptr logger, Log::Level level,
        const std::string &tag, bool own = true);

    size_t read(void *buffer, size_t length);

    ReadStats stats() const { return m_stats.stats(); }
    const std::string &tag() const { return m_stats.tag(); }

private:
    ReadStatsLogger m_stats;
};

}

#endif
