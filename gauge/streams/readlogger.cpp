// Copyright (c) 2009 - Mozy, Inc.

#include "readlogger.h"

#include <ostream>

#include "gauge/assert.h"

namespace Gauge {

static Logger::ptr g_log = Log::lookup("gauge:streams:readlogger");

std::ostream &operator <<(std::ostream &os, const ReadStats &stats)
{
    return os << "count=" << stats.readCount << " bytes=" << stats.bytesTotal;
}

ReadStatsLogger::ReadStatsLogger(Logger::ptr logger, Log::Level level,
    const std::string &tag)
: m_logger(logger),
  m_level(level),
  m_tag(tag)
{
    GAUGE_ASSERT(m_logger);
    GAUGE_LOG_LEVEL(m_logger, m_level) << "Initialize Read logger '" << m_tag
        << "',tag,begin,end,length,request_length,count,bytes_total";
}

void
ReadStatsLogger::log(size_t length, size_t requested)
{
    long long begin = (long long)m_stats.bytesTotal;
    long long end = begin + (long long)length - 1;
    // Counters wrap rather than saturate
    ++m_stats.readCount;
    m_stats.bytesTotal += length;
    GAUGE_LOG_LEVEL(m_logger, m_level) << "Read " << begin << "-" << end
        << " (" << length << " bytes). Total requests: " << m_stats.readCount
        << " (" << m_stats.bytesTotal << " bytes)," << m_tag << "," << begin
        << "," << end << "," << length << "," << requested << ","
        << m_stats.readCount << "," << m_stats.bytesTotal;
}

ReadLoggerStream::ReadLoggerStream(Stream::ptr parent, Log::Level level,
    const std::string &tag, bool own)
: FilterStream(parent, own),
  m_stats(g_log, level, tag)
{}

ReadLoggerStream::ReadLoggerStream(Stream::ptr parent, Logger::ptr logger,
    Log::Level level, const std::string &tag, bool own)
: FilterStream(parent, own),
  m_stats(logger, level, tag)
{}

size_t
ReadLoggerStream::read(void *buffer, size_t length)
{
    // If the parent throws, the read never happened as far as we're concerned
    size_t result = parent()->read(buffer, length);
    m_stats.log(result, length);
    return result;
}

}
