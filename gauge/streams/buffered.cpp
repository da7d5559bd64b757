// Copyright (c) 2009 - Mozy, Inc.

#include "buffered.h"

#include <string.h>

#include <algorithm>

#include <boost/exception/diagnostic_information.hpp>

#include "gauge/assert.h"
#include "gauge/config.h"
#include "gauge/log.h"

namespace Gauge {

static ConfigVar<size_t>::ptr g_defaultBufferSize =
    Config::lookup<size_t>("stream.buffered.defaultbuffersize", 65536,
    "Default buffer size for new BufferedStreams");

static Logger::ptr g_log = Log::lookup("gauge:streams:buffered");

BufferedStream::BufferedStream(Stream::ptr parent, bool own)
: FilterStream(parent, own),
  m_allowPartialReads(false),
  m_readOffset(0)
{
    m_bufferSize = g_defaultBufferSize->val();
    if (m_bufferSize == 0)
        m_bufferSize = 1;
}

void
BufferedStream::bufferSize(size_t bufferSize)
{
    GAUGE_ASSERT(bufferSize > 0);
    m_bufferSize = bufferSize;
}

void
BufferedStream::close(CloseType type)
{
    GAUGE_LOG_VERBOSE(g_log) << this << " close(" << type << ")";
    if (type & READ)
        discard();
    if (ownsParent())
        parent()->close(type);
}

void
BufferedStream::discard()
{
    m_readBuffer.clear();
    m_readOffset = 0;
}

size_t
BufferedStream::copyOut(unsigned char *buffer, size_t length)
{
    size_t todo = std::min(buffered(), length);
    if (todo == 0)
        return 0;
    memcpy(buffer, &m_readBuffer[m_readOffset], todo);
    m_readOffset += todo;
    if (m_readOffset == m_readBuffer.size())
        discard();
    return todo;
}

size_t
BufferedStream::fill(size_t length)
{
    size_t existing = m_readBuffer.size();
    m_readBuffer.resize(existing + length);
    size_t result;
    try {
        GAUGE_LOG_TRACE(g_log) << this << " parent()->read(" << length << ")";
        result = parent()->read(&m_readBuffer[existing], length);
        GAUGE_LOG_DEBUG(g_log) << this << " parent()->read(" << length
            << "): " << result;
    } catch (...) {
        m_readBuffer.resize(existing);
        throw;
    }
    GAUGE_ASSERT(result <= length);
    m_readBuffer.resize(existing + result);
    return result;
}

size_t
BufferedStream::read(void *buffer, size_t length)
{
    unsigned char *out = (unsigned char *)buffer;
    size_t remaining = length;

    size_t fromBuffer = copyOut(out, remaining);
    out += fromBuffer;
    remaining -= fromBuffer;

    GAUGE_LOG_VERBOSE(g_log) << this << " read(" << length << "): "
        << fromBuffer << " read from buffer";

    if (remaining == 0)
        return length;

    if (fromBuffer == 0 || !m_allowPartialReads) {
        size_t result;
        do {
            // Read enough to satisfy this request, plus up to a multiple of
            // the buffer size
            size_t todo = ((remaining - 1) / m_bufferSize + 1) * m_bufferSize;
            try {
                result = fill(todo);
            } catch (...) {
                if (remaining == length) {
                    GAUGE_LOG_VERBOSE(g_log) << this << " forwarding exception";
                    throw;
                }
                // Data has already been handed out; report it, and let the
                // next read hit the error again
                GAUGE_LOG_VERBOSE(g_log) << this << " deferring exception: "
                    << boost::current_exception_diagnostic_information();
                return length - remaining;
            }

            size_t copied = copyOut(out, remaining);
            out += copied;
            remaining -= copied;
        } while (remaining > 0 && !m_allowPartialReads && result != 0);
    }

    return length - remaining;
}

long long
BufferedStream::seek(long long offset, Anchor anchor)
{
    size_t available = buffered();
    if (anchor == CURRENT) {
        if (offset == 0)
            return parent()->tell() - (long long)available;
        // Forward seek within the buffer
        if (offset > 0 && (unsigned long long)offset <= available) {
            m_readOffset += (size_t)offset;
            if (m_readOffset == m_readBuffer.size())
                discard();
            return parent()->tell() - (long long)buffered();
        }
        offset -= (long long)available;
    }
    GAUGE_LOG_VERBOSE(g_log) << this << " seek(" << offset << ", " << anchor
        << "): discarding " << available << " buffered bytes";
    long long result = parent()->seek(offset, anchor);
    discard();
    return result;
}

}
