#ifndef __GAUGE_BUFFERED_STREAM_H__
#define __GAUGE_BUFFERED_STREAM_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <vector>

#include "filter.h"

namespace Gauge {

/// Read-side buffering: parent reads are issued in multiples of
/// bufferSize(), and smaller reads are served from memory
class BufferedStream : public FilterStream
{
public:
    typedef boost::shared_ptr<BufferedStream> ptr;

    BufferedStream(Stream::ptr parent, bool own = true);

    size_t bufferSize() { return m_bufferSize; }
    void bufferSize(size_t bufferSize);

    /// If partial reads are allowed, a read that is partially satisfied from
    /// the buffer does not go back to the parent for the rest
    bool allowPartialReads() { return m_allowPartialReads; }
    void allowPartialReads(bool allowPartialReads) { m_allowPartialReads = allowPartialReads; }

    /// @return How much data is currently buffered
    size_t buffered() const { return m_readBuffer.size() - m_readOffset; }

    bool supportsWrite() { return false; }
    bool supportsTruncate() { return false; }

    void close(CloseType type = BOTH);
    size_t read(void *buffer, size_t length);
    long long seek(long long offset, Anchor anchor = BEGIN);

private:
    size_t copyOut(unsigned char *buffer, size_t length);
    size_t fill(size_t length);
    void discard();

private:
    size_t m_bufferSize;
    bool m_allowPartialReads;
    std::vector<unsigned char> m_readBuffer;
    size_t m_readOffset;
};

}

#endif
