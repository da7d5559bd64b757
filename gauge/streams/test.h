#ifndef __GAUGE_TEST_STREAM_H__
#define __GAUGE_TEST_STREAM_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <boost/function.hpp>

#include "filter.h"

namespace Gauge {

// This stream is for use in unit tests to force short reads, and to run
// arbitrary code (i.e. throw an exception) when a read or seek happens
class TestStream : public FilterStream
{
public:
    typedef boost::shared_ptr<TestStream> ptr;

public:
    TestStream(Stream::ptr parent)
        : FilterStream(parent, true),
          m_maxReadSize(~0),
          m_onReadBytes(0)
    {}

    size_t maxReadSize() const { return m_maxReadSize; }
    void maxReadSize(size_t max) { m_maxReadSize = max; }

    /// Let bytes more bytes through, then call dg (once) on the next read
    void onRead(boost::function<void ()> dg, long long bytes = 0)
    { m_onRead = dg; m_onReadBytes = bytes; }
    void onSeek(boost::function<void ()> dg)
    { m_onSeek = dg; }

    size_t read(void *buffer, size_t length);
    long long seek(long long offset, Anchor anchor = BEGIN);

private:
    size_t m_maxReadSize;
    boost::function<void ()> m_onRead, m_onSeek;
    long long m_onReadBytes;
};

}

#endif
