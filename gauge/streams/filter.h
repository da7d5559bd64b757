#ifndef __GAUGE_FILTER_STREAM_H__
#define __GAUGE_FILTER_STREAM_H__
// Copyright (c) 2009 - Mozy, Inc.

#include "stream.h"

namespace Gauge {

// When inheriting from FilterStream, use parent()->xxx to call
// method xxx on the parent stream.
// FilterStreams *must* implement read() and write() if they want to observe
// or change the data; the defaults just forward to the parent
class FilterStream : public Stream
{
public:
    typedef boost::shared_ptr<FilterStream> ptr;

public:
    FilterStream(Stream::ptr parent, bool own = true)
        : m_parent(parent), m_own(own)
    {}

    Stream::ptr parent() { return m_parent; }
    bool ownsParent() { return m_own; }

    bool supportsRead() { return m_parent->supportsRead(); }
    bool supportsWrite() { return m_parent->supportsWrite(); }
    bool supportsSeek() { return m_parent->supportsSeek(); }
    bool supportsTell() { return m_parent->supportsTell(); }
    bool supportsSize() { return m_parent->supportsSize(); }
    bool supportsTruncate() { return m_parent->supportsTruncate(); }

    void close(CloseType type = BOTH) { if (m_own) m_parent->close(type); }
    size_t read(void *buffer, size_t length)
    { return m_parent->read(buffer, length); }
    using Stream::write;
    size_t write(const void *buffer, size_t length)
    { return m_parent->write(buffer, length); }
    long long seek(long long offset, Anchor anchor = BEGIN)
    { return m_parent->seek(offset, anchor); }
    long long size() { return m_parent->size(); }
    void truncate(long long size) { m_parent->truncate(size); }
    void flush(bool flushParent = true)
    { if (flushParent) m_parent->flush(true); }

private:
    Stream::ptr m_parent;
    bool m_own;
};

}

#endif
