#ifndef __GAUGE_MEMORY_STREAM_H__
#define __GAUGE_MEMORY_STREAM_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <string>

#include "stream.h"

namespace Gauge {

/// A seekable Stream backed by an in-memory byte string
class MemoryStream : public Stream
{
public:
    typedef boost::shared_ptr<MemoryStream> ptr;
public:
    MemoryStream();
    MemoryStream(const std::string &data);
    MemoryStream(const void *data, size_t length);

    bool supportsRead() { return true; }
    bool supportsWrite() { return true; }
    bool supportsSeek() { return true; }
    bool supportsSize() { return true; }
    bool supportsTruncate() { return true; }

    size_t read(void *buffer, size_t length);
    using Stream::write;
    size_t write(const void *buffer, size_t length);
    long long seek(long long offset, Anchor anchor = BEGIN);
    long long size();
    void truncate(long long size);

    // Direct access to memory
    const std::string &buffer() const { return m_data; }

private:
    std::string m_data;
    size_t m_offset;
};

}

#endif
