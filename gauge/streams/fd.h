#ifndef __GAUGE_FD_STREAM_H__
#define __GAUGE_FD_STREAM_H__
// Copyright (c) 2009 - Mozy, Inc.

#include "stream.h"

namespace Gauge {

/// Blocking Stream over a POSIX file descriptor
class FDStream : public Stream
{
public:
    typedef boost::shared_ptr<FDStream> ptr;

protected:
    FDStream();
    void init(int fd, bool own = true);
public:
    FDStream(int fd, bool own = true)
    { init(fd, own); }
    ~FDStream();

    bool supportsRead() { return true; }
    bool supportsWrite() { return true; }
    bool supportsSeek() { return true; }
    bool supportsSize() { return true; }
    bool supportsTruncate() { return true; }

    void close(CloseType type = BOTH);
    size_t read(void *buffer, size_t length);
    using Stream::write;
    size_t write(const void *buffer, size_t length);
    long long seek(long long offset, Anchor anchor = BEGIN);
    long long size();
    void truncate(long long size);
    void flush(bool flushParent = true);

    int fd() { return m_fd; }

private:
    int m_fd;
    bool m_own;
};

typedef FDStream NativeStream;
typedef int NativeHandle;

}

#endif
