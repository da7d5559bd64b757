#ifndef __GAUGE_STD_STREAM_H__
#define __GAUGE_STD_STREAM_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <unistd.h>

#include "fd.h"

namespace Gauge {

/// The standard streams; they never close their descriptor
class StdStream : public NativeStream
{
protected:
    StdStream(int stream) : NativeStream(stream, false) {}

public:
    bool supportsSeek() { return false; }
    bool supportsSize() { return false; }
    bool supportsTruncate() { return false; }
};

class StdinStream : public StdStream
{
public:
    StdinStream() : StdStream(STDIN_FILENO) {}

    bool supportsWrite() { return false; }
};

class StdoutStream : public StdStream
{
public:
    StdoutStream() : StdStream(STDOUT_FILENO) {}

    bool supportsRead() { return false; }
};

class StderrStream : public StdStream
{
public:
    StderrStream() : StdStream(STDERR_FILENO) {}

    bool supportsRead() { return false; }
};

}

#endif
