// Copyright (c) 2009 - Mozy, Inc.

#include "stream.h"

#include <string.h>

#include <ostream>

#include "gauge/assert.h"

namespace Gauge {

size_t
Stream::read(void *buffer, size_t length)
{
    GAUGE_NOTREACHED();
}

size_t
Stream::write(const void *buffer, size_t length)
{
    GAUGE_NOTREACHED();
}

size_t
Stream::write(const char *string)
{
    return write(string, strlen(string));
}

long long
Stream::seek(long long offset, Anchor anchor)
{
    GAUGE_NOTREACHED();
}

long long
Stream::size()
{
    GAUGE_NOTREACHED();
}

void
Stream::truncate(long long size)
{
    GAUGE_NOTREACHED();
}

std::ostream &operator <<(std::ostream &os, Stream::Anchor anchor)
{
    switch (anchor) {
        case Stream::BEGIN:
            return os << "BEGIN";
        case Stream::CURRENT:
            return os << "CURRENT";
        case Stream::END:
            return os << "END";
        default:
            return os << (int)anchor;
    }
}

}
