// Copyright (c) 2009 - Mozy, Inc.

#include "transfer.h"

#include <boost/scoped_array.hpp>

#include "gauge/assert.h"
#include "gauge/exception.h"

namespace Gauge {

static const size_t g_chunkSize = 65536;

static void writeAll(Stream &dst, const unsigned char *buffer, size_t length)
{
    while (length > 0) {
        size_t result = dst.write(buffer, length);
        GAUGE_ASSERT(result > 0);
        buffer += result;
        length -= result;
    }
}

unsigned long long transferStream(Stream &src, Stream &dst,
                                  unsigned long long toTransfer,
                                  ExactLength exactLength)
{
    GAUGE_ASSERT(src.supportsRead());
    GAUGE_ASSERT(dst.supportsWrite());
    if (exactLength == INFER)
        exactLength = (toTransfer == ~0ull ? UNTILEOF : EXACT);
    GAUGE_ASSERT(exactLength == EXACT || exactLength == UNTILEOF);

    boost::scoped_array<unsigned char> buffer(new unsigned char[g_chunkSize]);
    unsigned long long totalRead = 0;
    while (totalRead < toTransfer) {
        size_t todo = g_chunkSize;
        if (toTransfer - totalRead < (unsigned long long)todo)
            todo = (size_t)(toTransfer - totalRead);
        size_t readResult = src.read(buffer.get(), todo);
        if (readResult == 0) {
            if (exactLength == EXACT)
                GAUGE_THROW_EXCEPTION(UnexpectedEofException());
            break;
        }
        totalRead += readResult;
        writeAll(dst, buffer.get(), readResult);
    }
    return totalRead;
}

}
