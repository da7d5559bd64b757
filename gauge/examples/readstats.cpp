// Copyright (c) 2009 - Mozy, Inc.

#include "readstats.h"

#include <boost/scoped_array.hpp>

#include "gauge/streams/buffered.h"
#include "gauge/streams/transfer.h"

namespace Gauge {

static const size_t g_unbufferedChunkSize = 65536;

ReadStats readStats(Stream::ptr inStream, Stream *outStream,
    Logger::ptr logger, Log::Level level, const std::string &tag,
    size_t bufferSize)
{
    ReadLoggerStream::ptr readLogger(new ReadLoggerStream(inStream, logger,
        level, tag));
    Stream::ptr stream = readLogger;
    size_t chunkSize = g_unbufferedChunkSize;
    if (bufferSize != 0) {
        BufferedStream::ptr buffered(new BufferedStream(stream));
        buffered->bufferSize(bufferSize);
        stream = buffered;
        chunkSize = bufferSize;
    }
    if (!outStream) {
        boost::scoped_array<char> buffer(new char[chunkSize]);
        while (stream->read(buffer.get(), chunkSize) != 0);
    } else {
        // A short transfer means the source hit EOF
        while (transferStream(*stream, *outStream, chunkSize, UNTILEOF)
            == chunkSize);
    }
    return readLogger->stats();
}

}
