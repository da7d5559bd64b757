#ifndef __GAUGE_EXAMPLES_READSTATS_H__
#define __GAUGE_EXAMPLES_READSTATS_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <string>

#include "gauge/log.h"
#include "gauge/streams/readlogger.h"

namespace Gauge {

/// Read inStream to EOF through a ReadLoggerStream, copying it to outStream
/// (or discarding it if outStream is NULL)
/// @details
/// If bufferSize is non-zero a BufferedStream of that size sits on top of the
/// logger, and the data is pulled through it bufferSize bytes at a time, so
/// every logged request is a multiple of bufferSize.  Unbuffered input is
/// read in 64 KiB chunks.
ReadStats readStats(Stream::ptr inStream, Stream *outStream,
    Logger::ptr logger, Log::Level level, const std::string &tag,
    size_t bufferSize);

}

#endif
