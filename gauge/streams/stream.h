#ifndef __GAUGE_STREAM_H__
#define __GAUGE_STREAM_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <stddef.h>

#include <iosfwd>

#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>

#include "gauge/predef.h"

namespace Gauge {

/// @brief Blocking, byte-oriented stream
/// @details
/// A Stream advertises which operations it implements through the supports*()
/// queries; calling anything else is a programming error and asserts.
/// close() and flush() may be called on any Stream.  Streams are not thread
/// safe.
class Stream : boost::noncopyable
{
public:
    typedef boost::shared_ptr<Stream> ptr;

    enum CloseType {
        READ  = 0x01,
        WRITE = 0x02,
        BOTH  = 0x03
    };

    enum Anchor {
        BEGIN,
        CURRENT,
        END
    };

public:
    virtual ~Stream() {}

    virtual bool supportsRead() { return false; }
    virtual bool supportsWrite() { return false; }
    virtual bool supportsSeek() { return false; }
    /// Defaults to supportsSeek()
    virtual bool supportsTell() { return supportsSeek(); }
    virtual bool supportsSize() { return false; }
    virtual bool supportsTruncate() { return false; }

    /// Closing an already closed Stream is not an error
    virtual void close(CloseType type = BOTH) {}

    /// @brief Read up to length bytes into buffer
    /// @details
    /// A short read says nothing about how much data remains; only a return
    /// of 0 means EOF.  If read() throws, no data was consumed.
    /// @pre supportsRead()
    virtual size_t read(void *buffer, size_t length);

    /// @brief Write up to length bytes from buffer
    /// @details
    /// May write less than length, but never 0.  If write() throws, no data
    /// was written.
    /// @pre supportsWrite()
    virtual size_t write(const void *buffer, size_t length);
    /// Write a null-terminated string
    size_t write(const char *string);

    /// @return The new position
    /// @exception std::invalid_argument The new position would be negative
    /// @pre supportsSeek(), or supportsTell() for seek(0, CURRENT)
    virtual long long seek(long long offset, Anchor anchor = BEGIN);
    /// @pre supportsTell()
    long long tell() { return seek(0, CURRENT); }

    /// @pre supportsSize()
    virtual long long size();
    /// @pre supportsTruncate()
    virtual void truncate(long long size);

    /// Push out anything held in internal buffers
    /// @param flushParent Also flush the parent of a filter
    virtual void flush(bool flushParent = true) {}
};

std::ostream &operator <<(std::ostream &os, Stream::Anchor anchor);

}

#endif
