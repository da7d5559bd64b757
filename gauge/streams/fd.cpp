// Copyright (c) 2009 - Mozy, Inc.

#include "fd.h"

#include <stdexcept>

#include <sys/stat.h>
#include <unistd.h>

#include "gauge/assert.h"
#include "gauge/exception.h"
#include "gauge/log.h"

namespace Gauge {

static Logger::ptr g_log = Log::lookup("gauge:streams:fd");

FDStream::FDStream()
: m_fd(-1),
  m_own(false)
{}

void
FDStream::init(int fd, bool own)
{
    GAUGE_ASSERT(fd >= 0);
    m_fd = fd;
    m_own = own;
}

FDStream::~FDStream()
{
    if (m_own && m_fd >= 0) {
        int rc = ::close(m_fd);
        GAUGE_LOG_LEVEL(g_log, rc ? Log::ERROR : Log::VERBOSE) << this
            << " close(" << m_fd << "): " << rc << " (" << lastError() << ")";
    }
}

void
FDStream::close(CloseType type)
{
    GAUGE_ASSERT(type == BOTH);
    if (m_fd >= 0 && m_own) {
        int rc = ::close(m_fd);
        error_t error = lastError();
        GAUGE_LOG_LEVEL(g_log, rc ? Log::ERROR : Log::VERBOSE) << this
            << " close(" << m_fd << "): " << rc << " (" << error << ")";
        if (rc)
            GAUGE_THROW_EXCEPTION_FROM_ERROR_API(error, "close");
        m_fd = -1;
    }
}

size_t
FDStream::read(void *buffer, size_t length)
{
    GAUGE_ASSERT(m_fd >= 0);
    if (length > 0x7ffff000)
        length = 0x7ffff000;
    ssize_t rc = ::read(m_fd, buffer, length);
    error_t error = lastError();
    GAUGE_LOG_LEVEL(g_log, rc < 0 ? Log::ERROR : Log::DEBUG) << this
        << " read(" << m_fd << ", " << length << "): " << rc << " (" << error
        << ")";
    if (rc < 0)
        GAUGE_THROW_EXCEPTION_FROM_ERROR_API(error, "read");
    return (size_t)rc;
}

size_t
FDStream::write(const void *buffer, size_t length)
{
    GAUGE_ASSERT(m_fd >= 0);
    if (length > 0x7ffff000)
        length = 0x7ffff000;
    ssize_t rc = ::write(m_fd, buffer, length);
    error_t error = lastError();
    GAUGE_LOG_LEVEL(g_log, rc < 0 ? Log::ERROR : Log::DEBUG) << this
        << " write(" << m_fd << ", " << length << "): " << rc << " (" << error
        << ")";
    if (rc == 0)
        GAUGE_THROW_EXCEPTION(std::runtime_error("Zero length write"));
    if (rc < 0)
        GAUGE_THROW_EXCEPTION_FROM_ERROR_API(error, "write");
    return (size_t)rc;
}

long long
FDStream::seek(long long offset, Anchor anchor)
{
    GAUGE_ASSERT(m_fd >= 0);
    int whence = SEEK_SET;
    switch (anchor) {
        case BEGIN:
            whence = SEEK_SET;
            break;
        case CURRENT:
            whence = SEEK_CUR;
            break;
        case END:
            whence = SEEK_END;
            break;
        default:
            GAUGE_NOTREACHED();
    }
    off_t pos = lseek(m_fd, (off_t)offset, whence);
    error_t error = lastError();
    GAUGE_LOG_LEVEL(g_log, pos < 0 ? Log::ERROR : Log::VERBOSE) << this
        << " lseek(" << m_fd << ", " << offset << ", " << anchor << "): "
        << pos << " (" << error << ")";
    if (pos < 0) {
        if (error == EINVAL)
            GAUGE_THROW_EXCEPTION(std::invalid_argument("resulting offset is negative"));
        GAUGE_THROW_EXCEPTION_FROM_ERROR_API(error, "lseek");
    }
    return pos;
}

long long
FDStream::size()
{
    GAUGE_ASSERT(m_fd >= 0);
    struct stat statbuf;
    int rc = fstat(m_fd, &statbuf);
    error_t error = lastError();
    GAUGE_LOG_LEVEL(g_log, rc ? Log::ERROR : Log::VERBOSE) << this
        << " fstat(" << m_fd << "): " << rc << " (" << error << ")";
    if (rc)
        GAUGE_THROW_EXCEPTION_FROM_ERROR_API(error, "fstat");
    return statbuf.st_size;
}

void
FDStream::truncate(long long size)
{
    GAUGE_ASSERT(m_fd >= 0);
    int rc = ftruncate(m_fd, (off_t)size);
    error_t error = lastError();
    GAUGE_LOG_LEVEL(g_log, rc ? Log::ERROR : Log::VERBOSE) << this
        << " ftruncate(" << m_fd << ", " << size << "): " << rc
        << " (" << error << ")";
    if (rc)
        GAUGE_THROW_EXCEPTION_FROM_ERROR_API(error, "ftruncate");
}

void
FDStream::flush(bool flushParent)
{
    GAUGE_ASSERT(m_fd >= 0);
    int rc = fsync(m_fd);
    error_t error = lastError();
    // Pipes, sockets and terminals can't be synced; that's not an error
    if (rc && error == EINVAL)
        return;
    GAUGE_LOG_LEVEL(g_log, rc ? Log::ERROR : Log::VERBOSE) << this
        << " fsync(" << m_fd << "): " << rc << " (" << error << ")";
    if (rc)
        GAUGE_THROW_EXCEPTION_FROM_ERROR_API(error, "fsync");
}

}
