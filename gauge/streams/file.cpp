// Copyright (c) 2009 - Mozy, Inc.

#include "file.h"

#include <unistd.h>

#include "gauge/assert.h"
#include "gauge/exception.h"
#include "gauge/log.h"

namespace Gauge {

static Logger::ptr g_log = Log::lookup("gauge:streams:file");

FileStream::FileStream(const std::string &path, AccessFlags accessFlags,
    CreateFlags createFlags)
: m_supportsRead(false),
  m_supportsWrite(false),
  m_supportsSeek(false)
{
    int oflags = (int)accessFlags;
    switch (createFlags & ~DELETE_ON_CLOSE) {
        case OPEN:
            break;
        case CREATE:
            oflags |= O_CREAT | O_EXCL;
            break;
        case OPEN_OR_CREATE:
            oflags |= O_CREAT;
            break;
        case OVERWRITE:
            oflags |= O_TRUNC;
            break;
        case OVERWRITE_OR_CREATE:
            oflags |= O_CREAT | O_TRUNC;
            break;
        default:
            GAUGE_NOTREACHED();
    }
    NativeHandle handle = open(path.c_str(), oflags, 0666);
    error_t error = lastError();
    GAUGE_LOG_VERBOSE(g_log) << "open(" << path << ", " << oflags << "): "
        << handle << " (" << error << ")";
    if (handle < 0)
        GAUGE_THROW_EXCEPTION_FROM_ERROR_API(error, "open");
    if (createFlags & DELETE_ON_CLOSE) {
        int rc = unlink(path.c_str());
        if (rc != 0) {
            error = lastError();
            ::close(handle);
            GAUGE_THROW_EXCEPTION_FROM_ERROR_API(error, "unlink");
        }
    }
    NativeStream::init(handle);
    m_supportsRead = accessFlags == READ || accessFlags == READWRITE;
    m_supportsWrite = accessFlags == WRITE || accessFlags == READWRITE ||
        accessFlags == APPEND;
    m_supportsSeek = accessFlags != APPEND;
    m_path = path;
}

}
