#ifndef __GAUGE_FILE_STREAM_H__
#define __GAUGE_FILE_STREAM_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <fcntl.h>

#include <string>

#include "fd.h"

namespace Gauge {

class FileStream : public NativeStream
{
public:
    typedef boost::shared_ptr<FileStream> ptr;

    enum AccessFlags {
        READ = O_RDONLY,
        WRITE = O_WRONLY,
        READWRITE = O_RDWR,
        APPEND = O_APPEND | O_WRONLY
    };
    enum CreateFlags {
        /// Open a file. Fail if it does not exist.
        OPEN = 1,
        /// Create a file. Fail if it exists.
        CREATE,
        /// Open a file. Create it if it does not exist.
        OPEN_OR_CREATE,
        /// Open a file, and recreate it from scratch. Fail if it does not exist.
        OVERWRITE,
        /// Create a file. If it exists, recreate it from scratch.
        OVERWRITE_OR_CREATE,

        /// Delete the file when it is closed.  Can be combined with any of the
        /// other options
        DELETE_ON_CLOSE = 0x40000000
    };

public:
    FileStream(const std::string &path,
        AccessFlags accessFlags = READWRITE, CreateFlags createFlags = OPEN);

    bool supportsRead() { return m_supportsRead && NativeStream::supportsRead(); }
    bool supportsWrite() { return m_supportsWrite && NativeStream::supportsWrite(); }
    bool supportsSeek() { return m_supportsSeek && NativeStream::supportsSeek(); }

    std::string path() const { return m_path; }

private:
    bool m_supportsRead, m_supportsWrite, m_supportsSeek;
    std::string m_path;
};

}

#endif
