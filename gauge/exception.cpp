// Copyright (c) 2009 - Mozy, Inc.

#include "exception.h"

#include <execinfo.h>
#include <stdlib.h>

#include <algorithm>
#include <sstream>

#include <boost/shared_ptr.hpp>

namespace Gauge {

std::string to_string(const std::vector<void *> &backtrace)
{
    std::ostringstream os;
    if (backtrace.empty())
        return os.str();
    boost::shared_ptr<char *> symbols(backtrace_symbols(&backtrace[0],
        (int)backtrace.size()), &free);
    for (size_t i = 0; i < backtrace.size(); ++i) {
        if (i != 0)
            os << std::endl;
        if (symbols)
            os << symbols.get()[i];
        else
            os << backtrace[i];
    }
    return os.str();
}

std::string to_string( errinfo_backtrace const &bt )
{
    return to_string(bt.value());
}

std::vector<void *> backtrace(int framesToSkip)
{
    std::vector<void *> result;
    result.resize(64);
    int count = ::backtrace(&result[0], 64);
    result.resize(count);
    framesToSkip = std::min(count, framesToSkip + 1);
    result.erase(result.begin(), result.begin() + framesToSkip);
    return result;
}

error_t lastError()
{
    return errno;
}

void lastError(error_t error)
{
    errno = error;
}

void throwExceptionFromLastError(error_t error)
{
    switch (error) {
        case EBADF:
            throw boost::enable_current_exception(BadHandleException())
                << errinfo_nativeerror(error);
        case ENOENT:
            throw boost::enable_current_exception(FileNotFoundException())
                << errinfo_nativeerror(error);
        case EACCES:
        case EPERM:
            throw boost::enable_current_exception(AccessDeniedException())
                << errinfo_nativeerror(error);
        case ECANCELED:
            throw boost::enable_current_exception(OperationAbortedException())
                << errinfo_nativeerror(error);
        case EPIPE:
            throw boost::enable_current_exception(BrokenPipeException())
                << errinfo_nativeerror(error);
        case EINTR:
            throw boost::enable_current_exception(InterruptedException())
                << errinfo_nativeerror(error);
        case EISDIR:
            throw boost::enable_current_exception(IsDirectoryException())
                << errinfo_nativeerror(error);
        case ENOTDIR:
            throw boost::enable_current_exception(IsNotDirectoryException())
                << errinfo_nativeerror(error);
        case ELOOP:
            throw boost::enable_current_exception(TooManySymbolicLinksException())
                << errinfo_nativeerror(error);
        default:
            throw boost::enable_current_exception(NativeException())
                << errinfo_nativeerror(error);
    }
}

}
