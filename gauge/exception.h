#ifndef __GAUGE_EXCEPTION_H__
#define __GAUGE_EXCEPTION_H__
// Copyright (c) 2009 - Mozy, Inc.

#include "predef.h"

#include <errno.h>

#include <stdexcept>
#include <string>
#include <vector>

#include <boost/exception/all.hpp>

namespace Gauge {

typedef boost::error_info<struct tag_backtrace, std::vector<void *> > errinfo_backtrace;
typedef boost::errinfo_errno errinfo_nativeerror;

std::string to_string(const std::vector<void *> &backtrace);
std::string to_string( errinfo_backtrace const &bt );

std::vector<void *> backtrace(int framesToSkip = 0);

#define GAUGE_THROW_EXCEPTION(x)                                                \
    throw ::boost::enable_current_exception(::boost::enable_error_info(x))      \
        << ::boost::throw_function(BOOST_CURRENT_FUNCTION)                      \
        << ::boost::throw_file(__FILE__)                                        \
        << ::boost::throw_line((int)__LINE__)                                   \
        << ::Gauge::errinfo_backtrace(::Gauge::backtrace())

struct Exception : virtual boost::exception, virtual std::exception {};

struct StreamException : virtual Exception {};
struct UnexpectedEofException : virtual StreamException {};

struct NativeException : virtual Exception {};

typedef int error_t;

struct FileNotFoundException : virtual NativeException {};
struct AccessDeniedException : virtual NativeException {};
struct BadHandleException : virtual NativeException {};
struct OperationAbortedException : virtual NativeException {};
struct BrokenPipeException : virtual NativeException {};
struct InterruptedException : virtual NativeException {};
struct IsDirectoryException : virtual NativeException {};
struct IsNotDirectoryException : virtual NativeException {};
struct TooManySymbolicLinksException : virtual NativeException {};

error_t lastError();
void lastError(error_t error);

void throwExceptionFromLastError(error_t lastError);

#define GAUGE_THROW_EXCEPTION_FROM_LAST_ERROR_API(api)                          \
    GAUGE_THROW_EXCEPTION_FROM_ERROR_API(::Gauge::lastError(), api)

#define GAUGE_THROW_EXCEPTION_FROM_ERROR_API(error, api)                        \
    try {                                                                       \
        ::Gauge::throwExceptionFromLastError(error);                            \
    } catch (::boost::exception &ex) {                                          \
        ex << ::boost::throw_function(BOOST_CURRENT_FUNCTION)                   \
            << ::boost::throw_file(__FILE__)                                    \
            << ::boost::throw_line((int)__LINE__)                               \
            << ::boost::errinfo_api_function(api)                               \
            << ::Gauge::errinfo_backtrace(::Gauge::backtrace());                \
        throw;                                                                  \
    }

}

#endif
