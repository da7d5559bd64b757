#ifndef __GAUGE_ASSERT_H__
#define __GAUGE_ASSERT_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <exception>

#include "exception.h"
#include "log.h"
#include "version.h"

namespace Gauge {

bool isDebuggerAttached();
void debugBreak();

struct Assertion : virtual Exception
{
    Assertion(const std::string &expr) : m_expr(expr) {}
    ~Assertion() throw() {}

    const char *what() const throw() { return m_expr.c_str(); }

    static bool throwOnAssertion;
private:
    std::string m_expr;
};

}

#endif
// No include guard - you can include multiple times
#ifdef GAUGE_ASSERT
#undef GAUGE_ASSERT
#endif
#ifdef GAUGE_VERIFY
#undef GAUGE_VERIFY
#endif
#ifdef GAUGE_NOTREACHED
#undef GAUGE_NOTREACHED
#endif

#ifdef NDEBUG

#define GAUGE_ASSERT(x) ((void)0)
#define GAUGE_VERIFY(x) ((void)(x))
#define GAUGE_NOTREACHED() ::std::terminate();

#else

#define GAUGE_ASSERT(x)                                                         \
    while (!(x)) {                                                              \
        GAUGE_LOG_FATAL(::Gauge::Log::root())                                   \
            << "ASSERTION: " # x                                                \
            << "\nbacktrace:\n" << ::Gauge::to_string(::Gauge::backtrace());    \
        if (::Gauge::Assertion::throwOnAssertion)                               \
            GAUGE_THROW_EXCEPTION(::Gauge::Assertion(# x));                     \
        if (::Gauge::isDebuggerAttached())                                      \
            ::Gauge::debugBreak();                                              \
        ::std::terminate();                                                     \
    }

#define GAUGE_VERIFY(x) GAUGE_ASSERT(x)

#define GAUGE_NOTREACHED()                                                      \
{                                                                               \
    GAUGE_LOG_FATAL(::Gauge::Log::root()) << "NOT REACHED"                      \
        << "\nbacktrace:\n" << ::Gauge::to_string(::Gauge::backtrace());        \
    if (::Gauge::Assertion::throwOnAssertion)                                   \
        GAUGE_THROW_EXCEPTION(::Gauge::Assertion("Not Reached"));               \
    if (::Gauge::isDebuggerAttached())                                          \
        ::Gauge::debugBreak();                                                  \
    ::std::terminate();                                                         \
}

#endif
