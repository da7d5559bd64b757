// Copyright (c) 2009 - Mozy, Inc.

#include <sstream>
#include <vector>

#include <boost/lexical_cast.hpp>

#include "gauge/config.h"
#include "gauge/log.h"
#include "gauge/test/test.h"

using namespace Gauge;

class TestLogSink : public LogSink
{
public:
    typedef boost::shared_ptr<TestLogSink> ptr;

    void log(const std::string &logger,
             boost::posix_time::ptime now, unsigned long long elapsed,
             tid_t thread, Log::Level level, const std::string &str,
             const char* file, int line)
    {
        m_logger = logger;
        m_level = level;
        m_str = str;
    }

    std::string m_logger;
    Log::Level m_level;
    std::string m_str;
};

// Every sink from the logger up to the root of the vector sees the message;
// sinks below it don't
static void testLogger(const std::vector<Logger::ptr> &loggers)
{
    if (loggers.empty())
        return;
    std::vector<TestLogSink::ptr> sinks;
    sinks.resize(loggers.size());
    for (size_t i = 0; i < loggers.size(); ++i) {
        sinks[i].reset(new TestLogSink());
        loggers[i]->addSink(sinks[i]);
    }
    for (size_t i = 0; i < loggers.size(); i++) {
        GAUGE_LOG_INFO(loggers[i]) << "Hello world";
        for (size_t j = 0; j <= i; ++j) {
            GAUGE_TEST_ASSERT_EQUAL(sinks[j]->m_str, "Hello world");
            GAUGE_TEST_ASSERT_EQUAL(sinks[j]->m_logger, loggers[i]->name());
            sinks[j]->m_str.clear();
        }
        for (size_t j = i + 1; j < loggers.size(); ++j)
            GAUGE_TEST_ASSERT(sinks[j]->m_str.empty());
    }
    for (size_t i = 0; i < loggers.size(); i++)
        loggers[i]->clearSinks();
}

GAUGE_UNITTEST(Log, inheritSinks)
{
    std::vector<Logger::ptr> vec;
    vec.push_back(Log::lookup("inherit"));
    vec.push_back(Log::lookup("inherit:child"));
    vec.push_back(Log::lookup("inherit:child:grandchild"));
    testLogger(vec);
}

GAUGE_UNITTEST(Log, lookupOutOfOrder)
{
    std::vector<Logger::ptr> vec;
    Logger::ptr a = Log::lookup("outoforder:child1:child2");
    Logger::ptr b = Log::lookup("outoforder");
    Logger::ptr c = Log::lookup("outoforder:child1");
    vec.push_back(b);
    vec.push_back(c);
    vec.push_back(a);
    testLogger(vec);
}

GAUGE_UNITTEST(Log, lookupCollapsesEmptyComponents)
{
    Logger::ptr a = Log::lookup("collapse:::a::");
    Logger::ptr b = Log::lookup("collapse:a");
    GAUGE_TEST_ASSERT(a == b);
    GAUGE_TEST_ASSERT_EQUAL(a->name(), "collapse:a");
    GAUGE_TEST_ASSERT(Log::lookup(":") == Log::root());
    GAUGE_TEST_ASSERT(Log::lookup("") == Log::root());
}

GAUGE_UNITTEST(Log, noInheritSinks)
{
    Logger::ptr parent = Log::lookup("noinherit");
    Logger::ptr child = Log::lookup("noinherit:child");
    TestLogSink::ptr parentSink(new TestLogSink());
    TestLogSink::ptr childSink(new TestLogSink());
    parent->addSink(parentSink);
    child->addSink(childSink);
    child->inheritSinks(false);
    GAUGE_LOG_INFO(child) << "only here";
    GAUGE_TEST_ASSERT_EQUAL(childSink->m_str, "only here");
    GAUGE_TEST_ASSERT(parentSink->m_str.empty());
    child->inheritSinks(true);
    child->removeSink(childSink);
    GAUGE_TEST_ASSERT(child->sinks().empty());
    parent->clearSinks();
}

GAUGE_UNITTEST(Log, levels)
{
    Logger::ptr log = Log::lookup("levels");
    TestLogSink::ptr sink(new TestLogSink());
    log->addSink(sink);
    log->level(Log::WARNING);
    GAUGE_TEST_ASSERT(log->enabled(Log::ERROR));
    GAUGE_TEST_ASSERT(log->enabled(Log::WARNING));
    GAUGE_TEST_ASSERT(!log->enabled(Log::INFO));
    GAUGE_LOG_INFO(log) << "filtered";
    GAUGE_TEST_ASSERT(sink->m_str.empty());
    GAUGE_LOG_ERROR(log) << "kept";
    GAUGE_TEST_ASSERT_EQUAL(sink->m_str, "kept");
    GAUGE_TEST_ASSERT_EQUAL(sink->m_level, Log::ERROR);
    // FATAL can't be turned off
    log->level(Log::NONE);
    GAUGE_TEST_ASSERT(log->enabled(Log::FATAL));
    log->level(Log::INFO);
    log->clearSinks();
}

GAUGE_UNITTEST(Log, levelPropagates)
{
    Logger::ptr parent = Log::lookup("propagate");
    Logger::ptr child = Log::lookup("propagate:child");
    parent->level(Log::DEBUG);
    GAUGE_TEST_ASSERT_EQUAL(child->level(), Log::DEBUG);
    parent->level(Log::INFO, false);
    GAUGE_TEST_ASSERT_EQUAL(parent->level(), Log::INFO);
    GAUGE_TEST_ASSERT_EQUAL(child->level(), Log::DEBUG);
    parent->level(Log::INFO);
}

GAUGE_UNITTEST(Log, disabler)
{
    Logger::ptr log = Log::lookup("disabler");
    TestLogSink::ptr sink(new TestLogSink());
    log->addSink(sink);
    {
        LogDisabler disable;
        GAUGE_TEST_ASSERT(!log->enabled(Log::ERROR));
        GAUGE_LOG_ERROR(log) << "disabled";
        {
            LogDisabler nested;
        }
        // Still disabled by the outer one
        GAUGE_TEST_ASSERT(!log->enabled(Log::ERROR));
    }
    GAUGE_TEST_ASSERT(sink->m_str.empty());
    GAUGE_LOG_ERROR(log) << "enabled";
    GAUGE_TEST_ASSERT_EQUAL(sink->m_str, "enabled");
    log->clearSinks();
}

GAUGE_UNITTEST(Log, masks)
{
    Logger::ptr log = Log::lookup("masks:child");
    ConfigVarBase::ptr debugMask = Config::lookup("log.debugmask");
    GAUGE_TEST_ASSERT(debugMask);
    std::string oldMask = debugMask->toString();
    GAUGE_TEST_ASSERT(debugMask->fromString("masks:.*"));
    GAUGE_TEST_ASSERT_EQUAL(log->level(), Log::DEBUG);
    GAUGE_TEST_ASSERT_EQUAL(Log::lookup("levels")->level(), Log::INFO);
    GAUGE_TEST_ASSERT(debugMask->fromString(oldMask));
    GAUGE_TEST_ASSERT_EQUAL(log->level(), Log::INFO);
}

GAUGE_UNITTEST(Log, streamLevel)
{
    GAUGE_TEST_ASSERT_EQUAL(boost::lexical_cast<std::string>(Log::WARNING),
        "WARN");
    GAUGE_TEST_ASSERT_EQUAL(boost::lexical_cast<std::string>(Log::TRACE),
        "TRACE");
    GAUGE_TEST_ASSERT_EQUAL(boost::lexical_cast<Log::Level>("debug"),
        Log::DEBUG);
    GAUGE_TEST_ASSERT_EQUAL(boost::lexical_cast<Log::Level>("Warning"),
        Log::WARNING);
    GAUGE_TEST_ASSERT_EQUAL(boost::lexical_cast<Log::Level>("WARN"),
        Log::WARNING);
    GAUGE_TEST_ASSERT_EXCEPTION(boost::lexical_cast<Log::Level>("loud"),
        boost::bad_lexical_cast);
}

GAUGE_UNITTEST(Log, syslogFacility)
{
    int facility = SyslogLogSink::facilityFromString("local0");
    GAUGE_TEST_ASSERT_NOT_EQUAL(facility, -1);
    GAUGE_TEST_ASSERT_EQUAL(SyslogLogSink::facilityToString(facility),
        "local0");
    GAUGE_TEST_ASSERT_EQUAL(SyslogLogSink::facilityFromString("nosuch"), -1);
}
