// Copyright (c) 2009 - Mozy, Inc.

#include "gauge/predef.h"

#include "stdoutlistener.h"

#include <time.h>

#include <iostream>

#include <boost/exception/diagnostic_information.hpp>

#include "gauge/config.h"

using namespace Gauge;
using namespace Gauge::Test;

static ConfigVar<bool>::ptr g_includeStartTime =
    Config::lookup<bool>("test.outputstarttime", true,
        "Print start time in test output");

StdoutListener::StdoutListener()
: m_tests(0),
  m_success(0)
{}

void
StdoutListener::testStarted(const std::string &suite, const std::string &test)
{
    if (test != "<invariant>")
        ++m_tests;
    std::cout << "Running ";
    if (g_includeStartTime->val())
        std::cout << "(" << time(NULL) << ") ";
    std::cout << suite << "::" << test << ": ";
    std::cout.flush();
}

void
StdoutListener::testComplete(const std::string &suite, const std::string &test)
{
    if (test != "<invariant>")
        ++m_success;
    std::cout << "OK" << std::endl;
}

void
StdoutListener::testAsserted(const std::string &suite, const std::string &test,
                             const Assertion &assertion)
{
    std::cerr << "Assertion: "
        << boost::current_exception_diagnostic_information() << std::endl;
    m_failures.push_back(std::make_pair(suite, test));
}

void
StdoutListener::testException(const std::string &suite, const std::string &test)
{
    std::cerr << "Unexpected exception: "
        << boost::current_exception_diagnostic_information() << std::endl;
    m_failures.push_back(std::make_pair(suite, test));
}

void
StdoutListener::testsComplete()
{
    std::cout << "Tests complete.  " << m_success << "/" << m_tests
        << " passed." << std::endl;
    if (!m_failures.empty()) {
        std::cout << "Failures:" << std::endl;
        for (std::vector<std::pair<std::string, std::string> >::iterator
            it = m_failures.begin();
            it != m_failures.end();
            ++it)
                std::cout << '\t' << it->first << "::" << it->second
                    << std::endl;
    }
}
