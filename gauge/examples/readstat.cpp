// Copyright (c) 2009 - Mozy, Inc.

#include "gauge/predef.h"

#include <iostream>
#include <stdexcept>

#include <boost/exception/diagnostic_information.hpp>

#include "gauge/config.h"
#include "gauge/log.h"
#include "gauge/main.h"
#include "gauge/streams/file.h"
#include "gauge/streams/std.h"
#include "readstats.h"

using namespace Gauge;

static ConfigVar<std::string>::ptr g_tag = Config::lookup<std::string>(
    "readstat.tag", std::string("READ"), "Tag for read statistics");
static ConfigVar<Log::Level>::ptr g_level = Config::lookup(
    "readstat.level", Log::INFO, "Level to log reads at");
static ConfigVar<size_t>::ptr g_bufferSize = Config::lookup<size_t>(
    "readstat.buffersize", 8192,
    "Size of the buffer on top of the read logger; 0 to read unbuffered");
static ConfigVar<bool>::ptr g_discard = Config::lookup(
    "readstat.discard", false, "Discard the data instead of copying it to stdout");

static Logger::ptr g_log = Log::lookup("gauge:examples:readstat");
static Logger::ptr g_readLog = Log::lookup("gauge:streams:readlogger");

GAUGE_MAIN(int argc, char *argv[])
{
    try {
        Config::loadFromEnvironment();
        Config::loadFromCommandLine(argc, argv);
    } catch (std::invalid_argument &ex) {
        std::cerr << "invalid value for --" << ex.what() << std::endl;
        return 1;
    }

    StdoutStream stdoutStream;
    bool failed = false;
    const char *hyphen = "-";
    char **args = argv + 1;
    int count = argc - 1;
    if (count == 0) {
        args = const_cast<char **>(&hyphen);
        count = 1;
    }
    for (int i = 0; i < count; ++i) {
        std::string arg(args[i]);
        try {
            Stream::ptr inStream;
            if (arg == "-")
                inStream.reset(new StdinStream());
            else
                inStream.reset(new FileStream(arg, FileStream::READ));
            ReadStats stats = readStats(inStream,
                g_discard->val() ? NULL : &stdoutStream, g_readLog,
                g_level->val(), g_tag->val(), g_bufferSize->val());
            std::cerr << g_tag->val() << " " << arg << ": " << stats
                << std::endl;
        } catch (std::exception &) {
            GAUGE_LOG_ERROR(g_log) << arg << ": "
                << boost::current_exception_diagnostic_information();
            std::cerr << arg << ": "
                << boost::current_exception_diagnostic_information()
                << std::endl;
            failed = true;
        }
    }
    return failed ? 1 : 0;
}
