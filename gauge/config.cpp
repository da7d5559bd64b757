// Copyright (c) 2009 - Mozy, Inc.

#include "config.h"

#include <string.h>

#include "string.h"

extern char **environ;

namespace Gauge {

static Logger::ptr g_log = Log::lookup("gauge:config");

bool
Config::isValidName(const std::string &name)
{
    return !name.empty() &&
        name.find_first_not_of("abcdefghijklmnopqrstuvwxyz.") ==
        std::string::npos;
}

ConfigVarBase::ptr
Config::lookup(const std::string &name)
{
    ConfigVarSet::iterator it = vars().find(name);
    if (it == vars().end())
        return ConfigVarBase::ptr();
    return *it;
}

void
Config::visit(boost::function<void (ConfigVarBase::ptr)> dg)
{
    for (ConfigVarSet::const_iterator it = vars().begin();
        it != vars().end();
        ++it) {
        dg(*it);
    }
}

void
Config::loadFromCommandLine(int &argc, char *argv[])
{
    char **end = argv + argc;
    char **arg = argv;
    // Skip argv[0] (presumably program name)
    ++arg;
    while (arg < end) {
        // Only look at arguments that begin with --
        if (strncmp(*arg, "--", 2u) != 0) {
            ++arg;
            continue;
        }
        // Don't process arguments after --
        if (strcmp(*arg, "--") == 0)
            break;
        char *equals = strchr(*arg, '=');
        char *val;
        // Support either --arg=value or --arg value
        if (equals) {
            *equals = '\0';
            val = equals + 1;
        } else {
            val = *(arg + 1);
        }

        ConfigVarBase::ptr var = lookup(*arg + 2);
        if (var) {
            // Don't use val == *end, we don't want to actually dereference end
            if (!equals && arg + 1 == end)
                GAUGE_THROW_EXCEPTION(std::invalid_argument(*arg + 2));
            if (!var->fromString(val))
                GAUGE_THROW_EXCEPTION(std::invalid_argument(*arg + 2));
            GAUGE_LOG_VERBOSE(g_log) << "set " << var->name() << " = "
                << var->toString() << " from command line";
            // Adjust argv to remove this arg (and its param, if it was a
            // separate arg)
            int toSkip = equals ? 1 : 2;
            memmove(arg, arg + toSkip, (end - arg - toSkip) * sizeof(char *));
            argc -= toSkip;
            end -= toSkip;
        } else {
            // --arg=value wasn't a ConfigVar, restore the equals
            if (equals)
                *equals = '=';
            ++arg;
        }
    }
}

void
Config::loadFromEnvironment()
{
    if (!environ)
        return;
    for (char **env = environ; *env; ++env) {
        const char *equals = strchr(*env, '=');
        if (!equals || equals == *env)
            continue;
        std::string key(*env, equals - *env);
        std::string value(equals + 1);
        key = toLower(key);
        replace(key, '_', '.');
        if (!isValidName(key))
            continue;
        ConfigVarBase::ptr var = lookup(key);
        if (!var)
            continue;
        if (var->fromString(value)) {
            GAUGE_LOG_VERBOSE(g_log) << "set " << key << " = "
                << var->toString() << " from environment";
        } else {
            GAUGE_LOG_WARNING(g_log) << "ignoring invalid value '" << value
                << "' for " << key << " from environment";
        }
    }
}

}
