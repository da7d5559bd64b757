#ifndef __GAUGE_CONFIG_H__
#define __GAUGE_CONFIG_H__
// Copyright (c) 2009 - Mozy, Inc.

#include "predef.h"

#include <string>

#include <boost/function.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/multi_index_container.hpp>
#include <boost/multi_index/global_fun.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/signals2/signal.hpp>

#include "assert.h"

namespace Gauge {

/*
Configuration Variables (ConfigVars) adjust the behavior of Gauge and the
programs built on it at runtime, without recompiling.

ConfigVars are stored in a singleton key-value table.  Typical uses are the
log masks (e.g. "log.debugmask"), the default buffer size of
BufferedStreams, and the options of example programs.

The key name of a ConfigVar can only contain lower case letters and the "."
separator.  When set from an environment variable, upper case characters are
converted to lower case, and "_" can be used in place of ".".

A ConfigVar is declared once, with its type and default value, typically at
global scope:

static ConfigVar<std::string>::ptr g_tag =
    Config::lookup<std::string>("readstat.tag", std::string("READ"),
                                "Tag for read statistics");

Elsewhere it can be found by name with the non-templated Config::lookup(),
and read or written generically with toString() and fromString().
*/

class ConfigVarBase : public boost::noncopyable
{
public:
    typedef boost::shared_ptr<ConfigVarBase> ptr;

public:
    ConfigVarBase(const std::string &name, const std::string &description = "")
        : m_name(name),
          m_description(description)
    {}
    virtual ~ConfigVarBase() {}

    std::string name() const { return m_name; }
    std::string description() const { return m_description; }

    /// onChange should not throw any exceptions
    boost::signals2::signal<void ()> onChange;
    void monitor(boost::function<void ()> dg) { onChange.connect(dg); }

    virtual std::string toString() const = 0;
    /// @return If the new value was accepted
    virtual bool fromString(const std::string &str) = 0;

private:
    std::string m_name, m_description;
};

template <class T>
class ConfigVar : public ConfigVarBase
{
public:
    /// Stops at, and reports, the first slot that rejects the new value
    struct BreakOnFailureCombiner
    {
        typedef bool result_type;
        template <typename InputIterator>
        bool operator()(InputIterator first, InputIterator last) const
        {
            try {
                for (; first != last; ++first)
                    if (!*first) return false;
            } catch (std::exception &) {
                return false;
            }
            return true;
        }
    };

    typedef boost::shared_ptr<ConfigVar> ptr;
    typedef boost::signals2::signal<bool (const T&), BreakOnFailureCombiner> before_change_signal_type;
    typedef boost::signals2::signal<void (const T&)> on_change_signal_type;

public:
    ConfigVar(const std::string &name, const T &defaultValue,
        const std::string &description = "")
        : ConfigVarBase(name, description),
          m_val(defaultValue)
    {}

    std::string toString() const
    {
        return boost::lexical_cast<std::string>(m_val);
    }

    bool fromString(const std::string &str)
    {
        try {
            return val(boost::lexical_cast<T>(str));
        } catch (boost::bad_lexical_cast &) {
            return false;
        }
    }

    /// beforeChange gives the opportunity to reject the new value;
    /// return false or throw an exception to prevent the change
    before_change_signal_type beforeChange;
    /// onChange should not throw any exceptions
    on_change_signal_type onChange;

    T val() const { return m_val; }
    bool val(const T &v)
    {
        T oldVal = m_val;
        if (oldVal != v) {
            if (!beforeChange(v))
                return false;
            m_val = v;
            onChange(v);
            ConfigVarBase::onChange();
        }
        return true;
    }

private:
    T m_val;
};

class Config
{
private:
    static std::string getName(const ConfigVarBase::ptr &var)
    {
        return var->name();
    }
    typedef boost::multi_index_container<
        ConfigVarBase::ptr,
        boost::multi_index::indexed_by<
            boost::multi_index::ordered_unique<
            boost::multi_index::global_fun<const ConfigVarBase::ptr &,
                std::string, &getName> >
        >
    > ConfigVarSet;

public:
    /// Declare a ConfigVar
    ///
    /// @note A ConfigVar can only be declared once.
    /// @throws std::invalid_argument With what() == the name of the ConfigVar
    ///         if the name is not valid.
    template <class T>
    static typename ConfigVar<T>::ptr lookup(const std::string &name,
        const T &defaultValue, const std::string &description = "")
    {
        if (!isValidName(name))
            GAUGE_THROW_EXCEPTION(std::invalid_argument(name));

        GAUGE_ASSERT(vars().find(name) == vars().end());
        typename ConfigVar<T>::ptr v(new ConfigVar<T>(name, defaultValue,
            description));
        vars().insert(v);
        return v;
    }

    /// Find a previously declared ConfigVar
    /// @return NULL if no ConfigVar is named name
    static ConfigVarBase::ptr lookup(const std::string &name);

    /// Iterate all the ConfigVars, in name order
    static void visit(boost::function<void (ConfigVarBase::ptr)> dg);

    /// Load ConfigVars from command line arguments
    ///
    /// argv[0] is skipped (assumed to be the program name), and argc and argv
    /// are updated to remove any arguments that were used to set ConfigVars.
    /// Arguments can be of the form --configVarName=value or
    /// --configVarName value.  Any arguments after a -- are ignored.
    /// @throws std::invalid_argument With what() == the name of the ConfigVar
    ///         if the value was not successfully set
    static void loadFromCommandLine(int &argc, char *argv[]);

    /// Update ConfigVars from environment variables of the form KEY=VALUE
    /// where KEY, lower cased and with "_" replaced by ".", names a declared
    /// ConfigVar.  Values that fail to convert are ignored.
    static void loadFromEnvironment();

    static bool isValidName(const std::string &name);

private:
    static ConfigVarSet &vars()
    {
        static ConfigVarSet vars;
        return vars;
    }
};

}

#endif
