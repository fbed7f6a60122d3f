#pragma once
///@file

#include <deque>
#include <functional>
#include <limits>
#include <map>
#include <optional>
#include <ostream>
#include <set>
#include <vector>

#include "arbor/util/types.hh"
#include "arbor/util/error.hh"

namespace arbor {

/**
 * A command line parser. Flags take a fixed number of arguments;
 * whatever is not a flag is handed, in order, to the expected
 * positional arguments.
 */
class Args
{
public:

    /**
     * Parse `cmdline` (without the program name). Throws UsageError on
     * unknown flags, missing flag arguments, and surplus or missing
     * positional arguments.
     */
    void parseCmdline(const Strings & cmdline);

    /**
     * Print one line per flag, in registration order.
     */
    void printFlags(std::ostream & out) const;

    virtual std::string description()
    {
        return "";
    }

    virtual ~Args() = default;

protected:

    static constexpr size_t ArityAny = std::numeric_limits<size_t>::max();

    /**
     * What to do with the arguments of a flag or positional argument.
     * The number of arguments consumed follows from the constructor
     * used.
     */
    struct Handler
    {
        std::function<void(std::vector<std::string>)> fun;
        size_t arity = 0;

        Handler() {}

        Handler(std::function<void(std::vector<std::string>)> && fun)
            : fun(std::move(fun))
            , arity(ArityAny)
        {
        }

        Handler(std::function<void()> && f)
            : fun([f{std::move(f)}](std::vector<std::string>) { f(); })
            , arity(0)
        {
        }

        Handler(std::function<void(std::string)> && f)
            : fun([f{std::move(f)}](std::vector<std::string> ss) { f(std::move(ss.at(0))); })
            , arity(1)
        {
        }

        Handler(std::function<void(std::string, std::string)> && f)
            : fun([f{std::move(f)}](std::vector<std::string> ss) { f(std::move(ss.at(0)), std::move(ss.at(1))); })
            , arity(2)
        {
        }

        Handler(std::vector<std::string> * dest)
            : fun([dest](std::vector<std::string> ss) { *dest = std::move(ss); })
            , arity(ArityAny)
        {
        }

        Handler(std::string * dest)
            : fun([dest](std::vector<std::string> ss) { *dest = std::move(ss.at(0)); })
            , arity(1)
        {
        }

        Handler(std::optional<std::string> * dest)
            : fun([dest](std::vector<std::string> ss) { *dest = std::move(ss.at(0)); })
            , arity(1)
        {
        }

        template<class T>
        Handler(T * dest, const T & val)
            : fun([dest, val](std::vector<std::string>) { *dest = val; })
            , arity(0)
        {
        }
    };

    /**
     * A `--long` flag, optionally also reachable as `-s` or under
     * alternative long names.
     */
    struct Flag
    {
        std::string longName;
        std::set<std::string> aliases;
        char shortName = 0;
        std::string description;
        Strings labels;
        Handler handler;
    };

    /**
     * A positional argument. Consumes `handler.arity` arguments, or
     * everything left if the arity is `ArityAny`.
     */
    struct ExpectedArg
    {
        std::string label;
        bool optional = false;
        Handler handler;
    };

    /**
     * If the argument at the front of `args` is a known flag, pop it
     * with its arguments and run its handler.
     */
    virtual bool processFlag(std::deque<std::string> & args);

    /**
     * Offer the positional arguments collected so far to the next
     * expected argument. `finish` is set once the command line is
     * exhausted.
     */
    virtual bool processArgs(const Strings & args, bool finish);

public:

    void addFlag(Flag && flag);

    void expectArgs(ExpectedArg && arg)
    {
        expectedArgs.push_back(std::move(arg));
    }

    void expectArg(const std::string & label, std::string * dest, bool optional = false)
    {
        expectArgs({.label = label, .optional = optional, .handler = {dest}});
    }

    void expectArgs(const std::string & label, std::vector<std::string> * dest)
    {
        expectArgs({.label = label, .handler = {dest}});
    }

private:

    std::vector<Flag> flags;

    /**
     * Long names (aliases included) and short names, mapped to an
     * index into `flags`.
     */
    std::map<std::string, size_t> longIndex;
    std::map<char, size_t> shortIndex;

    std::deque<ExpectedArg> expectedArgs;

    void runFlag(const std::string & name, const Flag & flag, std::deque<std::string> & args);
};

Strings argvToStrings(int argc, char ** argv);

} // namespace arbor
