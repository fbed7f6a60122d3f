#include "arbor/util/args.hh"

#include <cctype>
#include <ostream>

namespace arbor {

void Args::addFlag(Flag && flag)
{
    if (flag.longName.empty())
        throw Error("a command line flag needs a long name");
    if (flag.handler.arity != ArityAny && flag.handler.arity != flag.labels.size())
        throw Error(
            "flag '--%s' takes %d argument(s) but has %d label(s)",
            flag.longName,
            flag.handler.arity,
            flag.labels.size());

    auto index = flags.size();
    longIndex[flag.longName] = index;
    for (auto & alias : flag.aliases)
        longIndex[alias] = index;
    if (flag.shortName)
        shortIndex[flag.shortName] = index;
    flags.push_back(std::move(flag));
}

/**
 * Split `-abc` into `-a -b -c`, and `-j4` into `-j 4`.
 */
static void splitShortFlags(const std::string & arg, std::deque<std::string> & out)
{
    for (size_t i = 1; i < arg.size(); ++i) {
        if (!isalpha(static_cast<unsigned char>(arg[i]))) {
            out.push_back(arg.substr(i));
            return;
        }
        out.push_back(std::string("-") + arg[i]);
    }
}

void Args::parseCmdline(const Strings & cmdline)
{
    std::deque<std::string> args;
    Strings positional;

    for (auto & arg : cmdline) {
        if (arg.size() > 2 && arg[0] == '-' && arg[1] != '-' && isalpha(static_cast<unsigned char>(arg[1])))
            splitShortFlags(arg, args);
        else
            args.push_back(arg);
    }

    auto addPositional = [&](std::string arg) {
        positional.push_back(std::move(arg));
        if (processArgs(positional, false))
            positional.clear();
    };

    while (!args.empty()) {
        auto & arg = args.front();

        if (arg == "--") {
            args.pop_front();
            for (auto & rest : args)
                addPositional(rest);
            break;
        }

        if (arg.size() > 1 && arg[0] == '-') {
            auto name = arg;
            if (!processFlag(args))
                throw UsageError("unrecognised flag '%1%'", name);
            continue;
        }

        addPositional(std::move(arg));
        args.pop_front();
    }

    processArgs(positional, true);
}

void Args::printFlags(std::ostream & out) const
{
    const size_t column = 32;

    for (auto & flag : flags) {
        std::string s = "  --" + flag.longName;
        if (flag.shortName)
            s += std::string(", -") + flag.shortName;
        for (auto & label : flag.labels)
            s += " <" + label + ">";
        out << s;
        if (s.size() < column)
            out << std::string(column - s.size(), ' ');
        else
            out << "\n" << std::string(column, ' ');
        out << flag.description << "\n";
    }
}

void Args::runFlag(const std::string & name, const Flag & flag, std::deque<std::string> & args)
{
    args.pop_front();

    std::vector<std::string> values;
    while (values.size() < flag.handler.arity && !args.empty()) {
        values.push_back(std::move(args.front()));
        args.pop_front();
    }

    if (flag.handler.arity != ArityAny && values.size() < flag.handler.arity)
        throw UsageError(
            "flag '%s' requires %d argument(s), but only %d were given", name, flag.handler.arity, values.size());

    flag.handler.fun(std::move(values));
}

bool Args::processFlag(std::deque<std::string> & args)
{
    auto & arg = args.front();

    if (arg.compare(0, 2, "--") == 0) {
        auto i = longIndex.find(arg.substr(2));
        if (i == longIndex.end())
            return false;
        runFlag(arg, flags[i->second], args);
        return true;
    }

    if (arg.size() == 2 && arg[0] == '-') {
        auto i = shortIndex.find(arg[1]);
        if (i == shortIndex.end())
            return false;
        runFlag(arg, flags[i->second], args);
        return true;
    }

    return false;
}

bool Args::processArgs(const Strings & args, bool finish)
{
    if (expectedArgs.empty()) {
        if (!args.empty())
            throw UsageError("unexpected argument '%1%'", args.front());
        return true;
    }

    auto & next = expectedArgs.front();
    auto arity = next.handler.arity;

    bool consumed = false;
    if (arity == ArityAny ? finish : args.size() == arity) {
        next.handler.fun(std::vector<std::string>(args.begin(), args.end()));
        expectedArgs.pop_front();
        consumed = true;
    }

    if (finish && !expectedArgs.empty() && !expectedArgs.front().optional)
        throw UsageError("missing argument '%s'", expectedArgs.front().label);

    return consumed;
}

Strings argvToStrings(int argc, char ** argv)
{
    return argc > 1 ? Strings(argv + 1, argv + argc) : Strings();
}

} // namespace arbor
