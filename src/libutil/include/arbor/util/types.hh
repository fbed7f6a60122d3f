#pragma once
///@file

#include <list>
#include <set>
#include <string>
#include <string_view>
#include <map>
#include <vector>

namespace arbor {

typedef std::list<std::string> Strings;

using StringMap = std::map<std::string, std::string, std::less<>>;

using StringSet = std::set<std::string, std::less<>>;

/**
 * Paths are just strings.
 */
typedef std::string Path;
typedef std::string_view PathView;
typedef std::list<Path> Paths;
typedef std::set<Path> PathSet;

/**
 * Run a function once at program startup, e.g. to register a
 * component in a global table.
 */
template<typename T>
struct OnStartup
{
    OnStartup(T && t)
    {
        t();
    }
};

/**
 * For visiting a `std::variant` with a set of lambdas.
 */
template<class... Ts>
struct overloaded : Ts...
{
    using Ts::operator()...;
};
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace arbor
