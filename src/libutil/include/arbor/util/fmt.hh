#pragma once
///@file

#include <boost/format.hpp>
#include <string>
#include <string_view>

#include "arbor/util/ansicolor.hh"

namespace arbor {

/**
 * Surplus or missing arguments are tolerated; a malformed format
 * string is not.
 */
inline void setExceptions(boost::format & f)
{
    f.exceptions(boost::io::all_error_bits ^ boost::io::too_many_args_bit ^ boost::io::too_few_args_bit);
}

/**
 * `boost::format` shorthand: `fmt("%s: %d", a, b)`. A lone argument is
 * returned as is, so text from stages and manifests is never parsed
 * as a format string.
 */
inline std::string fmt(std::string_view s)
{
    return std::string(s);
}

inline std::string fmt(const std::string & s)
{
    return s;
}

inline std::string fmt(const char * s)
{
    return s;
}

template<typename... Args>
inline std::string fmt(const std::string & fs, const Args &... args)
{
    boost::format f(fs);
    setExceptions(f);
    (f % ... % args);
    return f.str();
}

/**
 * Marks an argument that HintFmt must not highlight.
 */
template<class T>
struct Uncolored
{
    const T & value;

    Uncolored(const T & value)
        : value(value)
    {
    }
};

/**
 * Like fmt(), but highlights every interpolated argument. Used for
 * error messages.
 */
class HintFmt
{
    boost::format f;

    template<class T>
    struct Highlighted
    {
        const T & value;

        friend std::ostream & operator<<(std::ostream & out, const Highlighted & h)
        {
            return out << ANSI_WARNING << h.value << ANSI_NORMAL;
        }
    };

public:

    /**
     * `literal` is shown verbatim.
     */
    HintFmt(const std::string & literal)
        : HintFmt("%s", Uncolored(literal))
    {
    }

    template<typename... Args>
    HintFmt(const std::string & format, const Args &... args)
        : f(format)
    {
        setExceptions(f);
        (*this % ... % args);
    }

    template<class T>
    HintFmt & operator%(const T & value)
    {
        f % Highlighted<T>{value};
        return *this;
    }

    template<class T>
    HintFmt & operator%(const Uncolored<T> & value)
    {
        f % value.value;
        return *this;
    }

    std::string str() const
    {
        return f.str();
    }
};

std::ostream & operator<<(std::ostream & os, const HintFmt & hf);

} // namespace arbor
