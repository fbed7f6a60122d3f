#pragma once
/**
 * @file
 *
 * @brief Exception hierarchy shared by all arbor libraries.
 *
 * Every arbor exception derives from `BaseError` and carries an
 * `ErrorInfo`: a verbosity, a formatted message and a list of context
 * lines added while the exception propagates. Rendering happens in the
 * logger, so the same error can be shown as text or as JSON.
 */

#include "arbor/util/fmt.hh"

#include <cstring>
#include <list>
#include <optional>
#include <source_location>

namespace arbor {

typedef enum { lvlError = 0, lvlWarn, lvlNotice, lvlInfo, lvlTalkative, lvlChatty, lvlDebug, lvlVomit } Verbosity;

/**
 * One line of context, e.g. "while building pipeline 'tree'".
 */
struct Trace
{
    HintFmt hint;
};

struct ErrorInfo
{
    Verbosity level;
    HintFmt msg;

    /**
     * Innermost context first.
     */
    std::list<Trace> traces;

    /**
     * Process exit status when this error ends the program.
     */
    unsigned int status = 1;

    /**
     * Shown in usage hints; set once by `handleExceptions()`.
     */
    static std::optional<std::string> programName;
};

/**
 * Write `einfo` as "error: <msg>" preceded by its context lines. Only
 * the first few context lines are written unless `showTrace` is set.
 */
std::ostream & showErrorInfo(std::ostream & out, const ErrorInfo & einfo, bool showTrace);

/**
 * Root of the hierarchy. Catch `Error` instead, so that `Interrupted`
 * still unwinds to the top level.
 */
class BaseError : public std::exception
{
protected:
    mutable ErrorInfo err;

    /**
     * `err` rendered by showErrorInfo(), computed on first use.
     */
    mutable std::optional<std::string> what_;

    const std::string & calcWhat() const;

public:

    template<typename... Args>
    explicit BaseError(const std::string & fs, const Args &... args)
        : err{.level = lvlError, .msg = HintFmt(fs, args...)}
    {
    }

    BaseError(ErrorInfo && e)
        : err(std::move(e))
    {
    }

    BaseError(const ErrorInfo & e)
        : err(e)
    {
    }

    /**
     * The bare message, without level prefix or context lines.
     */
    std::string message() const
    {
        return err.msg.str();
    }

    const char * what() const noexcept override
    {
        return calcWhat().c_str();
    }

    const std::string & msg() const
    {
        return calcWhat();
    }

    const ErrorInfo & info() const
    {
        return err;
    }

    /**
     * Add a context line in front of the existing ones.
     */
    template<typename... Args>
    void addTrace(std::string_view fs, const Args &... args)
    {
        err.traces.push_front(Trace{.hint = HintFmt(std::string(fs), args...)});
        what_.reset();
    }
};

#define MakeError(newClass, superClass) \
    class newClass : public superClass  \
    {                                   \
    public:                             \
        using superClass::superClass;   \
    }

MakeError(Error, BaseError);

/**
 * Bad command line, configuration or export request.
 */
MakeError(UsageError, Error);

/**
 * Malformed encoded data, e.g. invalid Base64.
 */
MakeError(FormatError, Error);

/**
 * Catch this rather than `SysError`.
 */
MakeError(SystemError, Error);

/**
 * A failed system call. The message gets `strerror(errNo)` appended.
 */
class SysError : public SystemError
{
public:
    int errNo;

    template<typename... Args>
    SysError(int errNo, const Args &... args)
        : SystemError("")
        , errNo(errNo)
    {
        err.msg = HintFmt("%1%: %2%", Uncolored(HintFmt(args...).str()), strerror(errNo));
    }

    /**
     * Uses the current `errno`, so nothing may touch it between the
     * failing call and this constructor.
     */
    template<typename... Args>
    SysError(const Args &... args)
        : SysError(errno, args...)
    {
    }
};

/**
 * Thrown to end the program with `status` after unwinding.
 */
class Exit : public std::exception
{
public:
    int status;

    explicit Exit(int status = 0)
        : status(status)
    {
    }
};

/**
 * Write `msg` to stderr and terminate.
 */
[[noreturn]]
void panic(std::string_view msg);

/**
 * Terminate with the location of a branch that should be impossible.
 */
[[gnu::noinline, gnu::cold, noreturn]] void unreachable(std::source_location loc = std::source_location::current());

} // namespace arbor
