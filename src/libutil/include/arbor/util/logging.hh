#pragma once
///@file

#include "arbor/util/error.hh"
#include "arbor/util/configuration.hh"
#include "arbor/util/file-descriptor.hh"

#include <functional>
#include <variant>

#include <nlohmann/json_fwd.hpp>

namespace arbor {

/**
 * What an `Activity` represents. The numeric values are part of the
 * JSON monitor protocol.
 */
typedef enum {
    actUnknown = 0,
    actBuild = 100,
    actPipeline = 101,
    actStage = 102,
    actFetchSources = 103,
    actFetchSource = 104,
    actExport = 105,
} ActivityType;

/**
 * Kinds of progress reported on a running activity. Also part of the
 * monitor protocol.
 */
typedef enum {
    resBuildLogLine = 101,
    resSetPhase = 104,
    resProgress = 105,
    resPipelineStatus = 110,
    resStageResult = 111,
    resCacheHit = 112,
    resStageMetadata = 113,
} ResultType;

typedef uint64_t ActivityId;

struct LoggerSettings : Config
{
    Setting<bool> showTrace{
        this,
        false,
        "show-trace",
        R"(
          Whether to print the chain of pipelines and stages that led to
          an error.
        )"};
};

extern LoggerSettings loggerSettings;

/**
 * Receives everything arbor reports: plain messages, errors, and the
 * start, progress and end of activities. The human-readable logger
 * and the JSON build monitor are both implementations.
 */
class Logger
{
public:

    using Field = std::variant<uint64_t, std::string>;
    using Fields = std::vector<Field>;

    virtual ~Logger() {}

    virtual void log(Verbosity lvl, std::string_view s) = 0;

    virtual void logEI(const ErrorInfo & ei) = 0;

    virtual void warn(const std::string & msg);

    virtual void startActivity(
        ActivityId act,
        Verbosity lvl,
        ActivityType type,
        const std::string & s,
        const Fields & fields,
        ActivityId parent) {};

    virtual void stopActivity(ActivityId act) {};

    virtual void result(ActivityId act, ResultType type, const Fields & fields) {};

    /**
     * Command output proper, as opposed to diagnostics.
     */
    virtual void writeToStdout(std::string_view s);

    template<typename... Args>
    void cout(const Args &... args)
    {
        writeToStdout(fmt(args...));
    }
};

/**
 * A unit of work shown to the user, from construction to destruction.
 */
struct Activity
{
    Logger & logger;

    const ActivityId id;

    Activity(
        Logger & logger,
        Verbosity lvl,
        ActivityType type,
        const std::string & s = "",
        const Logger::Fields & fields = {},
        ActivityId parent = 0);

    Activity(Logger & logger, ActivityType type, const Logger::Fields & fields = {}, ActivityId parent = 0)
        : Activity(logger, lvlError, type, "", fields, parent)
    {
    }

    Activity(const Activity &) = delete;

    ~Activity();

    void progress(uint64_t done = 0, uint64_t expected = 0, uint64_t running = 0, uint64_t failed = 0) const
    {
        result(resProgress, done, expected, running, failed);
    }

    template<typename... Args>
    void result(ResultType type, const Args &... args) const
    {
        Logger::Fields fields;
        (fields.emplace_back(args), ...);
        logger.result(id, type, fields);
    }
};

extern std::unique_ptr<Logger> logger;

/**
 * Human-readable messages on stderr. Stage output is shown only if
 * `printBuildLogs`.
 */
std::unique_ptr<Logger> makeSimpleLogger(bool printBuildLogs = true);

/**
 * Forward everything to `mainLogger` and each of `extraLoggers`.
 * Only `mainLogger` writes to stdout.
 */
std::unique_ptr<Logger>
makeTeeLogger(std::unique_ptr<Logger> mainLogger, std::vector<std::unique_ptr<Logger>> && extraLoggers);

/**
 * The build monitor: one JSON object per line on `fd`, each prefixed
 * with "@arbor " unless `includeArborPrefix` is false.
 */
std::unique_ptr<Logger> makeJSONLogger(Descriptor fd, bool includeArborPrefix = true);

/**
 * Like the above, but hands each record to `sink`.
 */
std::unique_ptr<Logger> makeJSONLogger(std::function<void(const nlohmann::json &)> sink);

/**
 * Messages above this level are dropped.
 */
extern Verbosity verbosity;

/**
 * Log an `ErrorInfo` at `lvl`, e.g. `logError(e.info())`.
 */
#define logErrorInfo(lvl, errorInfo...)         \
    do {                                        \
        auto __lvl = (lvl);                     \
        if (__lvl <= arbor::verbosity) {        \
            arbor::ErrorInfo __ei = errorInfo;  \
            __ei.level = __lvl;                 \
            arbor::logger->logEI(__ei);         \
        }                                       \
    } while (0)

#define logError(errorInfo...) logErrorInfo(lvlError, errorInfo)

/**
 * Format and log a message. A macro so that the arguments are only
 * evaluated if the message is shown.
 */
#define printMsg(level, args...)                            \
    do {                                                    \
        auto __lvl = (level);                               \
        if (__lvl <= arbor::verbosity)                      \
            arbor::logger->log(__lvl, arbor::fmt(args));    \
    } while (0)

#define printError(args...) printMsg(lvlError, args)
#define printInfo(args...) printMsg(lvlInfo, args)
#define printTalkative(args...) printMsg(lvlTalkative, args)
#define debug(args...) printMsg(lvlDebug, args)

template<typename... Args>
inline void warn(const std::string & fs, const Args &... args)
{
    logger->warn(fmt(fs, args...));
}

/**
 * For use in a `catch (...)` block of a destructor: log the exception
 * in flight unless it is `Interrupted`.
 */
void ignoreExceptionInDestructor(Verbosity lvl = lvlError);

/**
 * Write to stderr, ignoring errors.
 */
void writeToStderr(std::string_view s);

} // namespace arbor
