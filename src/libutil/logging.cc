#include "arbor/util/logging.hh"
#include "arbor/util/file-descriptor.hh"
#include "arbor/util/terminal.hh"
#include "arbor/util/sync.hh"
#include "arbor/util/signals.hh"

#include <atomic>
#include <cstdlib>
#include <sstream>

#include <nlohmann/json.hpp>

namespace arbor {

LoggerSettings loggerSettings;

Verbosity verbosity = lvlInfo;

std::unique_ptr<Logger> logger = makeSimpleLogger(true);

void writeToStderr(std::string_view s)
{
    /* Cleanup code logs too, so a closed stderr must not make it
       throw. */
    try {
        writeFull(STDERR_FILENO, s, false);
    } catch (SystemError &) {
    }
}

void Logger::warn(const std::string & msg)
{
    log(lvlWarn, ANSI_WARNING "warning:" ANSI_NORMAL " " + msg);
}

void Logger::writeToStdout(std::string_view s)
{
    writeFull(STDOUT_FILENO, std::string(s) + "\n");
}

static std::string renderErrorInfo(const ErrorInfo & ei)
{
    std::ostringstream out;
    showErrorInfo(out, ei, loggerSettings.showTrace.get());
    return out.str();
}

static const std::string & fieldString(const Logger::Fields & fields, size_t n)
{
    static const std::string empty;
    if (n >= fields.size())
        return empty;
    auto s = std::get_if<std::string>(&fields[n]);
    return s ? *s : empty;
}

/**
 * The sd-daemon(3) priority prefix for `lvl`.
 */
static char systemdPriority(Verbosity lvl)
{
    switch (lvl) {
    case lvlError:
        return '3';
    case lvlWarn:
        return '4';
    case lvlNotice:
    case lvlInfo:
        return '5';
    case lvlTalkative:
    case lvlChatty:
        return '6';
    default:
        return '7';
    }
}

class SimpleLogger : public Logger
{
    bool printBuildLogs;
    bool tty = isTTY();
    bool systemd = false;

public:

    SimpleLogger(bool printBuildLogs)
        : printBuildLogs(printBuildLogs)
    {
        auto env = getenv("ARBOR_LOG_SYSTEMD");
        systemd = env && std::string_view(env) == "1";
    }

    void log(Verbosity lvl, std::string_view s) override
    {
        if (lvl > verbosity)
            return;
        std::string prefix;
        if (systemd)
            prefix = std::string("<") + systemdPriority(lvl) + ">";
        writeToStderr(prefix + filterANSIEscapes(s, !tty) + "\n");
    }

    void logEI(const ErrorInfo & ei) override
    {
        log(ei.level, renderErrorInfo(ei));
    }

    void startActivity(
        ActivityId act,
        Verbosity lvl,
        ActivityType type,
        const std::string & s,
        const Fields & fields,
        ActivityId parent) override
    {
        if (!s.empty())
            log(lvl, s + "...");
    }

    void result(ActivityId act, ResultType type, const Fields & fields) override
    {
        switch (type) {
        case resBuildLogLine:
            if (printBuildLogs)
                log(lvlError, fieldString(fields, 0));
            break;
        case resPipelineStatus: {
            auto & status = fieldString(fields, 1);
            auto colour = status == "failed" ? ANSI_RED : status == "done" ? ANSI_GREEN : ANSI_WARNING;
            log(lvlError,
                fmt("pipeline " ANSI_BOLD "%s" ANSI_NORMAL ": %s%s" ANSI_NORMAL, fieldString(fields, 0), colour, status));
            break;
        }
        default:
            break;
        }
    }
};

std::unique_ptr<Logger> makeSimpleLogger(bool printBuildLogs)
{
    return std::make_unique<SimpleLogger>(printBuildLogs);
}

/* Unique across processes writing to the same monitor. */
static std::atomic<uint64_t> nextActivityId{0};

Activity::Activity(
    Logger & logger,
    Verbosity lvl,
    ActivityType type,
    const std::string & s,
    const Logger::Fields & fields,
    ActivityId parent)
    : logger(logger)
    , id((uint64_t(getpid()) << 32) | nextActivityId++)
{
    logger.startActivity(id, lvl, type, s, fields, parent);
}

Activity::~Activity()
{
    try {
        logger.stopActivity(id);
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

class JSONLogger : public Logger
{
    std::function<void(const nlohmann::json &)> sink;

    static nlohmann::json record(std::string_view action)
    {
        nlohmann::json json;
        json["action"] = action;
        return json;
    }

    static void addFields(nlohmann::json & json, const Fields & fields)
    {
        if (fields.empty())
            return;
        auto & array = json["fields"] = nlohmann::json::array();
        for (auto & field : fields)
            std::visit([&](auto & value) { array.push_back(value); }, field);
    }

public:

    JSONLogger(std::function<void(const nlohmann::json &)> sink)
        : sink(std::move(sink))
    {
    }

    void log(Verbosity lvl, std::string_view s) override
    {
        auto json = record("msg");
        json["level"] = lvl;
        json["msg"] = s;
        sink(json);
    }

    void logEI(const ErrorInfo & ei) override
    {
        auto json = record("msg");
        json["level"] = ei.level;
        json["msg"] = renderErrorInfo(ei);
        json["raw_msg"] = ei.msg.str();

        /* Outermost context first. */
        if (!ei.traces.empty()) {
            auto & traces = json["trace"] = nlohmann::json::array();
            for (auto i = ei.traces.rbegin(); i != ei.traces.rend(); ++i)
                traces.push_back(nlohmann::json{{"raw_msg", i->hint.str()}});
        }

        sink(json);
    }

    void startActivity(
        ActivityId act,
        Verbosity lvl,
        ActivityType type,
        const std::string & s,
        const Fields & fields,
        ActivityId parent) override
    {
        auto json = record("start");
        json["id"] = act;
        json["level"] = lvl;
        json["type"] = type;
        json["text"] = s;
        json["parent"] = parent;
        addFields(json, fields);
        sink(json);
    }

    void stopActivity(ActivityId act) override
    {
        auto json = record("stop");
        json["id"] = act;
        sink(json);
    }

    void result(ActivityId act, ResultType type, const Fields & fields) override
    {
        auto json = record("result");
        json["id"] = act;
        json["type"] = type;
        addFields(json, fields);
        sink(json);
    }
};

std::unique_ptr<Logger> makeJSONLogger(std::function<void(const nlohmann::json &)> sink)
{
    return std::make_unique<JSONLogger>(std::move(sink));
}

std::unique_ptr<Logger> makeJSONLogger(Descriptor fd, bool includeArborPrefix)
{
    /* Shared by all copies of the sink. Cleared after the first failed
       write so that a vanished monitor does not fail the build. */
    auto enabled_ = std::make_shared<Sync<bool>>(true);

    return makeJSONLogger([fd, includeArborPrefix, enabled_](const nlohmann::json & json) {
        auto line = std::string(includeArborPrefix ? "@arbor " : "")
                    + json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";

        auto enabled(enabled_->lock());
        if (!*enabled)
            return;
        try {
            writeFull(fd, line, false);
        } catch (SystemError & e) {
            *enabled = false;
            writeToStderr(fmt("warning: disabling the JSON monitor after a write error: %s\n", e.message()));
        }
    });
}

void ignoreExceptionInDestructor(Verbosity lvl)
{
    try {
        throw;
    } catch (Interrupted &) {
    } catch (std::exception & e) {
        printMsg(lvl, ANSI_RED "error (ignored):" ANSI_NORMAL " %1%", e.what());
    }
}

} // namespace arbor
