#include "arbor/main/loggers.hh"
#include "arbor/util/logging.hh"

#include <optional>

#include <fcntl.h>
#include <unistd.h>

namespace arbor {

static LogFormat defaultLogFormat = LogFormat::raw;

static std::optional<Descriptor> monitorFd;

LogFormat parseLogFormat(const std::string & logFormatStr)
{
    if (logFormatStr == "raw")
        return LogFormat::raw;
    else if (logFormatStr == "raw-with-logs")
        return LogFormat::rawWithLogs;
    else if (logFormatStr == "internal-json")
        return LogFormat::internalJSON;
    throw UsageError("option 'log-format' has an invalid value '%s'", logFormatStr);
}

static std::unique_ptr<Logger> makeDefaultLogger()
{
    switch (defaultLogFormat) {
    case LogFormat::raw:
        return makeSimpleLogger(false);
    case LogFormat::rawWithLogs:
        return makeSimpleLogger(true);
    case LogFormat::internalJSON:
        return makeJSONLogger(STDERR_FILENO);
    }
    unreachable();
}

static void createDefaultLogger()
{
    auto main = makeDefaultLogger();
    if (monitorFd) {
        std::vector<std::unique_ptr<Logger>> extra;
        extra.push_back(makeJSONLogger(*monitorFd));
        logger = makeTeeLogger(std::move(main), std::move(extra));
    } else
        logger = std::move(main);
}

void setLogFormat(const std::string & logFormatStr)
{
    setLogFormat(parseLogFormat(logFormatStr));
}

void setLogFormat(const LogFormat & logFormat)
{
    defaultLogFormat = logFormat;
    createDefaultLogger();
}

void addMonitorFd(Descriptor fd)
{
    if (fcntl(fd, F_GETFD) == -1)
        throw SysError("monitor file descriptor %d is not open", fd);
    unix::closeOnExec(fd);
    monitorFd = fd;
    createDefaultLogger();
}

} // namespace arbor
