#pragma once
///@file

#include "arbor/util/file-descriptor.hh"
#include "arbor/util/types.hh"

namespace arbor {

enum class LogFormat {
    raw,
    rawWithLogs,
    internalJSON,
};

LogFormat parseLogFormat(const std::string & logFormatStr);

void setLogFormat(const std::string & logFormatStr);
void setLogFormat(const LogFormat & logFormat);

/**
 * Additionally stream every log event as JSON to `fd` (the
 * `--monitor-fd` option).
 */
void addMonitorFd(Descriptor fd);

} // namespace arbor
