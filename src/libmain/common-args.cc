#include "arbor/main/common-args.hh"
#include "arbor/main/loggers.hh"
#include "arbor/store/globals.hh"
#include "arbor/util/logging.hh"
#include "arbor/util/strings.hh"

#include <algorithm>

namespace arbor {

MixCommonArgs::MixCommonArgs(const std::string & programName)
    : programName(programName)
{
    addFlag({
        .longName = "verbose",
        .shortName = 'v',
        .description = "Increase the logging verbosity level.",
        .handler = {[]() {
            verbosity = (Verbosity) std::min<std::underlying_type_t<Verbosity>>(verbosity + 1, lvlVomit);
        }},
    });

    addFlag({
        .longName = "quiet",
        .description = "Decrease the logging verbosity level.",
        .handler = {[]() { verbosity = verbosity > lvlError ? (Verbosity) (verbosity - 1) : lvlError; }},
    });

    addFlag({
        .longName = "debug",
        .description = "Set the logging verbosity level to 'debug'.",
        .handler = {[]() { verbosity = lvlDebug; }},
    });

    addFlag({
        .longName = "option",
        .description = "Set the configuration setting *name* to *value* (overriding `arbor.conf`).",
        .labels = {"name", "value"},
        .handler = {[](std::string name, std::string value) {
            if (!settings.set(name, value) && !loggerSettings.set(name, value))
                warn("unknown setting '%s'", name);
        }},
    });

    addFlag({
        .longName = "log-format",
        .description = "Set the format of log output; one of `raw`, `raw-with-logs` or `internal-json`.",
        .labels = {"format"},
        .handler = {[](std::string format) { setLogFormat(format); }},
    });

    addFlag({
        .longName = "monitor-fd",
        .description = "Stream build events as JSON to file descriptor *fd*.",
        .labels = {"fd"},
        .handler = {[](std::string s) {
            auto fd = string2Int<int>(s);
            if (!fd || *fd < 0)
                throw UsageError("'--monitor-fd' requires a file descriptor number, got '%s'", s);
            addMonitorFd(*fd);
        }},
    });

    addFlag({
        .longName = "show-trace",
        .description = "Show the context of errors.",
        .handler = {[]() { loggerSettings.showTrace.override(true); }},
    });

    addFlag({
        .longName = "max-jobs",
        .shortName = 'j',
        .description = "The maximum number of pipelines built in parallel.",
        .labels = {"jobs"},
        .handler = {[](std::string s) { settings.set("max-jobs", s); }},
    });
}

} // namespace arbor
