#pragma once
///@file

#include "arbor/store/build/stage-host.hh"

#include <optional>

#include <nlohmann/json.hpp>

namespace arbor {

/**
 * Which stage of which pipeline is running.
 */
struct StageIdentity
{
    std::string pipeline;
    size_t index = 0;
    std::string type;
    std::string fingerprint;
};

/**
 * A stage that failed: it exited with a non-zero status, reported an
 * exception over its API channel, or ran out of time.
 */
class StageError : public Error
{
public:
    StageIdentity stage;

    /**
     * Wait status of the stage process, or -1 if it did not exit on
     * its own.
     */
    int status;

    /**
     * The last lines of the stage's output.
     */
    Strings logTail;

    /**
     * The structured failure report, or null.
     */
    nlohmann::json payload;

    template<typename... Args>
    StageError(
        StageIdentity stage, int status, Strings logTail, nlohmann::json payload, const std::string & fs, const Args &... args)
        : Error(fs, args...)
        , stage(std::move(stage))
        , status(status)
        , logTail(std::move(logTail))
        , payload(std::move(payload))
    {
    }
};

struct StageRunRequest
{
    StageIdentity stage;

    /**
     * The stage executable on the host.
     */
    Path program;

    nlohmann::json options = nlohmann::json::object();

    /**
     * Per-input data passed to the stage, keyed by input name. The
     * input contents are made available by the host under
     * `inputsDir()/<name>`.
     */
    std::map<std::string, nlohmann::json> inputs;

    std::optional<uint64_t> sourceEpoch;

    /**
     * Seconds; 0 means no limit.
     */
    unsigned int timeout = 0;

    size_t maxLogLines = 100;
};

struct StageOutcome
{
    /**
     * Everything the stage reported as metadata, merged.
     */
    nlohmann::json metadata = nlohmann::json::object();

    Strings logTail;
};

/**
 * The document a stage receives on stdin.
 */
nlohmann::json stageArguments(const StageHost & host, const StageRunRequest & request);

/**
 * The complete environment of a stage process.
 */
StringMap stageEnvironment(const StageHost & host, const StageRunRequest & request);

/**
 * Run one stage on `host` and wait for it to finish. Throws
 * `StageError` if the stage fails.
 */
StageOutcome runStage(StageHost & host, const StageRunRequest & request);

} // namespace arbor
