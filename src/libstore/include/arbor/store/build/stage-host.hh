#pragma once
///@file

#include "arbor/store/build/sandbox-error.hh"
#include "arbor/util/file-descriptor.hh"
#include "arbor/util/processes.hh"

#include <map>

#include <nlohmann/json_fwd.hpp>

namespace arbor {

/**
 * A stage executable to start, with the child ends of its standard
 * streams and API channel. `StageHost::start()` takes ownership of the
 * descriptors and closes them in the parent.
 */
struct StageCommand
{
    Path program;
    Strings args;
    StringMap env;
    AutoCloseFD stdinFd;
    AutoCloseFD outputFd;
    AutoCloseFD apiFd;
};

/**
 * Where and how a stage process runs. Paths returned here are the
 * paths the stage sees.
 */
class StageHost
{
public:
    virtual ~StageHost() {}

    virtual Path treePath() const = 0;
    virtual Path inputsDir() const = 0;
    virtual Path devicesDir() const = 0;
    virtual Path mountsDir() const = 0;

    /**
     * The path of a stage executable, given its path on the host.
     */
    virtual Path programPath(const Path & hostProgram) const = 0;

    virtual std::map<std::string, Path> devicePaths() const = 0;
    virtual std::map<std::string, Path> mountPaths() const = 0;

    /**
     * Start `command`. Returns once the process is about to execute
     * the program; set-up messages arriving on `outputReadSide` before
     * that are consumed.
     */
    virtual Pid start(StageCommand && command, Descriptor outputReadSide) = 0;

    /**
     * Attach a loop device on behalf of the running stage and return
     * its path.
     */
    virtual Path attachLoop(const nlohmann::json & options)
    {
        throw SandboxError("loop devices are not available to this stage");
    }

    virtual void detachLoop(const Path & device)
    {
        throw SandboxError("loop devices are not available to this stage");
    }
};

} // namespace arbor
