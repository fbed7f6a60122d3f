#include "arbor/store/build/stage-runner.hh"
#include "arbor/store/build/api-channel.hh"
#include "arbor/util/logging.hh"
#include "arbor/util/signals.hh"
#include "arbor/util/json-utils.hh"

#include <chrono>

#include <poll.h>
#include <sys/mman.h>
#include <unistd.h>

namespace arbor {

nlohmann::json stageArguments(const StageHost & host, const StageRunRequest & request)
{
    auto inputs = nlohmann::json::object();
    for (auto & [name, data] : request.inputs)
        inputs[name] = {{"path", host.inputsDir() + "/" + name}, {"data", data}};

    auto devices = nlohmann::json::object();
    for (auto & [name, path] : host.devicePaths())
        devices[name] = {{"path", path}};

    auto mounts = nlohmann::json::object();
    for (auto & [name, path] : host.mountPaths())
        mounts[name] = {{"path", path}};

    return {
        {"tree", host.treePath()},
        {"paths",
         {
             {"devices", host.devicesDir()},
             {"inputs", host.inputsDir()},
             {"mounts", host.mountsDir()},
         }},
        {"options", request.options},
        {"inputs", std::move(inputs)},
        {"devices", std::move(devices)},
        {"mounts", std::move(mounts)},
        {"meta", {{"id", request.stage.fingerprint}}},
    };
}

StringMap stageEnvironment(const StageHost & host, const StageRunRequest & request)
{
    StringMap env{
        {"PATH", "/usr/sbin:/usr/bin:/sbin:/bin"},
        {"HOME", host.treePath()},
        {"LC_CTYPE", "C.UTF-8"},
        {"ARBOR_API_FD", "3"},
        {"container", "arbor"},
    };
    if (request.sourceEpoch)
        env["SOURCE_DATE_EPOCH"] = std::to_string(*request.sourceEpoch);
    return env;
}

/**
 * Put the arguments document in an anonymous file, so that the stage
 * can read it at its own pace and we never block on (or get SIGPIPE
 * from) a stage that does not read its input.
 */
static AutoCloseFD makeArgumentsFile(const nlohmann::json & args)
{
    AutoCloseFD fd = memfd_create("arbor-stage-arguments", MFD_CLOEXEC);
    if (!fd)
        throw SysError("creating the stage arguments file");
    writeFull(fd.get(), args.dump());
    if (lseek(fd.get(), 0, SEEK_SET) == -1)
        throw SysError("seeking in the stage arguments file");
    return fd;
}

StageOutcome runStage(StageHost & host, const StageRunRequest & request)
{
    auto & stage = request.stage;

    Activity act(
        *logger,
        lvlInfo,
        actStage,
        fmt("running stage '%s' (%d) of pipeline '%s'", stage.type, stage.index, stage.pipeline),
        {stage.pipeline, (uint64_t) stage.index, stage.type, stage.fingerprint});

    StageOutcome outcome;
    std::optional<nlohmann::json> exception;

    auto addLogLine = [&](std::string line) {
        act.result(resBuildLogLine, line);
        outcome.logTail.push_back(std::move(line));
        if (outcome.logTail.size() > request.maxLogLines)
            outcome.logTail.pop_front();
    };

    Pipe output;
    output.create();

    SocketPair api;
    api.create();

    ApiChannel channel(
        std::move(api.parentSide),
        {
            .exception = [&](const nlohmann::json & data) { exception = data; },
            .metadata =
                [&](const nlohmann::json & data) {
                    outcome.metadata.update(data);
                    act.result(resStageMetadata, data.dump());
                },
            .log = [&](const std::string & text) { addLogLine(text); },
            .progress = [&](uint64_t done, uint64_t expected) { act.progress(done, expected); },
            .loopAttach = [&](const nlohmann::json & data) -> nlohmann::json {
                return {{"path", host.attachLoop(data)}};
            },
            .loopDetach = [&](const nlohmann::json & data) -> nlohmann::json {
                host.detachLoop(getString(valueAt(getObject(data), "device")));
                return nullptr;
            },
        });

    StageCommand command{
        .program = host.programPath(request.program),
        .env = stageEnvironment(host, request),
        .stdinFd = makeArgumentsFile(stageArguments(host, request)),
        .outputFd = std::move(output.writeSide),
        .apiFd = std::move(api.childSide),
    };

    Pid pid = host.start(std::move(command), output.readSide.get());

    using namespace std::chrono;
    std::optional<steady_clock::time_point> deadline;
    if (request.timeout)
        deadline = steady_clock::now() + seconds(request.timeout);

    std::optional<int> status;
    bool timedOut = false;
    bool outputEOF = false;
    std::string partial;

    while (!outputEOF || !channel.atEOF()) {
        checkInterrupt();

        int timeoutMs = 1000;
        if (deadline) {
            auto left = duration_cast<milliseconds>(*deadline - steady_clock::now()).count();
            if (left <= 0) {
                printError("stage '%s' of pipeline '%s' timed out after %d seconds",
                    stage.type, stage.pipeline, request.timeout);
                timedOut = true;
                pid.setKillSignal(SIGKILL);
                status = pid.kill();
                break;
            }
            timeoutMs = std::min<long long>(timeoutMs, left);
        }

        std::vector<struct pollfd> fds;
        if (!outputEOF)
            fds.push_back({.fd = output.readSide.get(), .events = POLLIN});
        if (!channel.atEOF())
            fds.push_back({.fd = channel.get(), .events = POLLIN});

        if (poll(fds.data(), fds.size(), timeoutMs) == -1) {
            if (errno == EINTR)
                continue;
            throw SysError("waiting for output of stage '%s'", stage.type);
        }

        for (auto & p : fds) {
            if (!(p.revents & (POLLIN | POLLHUP | POLLERR)))
                continue;

            if (p.fd == channel.get()) {
                channel.receive();
                continue;
            }

            char buf[8192];
            ssize_t rd = read(p.fd, buf, sizeof(buf));
            if (rd == -1) {
                if (errno == EINTR || errno == EAGAIN)
                    continue;
                throw SysError("reading output of stage '%s'", stage.type);
            }
            if (rd == 0) {
                outputEOF = true;
                if (!partial.empty())
                    addLogLine(std::move(partial));
                partial.clear();
                continue;
            }
            partial.append(buf, rd);
            size_t pos;
            while ((pos = partial.find('\n')) != std::string::npos) {
                addLogLine(partial.substr(0, pos));
                partial.erase(0, pos + 1);
            }
        }
    }

    if (!status)
        status = pid.wait();

    auto payload = exception ? *exception : nlohmann::json();

    if (timedOut)
        throw StageError(
            stage, -1, std::move(outcome.logTail), std::move(payload),
            "stage '%s' of pipeline '%s' timed out after %d seconds", stage.type, stage.pipeline, request.timeout);

    if (!statusOk(*status))
        throw StageError(
            stage, *status, std::move(outcome.logTail), std::move(payload),
            "stage '%s' of pipeline '%s' %s", stage.type, stage.pipeline, statusToString(*status));

    if (exception)
        throw StageError(
            stage, *status, std::move(outcome.logTail), std::move(payload),
            "stage '%s' of pipeline '%s' reported a failure", stage.type, stage.pipeline);

    act.result(resStageResult, (uint64_t) 1, (uint64_t) 0);

    return outcome;
}

} // namespace arbor
