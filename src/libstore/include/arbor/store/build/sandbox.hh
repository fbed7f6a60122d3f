#pragma once
///@file

#include "arbor/store/build/devices.hh"
#include "arbor/store/build/stage-host.hh"
#include "arbor/util/file-system.hh"

#include <optional>
#include <vector>

#include <nlohmann/json.hpp>

namespace arbor {

struct SandboxDevice
{
    std::string name;
    std::string type;
    std::optional<std::string> parent;
    nlohmann::json options = nlohmann::json::object();
};

struct SandboxMount
{
    std::string name;
    std::string type;

    /**
     * The name of the device to mount.
     */
    std::string source;
    Path target;
    std::optional<std::string> partition;
    nlohmann::json options = nlohmann::json::object();
};

struct BuildRootConfig
{
    /**
     * The tree of the `build` pipeline, used read-only as `/`. Without
     * one, `hostPaths` are bound from the host.
     */
    std::optional<Path> buildTree;
    Strings hostPaths;

    /**
     * The tree the stage mutates.
     */
    Path tree;

    std::map<std::string, Path> inputs;

    Path libDir;

    /**
     * Where the staging root of the sandbox is created.
     */
    Path tempDir;

    StringSet capabilities;
    bool filterSyscalls = true;
    bool allowNewPrivileges = false;

    std::vector<SandboxDevice> devices;
    std::vector<SandboxMount> mounts;
};

/**
 * The isolated environment of one stage: new mount, PID, IPC, UTS and
 * network namespaces (plus a user namespace when not running as
 * root), a minimal root assembled from bind mounts, a reduced
 * capability bounding set and a syscall filter.
 *
 * Loop devices are attached on the host when the `BuildRoot` is
 * created; file systems are mounted inside the stage's mount namespace
 * and disappear with it. `teardown()` must be called once the stage
 * has exited.
 */
class BuildRoot : public StageHost
{
public:

    static constexpr std::string_view sandboxTree = "/run/arbor/tree";
    static constexpr std::string_view sandboxInputs = "/run/arbor/inputs";
    static constexpr std::string_view sandboxLib = "/run/arbor/lib";
    static constexpr std::string_view sandboxApi = "/run/arbor/api";
    static constexpr std::string_view sandboxMounts = "/run/arbor/mounts";

    explicit BuildRoot(BuildRootConfig config);

    BuildRoot(const BuildRoot &) = delete;

    ~BuildRoot();

    Path treePath() const override
    {
        return std::string(sandboxTree);
    }

    Path inputsDir() const override
    {
        return std::string(sandboxInputs);
    }

    Path devicesDir() const override
    {
        return "/dev";
    }

    Path mountsDir() const override
    {
        return std::string(sandboxMounts);
    }

    Path programPath(const Path & hostProgram) const override;

    std::map<std::string, Path> devicePaths() const override;

    std::map<std::string, Path> mountPaths() const override;

    Pid start(StageCommand && command, Descriptor outputReadSide) override;

    Path attachLoop(const nlohmann::json & options) override;

    void detachLoop(const Path & device) override;

    /**
     * Detach all loop devices and remove the staging root.
     *
     * @throws SandboxError if anything could not be released.
     */
    void teardown();

private:

    BuildRootConfig config;

    bool privileged;
    bool usingUserNamespace = false;

    AutoDelete stagingDir;

    /**
     * Devices declared by the stage, by name, in attachment order.
     */
    std::vector<std::pair<std::string, LoopDevice>> devices;

    /**
     * Devices attached through the API channel, by path.
     */
    std::map<Path, LoopDevice> apiDevices;

    pid_t childPid = -1;

    bool tornDown = false;

    void attachDevices();

    const LoopDevice & device(const std::string & name) const;

    [[noreturn]] void runChild(StageCommand & command, Pipe & userNamespaceSync);

    void enterSandbox();

    void setupMounts(const Path & root);
};

} // namespace arbor
