#pragma once
///@file

#include "arbor/manifest/fingerprint.hh"
#include "arbor/store/build/capabilities.hh"
#include "arbor/store/build/sandbox-error.hh"
#include "arbor/store/build/stage-runner.hh"

#include <functional>
#include <memory>

namespace arbor {

/**
 * Everything needed to run one stage whose output is not cached.
 */
struct StageExecution
{
    const Pipeline & pipeline;
    size_t index;
    const Stage & stage;
    const StageDescriptor & descriptor;
    Fingerprint fingerprint;

    /**
     * The tree to transform, pre-populated with the output of the
     * previous stage.
     */
    Path tree;

    /**
     * The output of the pipeline's build pipeline.
     */
    std::optional<Path> buildTree;

    /**
     * Host directories holding the contents of each input.
     */
    std::map<std::string, Path> inputs;

    /**
     * The `data` passed to the stage for each input.
     */
    std::map<std::string, nlohmann::json> inputData;

    StageIdentity identity() const;
};

class StageExecutor
{
public:
    virtual ~StageExecutor() {}

    /**
     * Run the stage to completion.
     *
     * @throws StageError if the stage fails, SandboxError if it could
     * not be isolated.
     */
    virtual StageOutcome execute(const StageExecution & execution) = 0;
};

/**
 * Call `run`, then `teardown`, whether or not `run` threw a
 * `StageError`. A teardown `SandboxError` always wins, so that a leaked
 * build root aborts the build even if the stage failed; the stage's
 * error is kept as a trace.
 */
StageOutcome runThenTearDown(const std::function<StageOutcome()> & run, const std::function<void()> & teardown);

struct SandboxStageExecutorConfig
{
    Path libDir;
    Path tempDir;
    Strings hostPaths;
    bool filterSyscalls = true;
    bool allowNewPrivileges = false;
    unsigned int timeout = 0;
    size_t maxLogLines = 100;
};

/**
 * Runs every stage in a fresh `BuildRoot`.
 */
class SandboxStageExecutor : public StageExecutor
{
    SandboxStageExecutorConfig config;
    std::shared_ptr<const CapabilityPolicy> capabilityPolicy;

public:

    SandboxStageExecutor(SandboxStageExecutorConfig config, std::shared_ptr<const CapabilityPolicy> capabilityPolicy);

    StageOutcome execute(const StageExecution & execution) override;
};

} // namespace arbor
