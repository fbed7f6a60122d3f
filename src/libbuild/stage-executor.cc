#include "arbor/build/stage-executor.hh"
#include "arbor/store/build/sandbox.hh"

namespace arbor {

StageIdentity StageExecution::identity() const
{
    return {
        .pipeline = pipeline.name,
        .index = index,
        .type = stage.type,
        .fingerprint = fingerprint.to_string(),
    };
}

StageOutcome runThenTearDown(const std::function<StageOutcome()> & run, const std::function<void()> & teardown)
{
    std::optional<StageOutcome> outcome;
    try {
        outcome = run();
    } catch (StageError & stageError) {
        try {
            teardown();
        } catch (SandboxError & e) {
            e.addTrace("while cleaning up after a failed stage: %s", stageError.message());
            throw;
        }
        throw;
    }

    teardown();

    return std::move(*outcome);
}

SandboxStageExecutor::SandboxStageExecutor(
    SandboxStageExecutorConfig config, std::shared_ptr<const CapabilityPolicy> capabilityPolicy)
    : config(std::move(config))
    , capabilityPolicy(std::move(capabilityPolicy))
{
}

StageOutcome SandboxStageExecutor::execute(const StageExecution & execution)
{
    auto & stage = execution.stage;

    BuildRootConfig rootConfig{
        .buildTree = execution.buildTree,
        .hostPaths = config.hostPaths,
        .tree = execution.tree,
        .inputs = execution.inputs,
        .libDir = config.libDir,
        .tempDir = config.tempDir,
        .capabilities = capabilityPolicy->allowedCapabilities(execution.descriptor.capabilities),
        .filterSyscalls = config.filterSyscalls,
        .allowNewPrivileges = config.allowNewPrivileges,
    };

    for (auto & d : stage.devices)
        rootConfig.devices.push_back({.name = d.name, .type = d.type, .parent = d.parent, .options = d.options});

    for (auto & m : stage.mounts) {
        SandboxMount mount{.name = m.name, .type = m.type, .source = m.source, .target = m.target, .options = m.options};
        if (m.partition)
            mount.partition = std::to_string(*m.partition);
        rootConfig.mounts.push_back(std::move(mount));
    }

    BuildRoot root(std::move(rootConfig));

    StageRunRequest request{
        .stage = execution.identity(),
        .program = execution.descriptor.program,
        .options = stage.options,
        .inputs = execution.inputData,
        .sourceEpoch = execution.pipeline.sourceEpoch,
        .timeout = config.timeout,
        .maxLogLines = config.maxLogLines,
    };

    return runThenTearDown([&]() { return runStage(root, request); }, [&]() { root.teardown(); });
}

} // namespace arbor
