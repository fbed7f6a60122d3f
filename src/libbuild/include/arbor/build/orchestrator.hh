#pragma once
///@file

#include "arbor/build/build-result.hh"
#include "arbor/build/stage-executor.hh"
#include "arbor/manifest/fingerprint.hh"
#include "arbor/store/object-store.hh"
#include "arbor/store/sources.hh"

namespace arbor {

struct BuildOptions
{
    /**
     * The pipelines to build (with everything they need) and export.
     * Empty means all pipelines, none exported.
     */
    StringSet exports;

    std::optional<Path> outputDirectory;

    /**
     * Start no new pipeline once one has failed.
     */
    bool failFast = false;

    /**
     * Pipelines built concurrently; 0 means one per CPU.
     */
    unsigned int maxJobs = 0;

    unsigned int sourceFetchJobs = 4;

    FetchRetryPolicy retryPolicy;
};

/**
 * Builds the pipelines of a resolved manifest: fetches their sources,
 * reuses cached stage outputs from the object store and runs the
 * remaining stages through a `StageExecutor`, committing each result.
 */
class Orchestrator
{
    ObjectStore & store;
    SourceCache & sourceCache;
    const SourceFetchers & fetchers;
    StageExecutor & executor;
    BuildOptions options;

public:

    Orchestrator(
        ObjectStore & store,
        SourceCache & sourceCache,
        const SourceFetchers & fetchers,
        StageExecutor & executor,
        BuildOptions options);

    /**
     * Build the selected pipelines. Failures of individual pipelines
     * (stage, source and cache errors) are recorded in the result.
     *
     * @throws ManifestError if an export names an unknown pipeline.
     * @throws SandboxError and other errors that make the whole build
     * meaningless, once in-flight work has finished.
     */
    BuildResult build(const ResolvedManifest & manifest);
};

} // namespace arbor
