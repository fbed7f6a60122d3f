#include "arbor/build/orchestrator.hh"
#include "arbor/main/common-args.hh"
#include "arbor/main/shared.hh"
#include "arbor/manifest/fingerprint.hh"
#include "arbor/store/build/capabilities.hh"
#include "arbor/store/filetransfer.hh"
#include "arbor/store/globals.hh"
#include "arbor/util/file-descriptor.hh"
#include "arbor/util/file-system.hh"
#include "arbor/util/logging.hh"

#include <iostream>

#include <unistd.h>

#include <nlohmann/json.hpp>

namespace arbor {

struct ArborArgs : virtual MixCommonArgs
{
    std::string manifestPath;
    std::optional<std::string> outputDirectory;
    StringSet exports;
    bool failFast = false;
    bool inspect = false;
    bool printJSON = false;
    bool helpRequested = false;
    bool showVersion = false;

    ArborArgs()
        : MixCommonArgs("arbor")
    {
        addFlag({
            .longName = "help",
            .description = "Show usage information.",
            .handler = {[this]() { helpRequested = true; }},
        });

        addFlag({
            .longName = "version",
            .description = "Show version information.",
            .handler = {[this]() { showVersion = true; }},
        });

        addFlag({
            .longName = "store",
            .description = "The root of the object store.",
            .labels = {"dir"},
            .handler = {[](std::string dir) { settings.storeDir = absPath(dir); }},
        });

        addFlag({
            .longName = "libdir",
            .description = "The directory containing the stage executables.",
            .labels = {"dir"},
            .handler = {[](std::string dir) { settings.libDir = absPath(dir); }},
        });

        addFlag({
            .longName = "output-directory",
            .description = "Write exported pipelines to subdirectories of *dir*.",
            .labels = {"dir"},
            .handler = {&outputDirectory},
        });

        addFlag({
            .longName = "export",
            .description = "Build pipeline *name* and everything it depends on, and export its tree. May be repeated.",
            .labels = {"name"},
            .handler = {[this](std::string name) { exports.insert(name); }},
        });

        addFlag({
            .longName = "fail-fast",
            .description = "Do not start new pipelines after the first failure.",
            .handler = {&failFast, true},
        });

        addFlag({
            .longName = "keep-going",
            .description = "Keep building independent pipelines after a failure (the default).",
            .handler = {&failFast, false},
        });

        addFlag({
            .longName = "inspect",
            .description = "Print the resolved manifest with stage and pipeline fingerprints, and exit.",
            .handler = {&inspect, true},
        });

        addFlag({
            .longName = "json",
            .description = "Print the build result as JSON on standard output.",
            .handler = {&printJSON, true},
        });

        expectArg("manifest", &manifestPath, true);
    }

    std::string description() override
    {
        return "build the pipelines of an image manifest";
    }
};

static void showHelp(ArborArgs & args)
{
    std::cout << "Usage: arbor [options] MANIFEST\n\n"
              << "arbor: " << args.description() << ".\n"
              << "MANIFEST may be '-' to read the manifest from standard input.\n\n"
              << "Options:\n";
    args.printFlags(std::cout);
}

static std::string readManifest(const std::string & path)
{
    if (path == "-")
        return drainFD(STDIN_FILENO);
    return readFile(absPath(path));
}

static void printResult(const BuildResult & result)
{
    for (auto & p : result.pipelines) {
        auto line = fmt("%s: %s", p.name, printPipelineState(p.state));
        if (p.fingerprint)
            line += fmt(" %s", *p.fingerprint);
        if (p.state == PipelineState::Done && p.executedStages + p.cachedStages > 0)
            line += fmt(" (%d built, %d cached)", p.executedStages, p.cachedStages);
        logger->cout("%s", line);
        if (p.error)
            logger->cout("  %s", *p.error);
    }
}

static void mainWrapped(int argc, char ** argv)
{
    initArbor();

    ArborArgs args;
    args.parseCmdline(argvToStrings(argc, argv));

    if (args.helpRequested) {
        showHelp(args);
        return;
    }

    if (args.showVersion)
        printVersion(args.programName);

    if (args.manifestPath.empty())
        throw UsageError("no manifest given");

    if (!args.exports.empty() && !args.outputDirectory)
        throw UsageError("'--export' requires '--output-directory'");

    auto manifest = [&]() {
        try {
            return Manifest::parse(readManifest(args.manifestPath));
        } catch (Error & e) {
            e.addTrace("while reading manifest '%s'", args.manifestPath);
            throw;
        }
    }();

    FileStageRegistry registry(settings.libDir);
    auto resolved = resolveManifest(std::move(manifest), registry);

    if (args.inspect) {
        logger->cout("%s", resolved.inspect().dump(2));
        return;
    }

    auto store = ObjectStore::open(settings.storeDir.get());
    store->clearTemp();
    SourceCache sourceCache(store->sourcesDir());

    auto fileTransfer = makeCurlFileTransfer(FileTransferSettings::fromSettings(settings));
    auto fetchers = SourceFetchers::makeDefault(*fileTransfer);

    SandboxStageExecutor executor(
        SandboxStageExecutorConfig{
            .libDir = settings.libDir,
            .tempDir = store->tempDir().string(),
            .hostPaths = settings.sandboxHostPaths,
            .filterSyscalls = settings.filterSyscalls,
            .allowNewPrivileges = settings.allowNewPrivileges,
            .timeout = settings.stageTimeout,
            .maxLogLines = settings.maxLogLines,
        },
        makeCapabilityPolicy(settings));

    BuildOptions options{
        .exports = args.exports,
        .outputDirectory = args.outputDirectory ? std::optional<Path>(absPath(*args.outputDirectory)) : std::nullopt,
        .failFast = args.failFast,
        .maxJobs = settings.maxJobs,
        .sourceFetchJobs = settings.sourceFetchJobs,
        .retryPolicy =
            {
                .tries = settings.downloadAttempts,
                .baseRetryTimeMs = settings.downloadRetryBaseMs,
            },
    };

    Orchestrator orchestrator(*store, sourceCache, fetchers, executor, std::move(options));
    auto result = orchestrator.build(resolved);

    if (args.printJSON)
        logger->cout("%s", result.toJSON().dump());
    else
        printResult(result);

    if (!result.success())
        throw Exit(1);
}

} // namespace arbor

int main(int argc, char ** argv)
{
    return arbor::handleExceptions(argv[0], [&]() { arbor::mainWrapped(argc, argv); });
}
