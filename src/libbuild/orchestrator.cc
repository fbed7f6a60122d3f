#include "arbor/build/orchestrator.hh"
#include "arbor/util/file-system.hh"
#include "arbor/util/logging.hh"
#include "arbor/util/signals.hh"
#include "arbor/util/strings.hh"
#include "arbor/util/sync.hh"
#include "arbor/util/thread-pool.hh"

#include <atomic>

#include <unistd.h>

namespace arbor {

Orchestrator::Orchestrator(
    ObjectStore & store,
    SourceCache & sourceCache,
    const SourceFetchers & fetchers,
    StageExecutor & executor,
    BuildOptions options)
    : store(store)
    , sourceCache(sourceCache)
    , fetchers(fetchers)
    , executor(executor)
    , options(std::move(options))
{
}

namespace {

/**
 * The state of one call to `Orchestrator::build()`.
 */
struct Build
{
    ObjectStore & store;
    SourceCache & sourceCache;
    const SourceFetchers & fetchers;
    StageExecutor & executor;
    const BuildOptions & options;
    const ResolvedManifest & manifest;
    Activity & act;

    struct State
    {
        std::vector<PipelineResult> results;
        bool failed = false;

        /**
         * Sources that could not be fetched, with the error.
         */
        std::map<std::string, std::string> sourceErrors;
    };

    Sync<State> state_;

    std::set<size_t> selectPipelines() const;

    void fetchSources(const std::set<size_t> & selected);

    void buildPipeline(size_t p);

    void runPipeline(size_t p);

    ObjectStore::Entry runStage(size_t p, size_t k, const std::optional<ObjectStore::Entry> & previous);

    void finish(size_t p, PipelineState state, std::optional<std::string> error = {});

    void exportPipelines();

    std::optional<ObjectStore::Entry> outputOf(const std::string & name)
    {
        return state_.lock()->results[*manifest.indexOf(name)].output;
    }
};

std::set<size_t> Build::selectPipelines() const
{
    std::set<size_t> roots;
    for (auto & name : options.exports) {
        auto i = manifest.indexOf(name);
        if (!i)
            throw ManifestError("cannot export unknown pipeline '%s'", name);
        roots.insert(*i);
    }

    if (roots.empty())
        for (size_t i = 0; i < manifest.manifest.pipelines.size(); ++i)
            roots.insert(i);

    return manifest.graph.closure(roots);
}

void Build::fetchSources(const std::set<size_t> & selected)
{
    std::set<std::string> needed;
    for (auto p : selected)
        for (auto & stage : manifest.manifest.pipelines[p].stages)
            for (auto & [_, input] : stage.inputs)
                if (input.origin == StageInput::Origin::Source)
                    for (auto & [id, _] : input.references)
                        needed.insert(id);

    if (needed.empty())
        return;

    Activity fetchAct(*logger, lvlInfo, actFetchSources, fmt("fetching %d sources", needed.size()));

    std::atomic<uint64_t> done{0};
    fetchAct.progress(0, needed.size());

    ThreadPool pool(options.sourceFetchJobs);

    for (auto & id : needed)
        pool.enqueue([&, id]() {
            try {
                fetchSource(sourceCache, fetchers, manifest.manifest.sources.at(id), options.retryPolicy);
            } catch (SourceFetchError & e) {
                logError(e.info());
                state_.lock()->sourceErrors.emplace(id, e.message());
            }
            fetchAct.progress(++done, needed.size());
        });

    pool.process();
}

void Build::finish(size_t p, PipelineState state, std::optional<std::string> error)
{
    {
        auto st(state_.lock());
        auto & result = st->results[p];
        result.state = state;
        result.error = std::move(error);
        if (state == PipelineState::Failed)
            st->failed = true;
    }
    act.result(resPipelineStatus, manifest.manifest.pipelines[p].name, std::string(printPipelineState(state)));
}

void Build::buildPipeline(size_t p)
{
    auto & pipeline = manifest.manifest.pipelines[p];

    std::optional<PipelineState> verdict;
    std::optional<std::string> error;

    {
        auto st(state_.lock());

        for (auto dep : manifest.graph.dependencies[p])
            if (st->results[dep].state != PipelineState::Done) {
                debug("skipping pipeline '%s' because pipeline '%s' did not complete",
                    pipeline.name, st->results[dep].name);
                verdict = PipelineState::Skipped;
                break;
            }

        if (!verdict && options.failFast && st->failed)
            verdict = PipelineState::Skipped;

        for (auto & stage : pipeline.stages)
            for (auto & [name, input] : stage.inputs)
                if (!verdict && input.origin == StageInput::Origin::Source)
                    for (auto & [id, _] : input.references)
                        if (auto i = st->sourceErrors.find(id); i != st->sourceErrors.end() && !verdict) {
                            verdict = PipelineState::Failed;
                            error = fmt("source '%s' of input '%s' is unavailable: %s", id, name, i->second);
                        }
    }

    if (verdict) {
        finish(p, *verdict, std::move(error));
        return;
    }

    try {
        runPipeline(p);
    } catch (StageError & e) {
        logError(e.info());
        if (!e.logTail.empty())
            printError("last %d lines of output:\n> %s", e.logTail.size(), concatStringsSep("\n> ", e.logTail));
        finish(p, PipelineState::Failed, e.message());
    } catch (SourceFetchError & e) {
        logError(e.info());
        finish(p, PipelineState::Failed, e.message());
    } catch (CacheError & e) {
        logError(e.info());
        finish(p, PipelineState::Failed, e.message());
    }
}

void Build::runPipeline(size_t p)
{
    auto & pipeline = manifest.manifest.pipelines[p];
    auto & fingerprints = manifest.stageFingerprints[p];

    Activity pipelineAct(
        *logger, lvlInfo, actPipeline, fmt("building pipeline '%s'", pipeline.name), {pipeline.name});

    state_.lock()->results[p].state = PipelineState::ResolvingCache;
    pipelineAct.result(resSetPhase, "resolving-cache");

    if (pipeline.stages.empty()) {
        /* The output is that of the build pipeline, if any. */
        if (pipeline.build) {
            auto output = outputOf(*pipeline.build);
            state_.lock()->results[p].output = std::move(output);
        }
        finish(p, PipelineState::Done);
        return;
    }

    /* Find the last stage whose output is already in the store. */
    std::optional<ObjectStore::Entry> current;
    size_t next = 0;
    for (size_t k = fingerprints.size(); k-- > 0;) {
        if (auto entry = store.lookup(fingerprints[k].to_string())) {
            pipelineAct.result(resCacheHit, entry->fingerprint);
            current = std::move(entry);
            next = k + 1;
            break;
        }
    }

    state_.lock()->results[p].cachedStages = next;

    if (next < pipeline.stages.size()) {
        state_.lock()->results[p].state = PipelineState::Building;
        pipelineAct.result(resSetPhase, "building");

        for (size_t k = next; k < pipeline.stages.size(); ++k) {
            checkInterrupt();
            current = runStage(p, k, current);
            pipelineAct.progress(k + 1, pipeline.stages.size());
        }
    }

    state_.lock()->results[p].output = std::move(current);
    finish(p, PipelineState::Done);
}

ObjectStore::Entry Build::runStage(size_t p, size_t k, const std::optional<ObjectStore::Entry> & previous)
{
    auto & pipeline = manifest.manifest.pipelines[p];
    auto & stage = pipeline.stages[k];
    auto fingerprint = manifest.stageFingerprints[p][k];

    while (true) {
        ObjectStore::Reservation reservation;
        try {
            reservation = store.reserve(fingerprint.to_string());
        } catch (BuildAbandoned &) {
            debug("the builder of '%s' gave up; trying again", fingerprint.to_string());
            continue;
        }

        if (reservation.entry) {
            /* Someone else built it in the meantime. */
            state_.lock()->results[p].cachedStages++;
            return std::move(*reservation.entry);
        }

        auto & ticket = *reservation.ticket;

        /* The first stage starts from the output of the build
           pipeline, if there is one. */
        auto base = previous;
        if (!base && pipeline.build)
            base = outputOf(*pipeline.build);

        if (base)
            store.materialize(*base, ticket.treePath());
        else
            createDirs(ticket.treePath());

        StageExecution execution{
            .pipeline = pipeline,
            .index = k,
            .stage = stage,
            .descriptor = *manifest.descriptors[p][k],
            .fingerprint = fingerprint,
            .tree = ticket.treePath().string(),
        };

        if (pipeline.build)
            if (auto output = outputOf(*pipeline.build))
                execution.buildTree = output->treePath.string();

        std::optional<AutoDelete> inputsRoot;
        auto inputDir = [&](const std::string & name) {
            if (!inputsRoot)
                inputsRoot.emplace(createTempDir(store.tempDir(), "inputs", 0755));
            auto dir = inputsRoot->path() / name;
            createDirs(dir);
            return dir;
        };

        nlohmann::json usedInputs = nlohmann::json::object();

        for (auto & [name, input] : stage.inputs) {
            auto & used = usedInputs[name] = nlohmann::json::array();

            if (input.origin == StageInput::Origin::Pipeline) {
                auto refs = nlohmann::json::object();
                for (auto & [ref, refOptions] : input.references) {
                    refs["name:" + ref] = refOptions;
                    used.push_back("name:" + ref);
                }
                execution.inputData[name] = {{"refs", std::move(refs)}};

                if (input.references.size() == 1) {
                    auto output = outputOf(input.references.begin()->first);
                    execution.inputs[name] = output ? output->treePath.string() : inputDir(name).string();
                } else {
                    auto dir = inputDir(name);
                    for (auto & [ref, _] : input.references)
                        if (auto output = outputOf(ref))
                            copyTree(output->treePath, dir / ref);
                        else
                            createDirs(dir / ref);
                    execution.inputs[name] = dir.string();
                }
            } else {
                auto dir = inputDir(name);
                auto files = nlohmann::json::object();
                for (auto & [id, refOptions] : input.references) {
                    auto entry = sourceCache.lookup(Hash::parsePrefixed(id));
                    if (!entry)
                        throw SourceFetchError("source '%s' is not in the cache", id);
                    auto dest = dir / id;
                    if (link(entry->path.c_str(), dest.c_str()) == -1)
                        copyFile(entry->path, dest);
                    files[id] = refOptions;
                    used.push_back(id);
                }
                execution.inputData[name] = {{"files", std::move(files)}};
                execution.inputs[name] = dir.string();
            }
        }

        auto outcome = executor.execute(execution);

        auto outputs = nlohmann::json::array();
        for (auto & entry : std::filesystem::directory_iterator(ticket.treePath()))
            outputs.push_back(entry.path().filename().string());

        auto entry = ticket.commit({
            {"pipeline", pipeline.name},
            {"stage", k},
            {"type", stage.type},
            {"exit-status", 0},
            {"inputs", std::move(usedInputs)},
            {"outputs", std::move(outputs)},
            {"metadata", std::move(outcome.metadata)},
        });

        state_.lock()->results[p].executedStages++;

        return entry;
    }
}

void Build::exportPipelines()
{
    createDirs(*options.outputDirectory);

    for (auto & name : options.exports) {
        auto p = *manifest.indexOf(name);

        std::optional<ObjectStore::Entry> output;
        {
            auto st(state_.lock());
            auto & result = st->results[p];
            if (result.state != PipelineState::Done) {
                if (!result.error)
                    result.error = fmt("cannot export pipeline '%s' because it did not complete", name);
                continue;
            }
            output = result.output;
        }

        Activity exportAct(*logger, lvlInfo, actExport, fmt("exporting pipeline '%s'", name), {name});

        auto dest = std::filesystem::path(*options.outputDirectory) / name;
        try {
            if (output)
                copyTree(output->treePath, dest);
            else
                createDirs(dest);
        } catch (Error & e) {
            logError(e.info());
            auto st(state_.lock());
            st->results[p].state = PipelineState::Failed;
            st->results[p].error = fmt("exporting to '%s' failed: %s", dest.string(), e.message());
            st->failed = true;
        }
    }
}

} // namespace

BuildResult Orchestrator::build(const ResolvedManifest & manifest)
{
    if (!options.exports.empty() && !options.outputDirectory)
        throw UsageError("exporting pipelines requires an output directory");

    Activity act(*logger, lvlInfo, actBuild, "building manifest");

    Build b{
        .store = store,
        .sourceCache = sourceCache,
        .fetchers = fetchers,
        .executor = executor,
        .options = options,
        .manifest = manifest,
        .act = act,
    };

    auto selected = b.selectPipelines();

    {
        auto st(b.state_.lock());
        for (size_t i = 0; i < manifest.manifest.pipelines.size(); ++i) {
            PipelineResult result{.name = manifest.manifest.pipelines[i].name};
            if (manifest.pipelineFingerprints[i])
                result.fingerprint = manifest.pipelineFingerprints[i]->to_string();
            if (!selected.count(i))
                result.state = PipelineState::Skipped;
            st->results.push_back(std::move(result));
        }
    }

    b.fetchSources(selected);

    processGraph<size_t>(
        selected,
        [&](const size_t & p) { return manifest.graph.dependencies[p]; },
        [&](const size_t & p) { b.buildPipeline(p); },
        options.maxJobs);

    if (!options.exports.empty())
        b.exportPipelines();

    return BuildResult{.pipelines = std::move(b.state_.lock()->results)};
}

} // namespace arbor
