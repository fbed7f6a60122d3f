#include <gtest/gtest.h>

#include "arbor/build/orchestrator.hh"
#include "arbor/util/file-system.hh"
#include "arbor/util/finally.hh"
#include "arbor/util/logging.hh"

#include <atomic>
#include <thread>

namespace arbor {

using nlohmann::json;

static const std::string helloChecksum =
    "sha256:2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824";

/**
 * Stages implemented in-process:
 *
 * - `org.arbor.write` writes `options.content` to `options.file`,
 *   creating its parent directories.
 * - `org.arbor.collect` copies every input into the tree.
 * - `org.arbor.fail` fails.
 * - `org.arbor.gate` waits until a stage has failed.
 * - `org.arbor.leak` fails, and then fails to clean up its build root.
 */
class FakeStageExecutor : public StageExecutor
{
public:
    Sync<std::vector<std::string>> executed;
    Sync<std::map<std::string, std::optional<Path>>> buildTrees;
    std::atomic<bool> someStageFailed{false};

    StageOutcome execute(const StageExecution & execution) override
    {
        auto & stage = execution.stage;

        executed.lock()->push_back(fmt("%s/%d", execution.pipeline.name, execution.index));
        buildTrees.lock()->insert_or_assign(execution.pipeline.name, execution.buildTree);

        if (stage.type == "org.arbor.write") {
            auto path = execution.tree + "/" + stage.options.at("file").get<std::string>();
            createDirs(dirOf(path));
            writeFile(path, stage.options.value("content", ""));
        }

        else if (stage.type == "org.arbor.collect")
            for (auto & [name, dir] : execution.inputs)
                copyTree(dir, std::filesystem::path(execution.tree) / name);

        else if (stage.type == "org.arbor.fail") {
            someStageFailed = true;
            throw StageError(execution.identity(), 1 << 8, Strings{"it broke"}, nullptr, "stage failed");
        }

        else if (stage.type == "org.arbor.leak")
            return runThenTearDown(
                [&]() -> StageOutcome {
                    throw StageError(execution.identity(), 1 << 8, Strings{}, nullptr, "stage failed");
                },
                []() { throw SandboxError("cannot detach loop device"); });

        else if (stage.type == "org.arbor.gate") {
            for (int i = 0; i < 500 && !someStageFailed; ++i)
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        return StageOutcome{.metadata = {{"ran", stage.type}}};
    }

    size_t count()
    {
        return executed.lock()->size();
    }
};

class OrchestratorTest : public ::testing::Test
{
    std::unique_ptr<AutoDelete> delTmpDir;

protected:
    Path tmpDir;
    std::unique_ptr<ObjectStore> store;
    std::unique_ptr<SourceCache> sourceCache;
    SourceFetchers fetchers;
    MemoryStageRegistry registry;
    FakeStageExecutor executor;
    BuildOptions options;

    void SetUp() override
    {
        tmpDir = createTempDir();
        delTmpDir = std::make_unique<AutoDelete>(tmpDir, true);
        store = ObjectStore::open(tmpDir + "/store");
        sourceCache = std::make_unique<SourceCache>(store->sourcesDir());
        fetchers.add("org.osbuild.inline", makeInlineSourceFetcher());

        for (auto type : {"org.arbor.write", "org.arbor.collect", "org.arbor.fail", "org.arbor.gate", "org.arbor.leak"})
            registry.add(StageDescriptor(type, std::string("/usr/lib/arbor/stages/") + type));

        options.maxJobs = 4;
        options.retryPolicy = {.tries = 1, .baseRetryTimeMs = 1};
    }

    void TearDown() override
    {
        store.reset();
        delTmpDir.reset();
    }

    BuildResult build(std::string_view manifest)
    {
        auto resolved = resolveManifest(Manifest::parse(manifest), registry);
        Orchestrator orchestrator(*store, *sourceCache, fetchers, executor, options);
        return orchestrator.build(resolved);
    }

    const PipelineResult & result(const BuildResult & res, std::string_view name)
    {
        auto p = res.find(name);
        if (!p)
            throw Error("no result for pipeline '%s'", name);
        return *p;
    }
};

static const char * buildAndTree = R"({
    "version": "2",
    "pipelines": [
        {"name": "build", "stages": [{"type": "org.arbor.write", "options": {"file": "tools", "content": "gcc"}}]},
        {"name": "tree", "build": "name:build", "stages": [
            {"type": "org.arbor.write", "options": {"file": "a", "content": "first"}},
            {"type": "org.arbor.write", "options": {"file": "b", "content": "second"}}
        ]}
    ]
})";

TEST_F(OrchestratorTest, buildsPipelinesInDependencyOrder)
{
    auto res = build(buildAndTree);

    ASSERT_TRUE(res.success());
    ASSERT_EQ(res.pipelines.size(), 2u);

    auto & tree = result(res, "tree");
    ASSERT_EQ(tree.state, PipelineState::Done);
    ASSERT_EQ(tree.executedStages, 2u);
    ASSERT_EQ(tree.cachedStages, 0u);
    ASSERT_TRUE(tree.output);

    /* The first stage starts from the build pipeline's tree, and each
       later stage from the tree of the previous one. */
    ASSERT_EQ(readFile((tree.output->treePath / "tools").string()), "gcc");
    ASSERT_EQ(readFile((tree.output->treePath / "a").string()), "first");
    ASSERT_EQ(readFile((tree.output->treePath / "b").string()), "second");

    /* The build pipeline's entry is not touched by the stages after it. */
    auto buildTree = result(res, "build").output->treePath;
    ASSERT_FALSE(pathExists((buildTree / "a").string()));

    ASSERT_EQ(*executor.executed.lock(), (std::vector<std::string>{"build/0", "tree/0", "tree/1"}));

    auto buildOutput = result(res, "build").output;
    ASSERT_TRUE(buildOutput);
    ASSERT_EQ(executor.buildTrees.lock()->at("tree"), buildOutput->treePath.string());
    ASSERT_FALSE(executor.buildTrees.lock()->at("build"));
}

static const char * etcXAndY = R"({
    "version": "2",
    "pipelines": [
        {"name": "A", "stages": [{"type": "org.arbor.write", "options": {"file": "etc/x", "content": "1"}}]},
        {"name": "B", "build": "name:A", "stages": [{"type": "org.arbor.write", "options": {"file": "etc/y", "content": "2"}}]}
    ]
})";

TEST_F(OrchestratorTest, pipelineExtendsItsBuildPipeline)
{
    options.exports = {"B"};
    options.outputDirectory = tmpDir + "/out";

    auto res = build(etcXAndY);

    ASSERT_TRUE(res.success());
    ASSERT_EQ(readFile(tmpDir + "/out/B/etc/x"), "1");
    ASSERT_EQ(readFile(tmpDir + "/out/B/etc/y"), "2");

    auto a = result(res, "A").output;
    ASSERT_TRUE(a);
    ASSERT_FALSE(pathExists((a->treePath / "etc" / "y").string()));
}

TEST_F(OrchestratorTest, buildPipelineAloneIsCachedForLaterBuilds)
{
    options.outputDirectory = tmpDir + "/out";

    options.exports = {"A"};
    auto first = build(etcXAndY);
    ASSERT_TRUE(first.success());
    ASSERT_EQ(*executor.executed.lock(), std::vector<std::string>{"A/0"});
    ASSERT_EQ(result(first, "B").state, PipelineState::Skipped);

    deletePath(tmpDir + "/out");
    options.exports = {"B"};
    auto second = build(etcXAndY);
    ASSERT_TRUE(second.success());
    ASSERT_EQ(result(second, "A").cachedStages, 1u);
    ASSERT_EQ(result(second, "A").executedStages, 0u);
    ASSERT_EQ(result(second, "B").executedStages, 1u);
    ASSERT_EQ(*executor.executed.lock(), (std::vector<std::string>{"A/0", "B/0"}));
    ASSERT_EQ(readFile(tmpDir + "/out/B/etc/x"), "1");
    ASSERT_EQ(readFile(tmpDir + "/out/B/etc/y"), "2");
}

TEST_F(OrchestratorTest, committedEntriesCarryMetadata)
{
    auto res = build(buildAndTree);

    auto entry = store->lookup(*result(res, "tree").fingerprint);
    ASSERT_TRUE(entry);
    ASSERT_EQ(entry->metadata["pipeline"], "tree");
    ASSERT_EQ(entry->metadata["stage"], 1);
    ASSERT_EQ(entry->metadata["type"], "org.arbor.write");
    ASSERT_EQ(entry->metadata["metadata"]["ran"], "org.arbor.write");
    ASSERT_EQ(entry->metadata["fingerprint"], *result(res, "tree").fingerprint);
}

TEST_F(OrchestratorTest, secondBuildIsServedFromTheStore)
{
    build(buildAndTree);
    ASSERT_EQ(executor.count(), 3u);

    auto res = build(buildAndTree);

    ASSERT_TRUE(res.success());
    ASSERT_EQ(executor.count(), 3u);

    auto & tree = result(res, "tree");
    ASSERT_EQ(tree.state, PipelineState::Done);
    ASSERT_EQ(tree.cachedStages, 2u);
    ASSERT_EQ(tree.executedStages, 0u);
    ASSERT_EQ(readFile((tree.output->treePath / "b").string()), "second");
}

TEST_F(OrchestratorTest, cachedPipelinesReportDone)
{
    build(buildAndTree);

    std::vector<json> records;
    std::unique_ptr<Logger> capture = makeJSONLogger([&](const json & j) { records.push_back(j); });
    std::swap(logger, capture);
    BuildResult res;
    {
        Finally restoreLogger([&]() { std::swap(logger, capture); });
        res = build(buildAndTree);
    }

    ASSERT_EQ(result(res, "tree").executedStages, 0u);

    std::map<std::string, std::string> statuses;
    for (auto & r : records)
        if (r["action"] == "result" && r["type"] == resPipelineStatus)
            statuses[r["fields"][0]] = r["fields"][1];

    ASSERT_EQ(statuses, (std::map<std::string, std::string>{{"build", "done"}, {"tree", "done"}}));
}

TEST_F(OrchestratorTest, onlyChangedStagesRun)
{
    build(buildAndTree);

    auto modified = std::string(buildAndTree);
    modified.replace(modified.find("second"), 6, "SECOND");

    auto res = build(modified);

    auto & tree = result(res, "tree");
    ASSERT_EQ(tree.cachedStages, 1u);
    ASSERT_EQ(tree.executedStages, 1u);
    ASSERT_EQ(executor.executed.lock()->back(), "tree/1");
    ASSERT_EQ(readFile((tree.output->treePath / "a").string()), "first");
    ASSERT_EQ(readFile((tree.output->treePath / "b").string()), "SECOND");
}

TEST_F(OrchestratorTest, identicalStagesAreBuiltOnce)
{
    auto res = build(R"({
        "version": "2",
        "pipelines": [
            {"name": "x", "stages": [{"type": "org.arbor.write", "options": {"file": "same"}}]},
            {"name": "y", "stages": [{"type": "org.arbor.write", "options": {"file": "same"}}]},
            {"name": "z", "stages": [{"type": "org.arbor.write", "options": {"file": "same"}}]}
        ]
    })");

    ASSERT_TRUE(res.success());
    ASSERT_EQ(executor.count(), 1u);

    size_t executed = 0, cached = 0;
    for (auto & p : res.pipelines) {
        ASSERT_EQ(p.state, PipelineState::Done);
        executed += p.executedStages;
        cached += p.cachedStages;
    }
    ASSERT_EQ(executed, 1u);
    ASSERT_EQ(cached, 2u);
}

TEST_F(OrchestratorTest, failureSkipsDependentsOnly)
{
    auto res = build(R"({
        "version": "2",
        "pipelines": [
            {"name": "broken", "stages": [{"type": "org.arbor.fail"}]},
            {"name": "after", "build": "name:broken", "stages": [{"type": "org.arbor.write", "options": {"file": "a"}}]},
            {"name": "other", "stages": [{"type": "org.arbor.write", "options": {"file": "b"}}]}
        ]
    })");

    ASSERT_FALSE(res.success());

    auto & broken = result(res, "broken");
    ASSERT_EQ(broken.state, PipelineState::Failed);
    ASSERT_TRUE(broken.error);
    ASSERT_FALSE(broken.output);

    ASSERT_EQ(result(res, "after").state, PipelineState::Skipped);
    ASSERT_EQ(result(res, "other").state, PipelineState::Done);

    /* Nothing was committed for the failed stage. */
    ASSERT_FALSE(store->lookup(*broken.fingerprint));

    auto doc = res.toJSON();
    ASSERT_EQ(doc["success"], false);
    ASSERT_EQ(doc["pipelines"][0]["state"], "failed");
    ASSERT_EQ(doc["pipelines"][1]["state"], "skipped");
}

TEST_F(OrchestratorTest, teardownFailureAbortsTheBuild)
{
    ASSERT_THROW(
        build(R"({
            "version": "2",
            "pipelines": [
                {"name": "leaky", "stages": [{"type": "org.arbor.leak"}]},
                {"name": "other", "build": "name:leaky", "stages": [{"type": "org.arbor.write", "options": {"file": "a"}}]}
            ]
        })"),
        SandboxError);

    ASSERT_EQ(*executor.executed.lock(), std::vector<std::string>{"leaky/0"});
}

TEST_F(OrchestratorTest, failFastStartsNoNewPipelines)
{
    options.failFast = true;

    auto res = build(R"({
        "version": "2",
        "pipelines": [
            {"name": "broken", "stages": [{"type": "org.arbor.fail"}]},
            {"name": "gate", "stages": [{"type": "org.arbor.gate"}]},
            {"name": "later", "build": "name:gate", "stages": [{"type": "org.arbor.write", "options": {"file": "a"}}]}
        ]
    })");

    ASSERT_EQ(result(res, "broken").state, PipelineState::Failed);
    /* Work already in flight completes. */
    ASSERT_EQ(result(res, "gate").state, PipelineState::Done);
    ASSERT_EQ(result(res, "later").state, PipelineState::Skipped);
}

TEST_F(OrchestratorTest, inputsArePassedToStages)
{
    auto res = build(R"({
        "version": "2",
        "pipelines": [
            {"name": "tree", "stages": [{"type": "org.arbor.write", "options": {"file": "etc", "content": "config"}}]},
            {"name": "image", "stages": [{
                "type": "org.arbor.collect",
                "inputs": {
                    "root": {"type": "org.osbuild.tree", "origin": "org.osbuild.pipeline", "references": ["name:tree"]},
                    "files": {"type": "org.osbuild.files", "origin": "org.osbuild.source",
                              "references": ["sha256:2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824"]}
                }
            }]}
        ],
        "sources": {
            "org.osbuild.inline": {
                "items": {
                    "sha256:2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824": {
                        "encoding": "base64", "data": "aGVsbG8="
                    }
                }
            }
        }
    })");

    ASSERT_TRUE(res.success());

    auto image = result(res, "image").output;
    ASSERT_TRUE(image);
    ASSERT_EQ(readFile((image->treePath / "root" / "etc").string()), "config");
    ASSERT_EQ(readFile((image->treePath / "files" / helloChecksum).string()), "hello");

    ASSERT_TRUE(sourceCache->lookup(Hash::parsePrefixed(helloChecksum)));

    auto entry = store->lookup(*result(res, "image").fingerprint);
    ASSERT_EQ(entry->metadata["inputs"]["root"][0], "name:tree");
    ASSERT_EQ(entry->metadata["inputs"]["files"][0], helloChecksum);
}

TEST_F(OrchestratorTest, unavailableSourceFailsItsPipeline)
{
    /* The data is "world", which does not match the checksum. */
    auto res = build(R"({
        "version": "2",
        "pipelines": [
            {"name": "tree", "stages": [{
                "type": "org.arbor.collect",
                "inputs": {"files": {"type": "org.osbuild.files", "origin": "org.osbuild.source",
                                     "references": ["sha256:2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824"]}}
            }]},
            {"name": "image", "build": "name:tree", "stages": [{"type": "org.arbor.write", "options": {"file": "a"}}]},
            {"name": "other", "stages": [{"type": "org.arbor.write", "options": {"file": "b"}}]}
        ],
        "sources": {
            "org.osbuild.inline": {
                "items": {
                    "sha256:2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824": {
                        "encoding": "base64", "data": "d29ybGQ="
                    }
                }
            }
        }
    })");

    ASSERT_FALSE(res.success());

    auto & tree = result(res, "tree");
    ASSERT_EQ(tree.state, PipelineState::Failed);
    ASSERT_NE(tree.error->find(helloChecksum), std::string::npos);

    ASSERT_EQ(result(res, "image").state, PipelineState::Skipped);
    ASSERT_EQ(result(res, "other").state, PipelineState::Done);
    ASSERT_EQ(*executor.executed.lock(), std::vector<std::string>{"other/0"});
}

TEST_F(OrchestratorTest, emptyPipelineForwardsItsBuildPipeline)
{
    auto res = build(R"({
        "version": "2",
        "pipelines": [
            {"name": "build", "stages": [{"type": "org.arbor.write", "options": {"file": "tools"}}]},
            {"name": "alias", "build": "name:build"},
            {"name": "nothing"}
        ]
    })");

    ASSERT_TRUE(res.success());

    auto & alias = result(res, "alias");
    ASSERT_EQ(alias.state, PipelineState::Done);
    ASSERT_EQ(alias.output->treePath, result(res, "build").output->treePath);

    auto & nothing = result(res, "nothing");
    ASSERT_EQ(nothing.state, PipelineState::Done);
    ASSERT_FALSE(nothing.output);
    ASSERT_FALSE(nothing.fingerprint);
}

TEST_F(OrchestratorTest, exportsCopySelectedPipelines)
{
    options.exports = {"tree", "empty"};
    options.outputDirectory = tmpDir + "/out";

    auto res = build(R"({
        "version": "2",
        "pipelines": [
            {"name": "build", "stages": [{"type": "org.arbor.write", "options": {"file": "tools"}}]},
            {"name": "tree", "build": "name:build", "stages": [{"type": "org.arbor.write", "options": {"file": "a", "content": "x"}}]},
            {"name": "empty"},
            {"name": "unrelated", "stages": [{"type": "org.arbor.write", "options": {"file": "u"}}]}
        ]
    })");

    ASSERT_TRUE(res.success());

    ASSERT_EQ(readFile(tmpDir + "/out/tree/a"), "x");
    ASSERT_TRUE(std::filesystem::is_empty(tmpDir + "/out/empty"));
    ASSERT_FALSE(pathExists(tmpDir + "/out/build"));

    /* Only what the exports need is built. */
    ASSERT_EQ(result(res, "build").state, PipelineState::Done);
    ASSERT_EQ(result(res, "unrelated").state, PipelineState::Skipped);
    ASSERT_EQ(executor.count(), 2u);
}

TEST_F(OrchestratorTest, failedExportIsReported)
{
    options.exports = {"broken"};
    options.outputDirectory = tmpDir + "/out";

    auto res = build(R"({"version": "2", "pipelines": [{"name": "broken", "stages": [{"type": "org.arbor.fail"}]}]})");

    ASSERT_FALSE(res.success());
    ASSERT_FALSE(pathExists(tmpDir + "/out/broken"));
}

TEST_F(OrchestratorTest, exportErrors)
{
    options.exports = {"tree"};
    ASSERT_THROW(build(buildAndTree), UsageError);

    options.outputDirectory = tmpDir + "/out";
    options.exports = {"missing"};
    ASSERT_THROW(build(buildAndTree), ManifestError);
}

TEST(BuildResult, json)
{
    BuildResult res{
        .pipelines = {
            PipelineResult{.name = "a", .state = PipelineState::Done, .fingerprint = "f00", .executedStages = 1},
            PipelineResult{.name = "b", .state = PipelineState::Skipped},
        }};

    ASSERT_TRUE(res.success());
    ASSERT_EQ(res.find("c"), nullptr);

    auto doc = res.toJSON();
    ASSERT_EQ(doc["success"], true);
    ASSERT_EQ(doc["pipelines"][0]["state"], "done");
    ASSERT_EQ(doc["pipelines"][0]["fingerprint"], "f00");
    ASSERT_EQ(doc["pipelines"][0]["executed-stages"], 1);
    ASSERT_TRUE(doc["pipelines"][1]["fingerprint"].is_null());
    ASSERT_FALSE(doc["pipelines"][1].contains("tree"));
}

} // namespace arbor
