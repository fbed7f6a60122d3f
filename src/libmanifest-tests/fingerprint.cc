#include <gtest/gtest.h>

#include "arbor/manifest/fingerprint.hh"

namespace arbor {

using nlohmann::json;

class ResolveTest : public ::testing::Test
{
protected:
    MemoryStageRegistry registry;

    void SetUp() override
    {
        registry.add(StageDescriptor("org.osbuild.noop", "/usr/lib/arbor/stages/org.osbuild.noop"));
        registry.add(StageDescriptor("org.osbuild.copy", "/usr/lib/arbor/stages/org.osbuild.copy"));
        registry.add(StageDescriptor(
            "org.osbuild.mkdir",
            "/usr/lib/arbor/stages/org.osbuild.mkdir",
            json::parse(R"({
                "summary": "Create directories",
                "schema": {
                    "type": "object",
                    "additionalProperties": false,
                    "required": ["paths"],
                    "properties": {
                        "paths": {"type": "array", "items": {"type": "string"}}
                    }
                }
            })")));
    }

    ResolvedManifest resolve(std::string_view text)
    {
        return resolveManifest(Manifest::parse(text), registry);
    }

    std::string stageId(const ResolvedManifest & resolved, std::string_view pipeline, size_t stage)
    {
        return resolved.stageFingerprints[*resolved.indexOf(pipeline)][stage].to_string();
    }
};

static const char * twoPipelines = R"({
    "version": "2",
    "pipelines": [
        {"name": "build", "stages": [{"type": "org.osbuild.mkdir", "options": {"paths": ["/usr"]}}]},
        {"name": "tree", "build": "name:build", "stages": [
            {"type": "org.osbuild.noop", "options": {"a": 1, "b": 2}},
            {"type": "org.osbuild.noop", "options": {"a": 1, "b": 2}}
        ]},
        {"name": "other", "stages": [{"type": "org.osbuild.noop"}]}
    ]
})";

TEST_F(ResolveTest, fingerprintsAreHex)
{
    auto resolved = resolve(twoPipelines);

    auto id = stageId(resolved, "tree", 0);
    ASSERT_EQ(id.size(), 64u);
    ASSERT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos);
    ASSERT_EQ(Fingerprint::parse(id).to_string(), id);
}

TEST_F(ResolveTest, fingerprintsAreDeterministic)
{
    auto a = resolve(twoPipelines);
    auto b = resolve(twoPipelines);

    ASSERT_EQ(a.stageFingerprints, b.stageFingerprints);
    ASSERT_EQ(a.pipelineFingerprints, b.pipelineFingerprints);
}

TEST_F(ResolveTest, optionKeyOrderDoesNotMatter)
{
    auto a = resolve(R"({"version": "2", "pipelines": [{"name": "tree", "stages": [
        {"type": "org.osbuild.noop", "options": {"a": 1, "b": {"x": true, "y": false}}}]}]})");
    auto b = resolve(R"({"version": "2", "pipelines": [{"name": "tree", "stages": [
        {"type": "org.osbuild.noop", "options": {"b": {"y": false, "x": true}, "a": 1}}]}]})");

    ASSERT_EQ(stageId(a, "tree", 0), stageId(b, "tree", 0));
}

TEST_F(ResolveTest, identicalStagesChainToDifferentFingerprints)
{
    auto resolved = resolve(twoPipelines);

    ASSERT_NE(stageId(resolved, "tree", 0), stageId(resolved, "tree", 1));
    ASSERT_EQ(resolved.pipelineFingerprints[*resolved.indexOf("tree")]->to_string(), stageId(resolved, "tree", 1));
}

TEST_F(ResolveTest, changesPropagateToDependents)
{
    auto a = resolve(twoPipelines);

    auto modified = std::string(twoPipelines);
    modified.replace(modified.find("/usr"), 4, "/var");
    auto b = resolve(modified);

    ASSERT_NE(stageId(a, "build", 0), stageId(b, "build", 0));
    ASSERT_NE(stageId(a, "tree", 0), stageId(b, "tree", 0));
    ASSERT_NE(stageId(a, "tree", 1), stageId(b, "tree", 1));

    /* Unrelated pipelines keep their fingerprints. */
    ASSERT_EQ(stageId(a, "other", 0), stageId(b, "other", 0));
}

TEST_F(ResolveTest, pipelineNameDoesNotMatter)
{
    auto a = resolve(R"({"version": "2", "pipelines": [{"name": "one", "stages": [{"type": "org.osbuild.noop"}]}]})");
    auto b = resolve(R"({"version": "2", "pipelines": [{"name": "two", "stages": [{"type": "org.osbuild.noop"}]}]})");

    ASSERT_EQ(stageId(a, "one", 0), stageId(b, "two", 0));
}

TEST_F(ResolveTest, runnerAndEpochAreCoveredByTheFingerprint)
{
    auto plain = resolve(R"({"version": "2", "pipelines": [{"name": "tree", "stages": [{"type": "org.osbuild.noop"}]}]})");
    auto runner = resolve(R"({"version": "2", "pipelines": [
        {"name": "tree", "runner": "org.osbuild.linux", "stages": [{"type": "org.osbuild.noop"}]}]})");
    auto epoch = resolve(R"({"version": "2", "pipelines": [
        {"name": "tree", "source-epoch": 0, "stages": [{"type": "org.osbuild.noop"}]}]})");

    ASSERT_NE(stageId(plain, "tree", 0), stageId(runner, "tree", 0));
    ASSERT_NE(stageId(plain, "tree", 0), stageId(epoch, "tree", 0));
}

TEST_F(ResolveTest, pipelineInputsChainInTheirFingerprint)
{
    auto text = R"({
        "version": "2",
        "pipelines": [
            {"name": "tree", "stages": [{"type": "org.osbuild.mkdir", "options": {"paths": ["/etc"]}}]},
            {"name": "image", "stages": [{
                "type": "org.osbuild.copy",
                "inputs": {"tree": {"type": "org.osbuild.tree", "origin": "org.osbuild.pipeline", "references": ["name:tree"]}}
            }]}
        ]
    })";
    auto a = resolve(text);

    auto modified = std::string(text);
    modified.replace(modified.find("/etc"), 4, "/opt");
    auto b = resolve(modified);

    ASSERT_NE(stageId(a, "image", 0), stageId(b, "image", 0));
}

TEST_F(ResolveTest, emptyPipelineHasNoFingerprint)
{
    auto resolved = resolve(R"({
        "version": "2",
        "pipelines": [
            {"name": "empty"},
            {"name": "image", "stages": [{
                "type": "org.osbuild.copy",
                "inputs": {"tree": {"type": "org.osbuild.tree", "origin": "org.osbuild.pipeline", "references": ["name:empty"]}}
            }]}
        ]
    })");

    ASSERT_FALSE(resolved.pipelineFingerprints[*resolved.indexOf("empty")]);
    ASSERT_TRUE(resolved.pipelineFingerprints[*resolved.indexOf("image")]);
}

TEST_F(ResolveTest, sourceReferencesMustBeDeclared)
{
    auto stage = R"("stages": [{
        "type": "org.osbuild.copy",
        "inputs": {"files": {"type": "org.osbuild.files", "origin": "org.osbuild.source",
                             "references": ["sha256:2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824"]}}
    }])";

    ASSERT_THROW(
        resolve(fmt(R"({"version": "2", "pipelines": [{"name": "tree", %s}]})", stage)), ManifestError);

    ASSERT_NO_THROW(resolve(fmt(
        R"({"version": "2", "pipelines": [{"name": "tree", %s}], "sources": {"org.osbuild.curl": {"items": {
            "sha256:2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824": "https://example.com/hello"}}}})",
        stage)));
}

TEST_F(ResolveTest, unknownStageTypeIsRejected)
{
    ASSERT_THROW(
        resolve(R"({"version": "2", "pipelines": [{"name": "tree", "stages": [{"type": "org.osbuild.fly"}]}]})"),
        ManifestError);
}

TEST_F(ResolveTest, optionsAreValidatedAgainstTheSchema)
{
    ASSERT_NO_THROW(resolve(R"({"version": "2", "pipelines": [{"name": "tree", "stages": [
        {"type": "org.osbuild.mkdir", "options": {"paths": ["/a", "/b"]}}]}]})"));

    ASSERT_THROW(
        resolve(R"({"version": "2", "pipelines": [{"name": "tree", "stages": [
            {"type": "org.osbuild.mkdir", "options": {"paths": [1]}}]}]})"),
        ManifestError);

    ASSERT_THROW(
        resolve(R"({"version": "2", "pipelines": [{"name": "tree", "stages": [
            {"type": "org.osbuild.mkdir", "options": {}}]}]})"),
        ManifestError);

    ASSERT_THROW(
        resolve(R"({"version": "2", "pipelines": [{"name": "tree", "stages": [
            {"type": "org.osbuild.mkdir", "options": {"paths": [], "mode": "0755"}}]}]})"),
        ManifestError);
}

TEST_F(ResolveTest, validationErrorsNameTheStage)
{
    try {
        resolve(R"({"version": "2", "pipelines": [{"name": "tree", "stages": [
            {"type": "org.osbuild.noop"},
            {"type": "org.osbuild.mkdir", "options": {"paths": "/a"}}]}]})");
        FAIL() << "manifest should have been rejected";
    } catch (ManifestError & e) {
        auto msg = e.message();
        ASSERT_NE(msg.find("tree"), std::string::npos);
        ASSERT_NE(msg.find("org.osbuild.mkdir"), std::string::npos);
    }
}

TEST_F(ResolveTest, inspectDescribesTheResolvedManifest)
{
    auto resolved = resolve(twoPipelines);

    auto doc = resolved.inspect();

    ASSERT_EQ(doc["version"], "2");
    ASSERT_EQ(doc["pipelines"].size(), 3u);

    auto & tree = doc["pipelines"][1];
    ASSERT_EQ(tree["name"], "tree");
    ASSERT_EQ(tree["build"], "name:build");
    ASSERT_EQ(tree["id"], stageId(resolved, "tree", 1));
    ASSERT_EQ(tree["stages"][0]["id"], stageId(resolved, "tree", 0));
    ASSERT_EQ(tree["stages"][0]["options"]["b"], 2);
}

TEST_F(ResolveTest, inspectOutputResolvesToTheSameFingerprints)
{
    auto resolved = resolve(twoPipelines);

    auto again = resolveManifest(Manifest::fromJSON(resolved.inspect()), registry);

    ASSERT_EQ(resolved.stageFingerprints, again.stageFingerprints);
}

TEST(computeFingerprint, canonicalForm)
{
    auto a = computeFingerprint(json::parse(R"({"type": "org.osbuild.noop", "options": {}})"));
    auto b = computeFingerprint(json::parse(R"({"options": {}, "type": "org.osbuild.noop"})"));
    auto c = computeFingerprint(json::parse(R"({"options": {}, "type": "org.osbuild.copy"})"));

    ASSERT_EQ(a, b);
    ASSERT_NE(a, c);
}

} // namespace arbor
