#include <gtest/gtest.h>

#include "arbor/manifest/stage-registry.hh"
#include "arbor/manifest/manifest.hh"
#include "arbor/util/file-system.hh"

namespace arbor {

using nlohmann::json;

class FileStageRegistryTest : public ::testing::Test
{
    std::unique_ptr<AutoDelete> delTmpDir;

protected:
    Path libDir;

    void SetUp() override
    {
        libDir = createTempDir();
        delTmpDir = std::make_unique<AutoDelete>(libDir, true);
        createDirs(libDir + "/stages");

        writeFile(libDir + "/stages/org.osbuild.mkdir", "#!/bin/sh\n", 0755);
        writeFile(
            libDir + "/stages/org.osbuild.mkdir.meta.json",
            R"({
                "summary": "Create directories",
                "capabilities": ["CAP_MAC_ADMIN"],
                "schema": {
                    "type": "object",
                    "additionalProperties": false,
                    "properties": {"paths": {"type": "array", "items": {"type": "string"}}}
                }
            })");

        writeFile(libDir + "/stages/org.osbuild.noop", "#!/bin/sh\n", 0755);
    }

    void TearDown() override
    {
        delTmpDir.reset();
    }
};

TEST_F(FileStageRegistryTest, findsInstalledStages)
{
    FileStageRegistry registry(libDir);

    auto mkdir = registry.lookup("org.osbuild.mkdir");
    ASSERT_EQ(mkdir->type, "org.osbuild.mkdir");
    ASSERT_EQ(mkdir->program, libDir + "/stages/org.osbuild.mkdir");
    ASSERT_EQ(mkdir->summary, "Create directories");
    ASSERT_EQ(mkdir->capabilities, StringSet{"CAP_MAC_ADMIN"});
    ASSERT_TRUE(mkdir->schema);

    ASSERT_NO_THROW(mkdir->validateOptions(json{{"paths", json::array({"/usr"})}}));
    ASSERT_THROW(mkdir->validateOptions(json{{"paths", "/usr"}}), ManifestError);
    ASSERT_THROW(mkdir->validateOptions(json{{"mode", 493}}), ManifestError);
}

TEST_F(FileStageRegistryTest, descriptorIsOptional)
{
    FileStageRegistry registry(libDir);

    auto noop = registry.lookup("org.osbuild.noop");
    ASSERT_FALSE(noop->schema);
    ASSERT_TRUE(noop->capabilities.empty());
    ASSERT_NO_THROW(noop->validateOptions(json{{"anything", true}}));
}

TEST_F(FileStageRegistryTest, unknownStage)
{
    FileStageRegistry registry(libDir);

    ASSERT_THROW(registry.lookup("org.osbuild.fly"), ManifestError);
}

TEST_F(FileStageRegistryTest, stageMustBeExecutable)
{
    writeFile(libDir + "/stages/org.osbuild.plain", "#!/bin/sh\n", 0644);

    FileStageRegistry registry(libDir);

    ASSERT_THROW(registry.lookup("org.osbuild.plain"), ManifestError);
}

TEST_F(FileStageRegistryTest, typesCannotEscapeTheStagesDir)
{
    writeFile(libDir + "/evil", "#!/bin/sh\n", 0755);

    FileStageRegistry registry(libDir);

    ASSERT_THROW(registry.lookup("../evil"), ManifestError);
    ASSERT_THROW(registry.lookup(".hidden"), ManifestError);
    ASSERT_THROW(registry.lookup(""), ManifestError);
}

TEST_F(FileStageRegistryTest, brokenDescriptors)
{
    writeFile(libDir + "/stages/org.osbuild.broken", "#!/bin/sh\n", 0755);
    writeFile(libDir + "/stages/org.osbuild.broken.meta.json", "{ not json");

    writeFile(libDir + "/stages/org.osbuild.wrong", "#!/bin/sh\n", 0755);
    writeFile(libDir + "/stages/org.osbuild.wrong.meta.json", R"({"capabilities": "CAP_CHOWN"})");

    FileStageRegistry registry(libDir);

    ASSERT_THROW(registry.lookup("org.osbuild.broken"), ManifestError);
    ASSERT_THROW(registry.lookup("org.osbuild.wrong"), ManifestError);
}

TEST_F(FileStageRegistryTest, lookupsAreCached)
{
    FileStageRegistry registry(libDir);

    auto first = registry.lookup("org.osbuild.mkdir");

    deletePath(libDir + "/stages/org.osbuild.mkdir");

    auto second = registry.lookup("org.osbuild.mkdir");
    ASSERT_EQ(first.get(), second.get());
}

TEST(MemoryStageRegistry, addAndLookup)
{
    MemoryStageRegistry registry;
    registry.add(StageDescriptor("org.osbuild.noop", "/usr/lib/arbor/stages/org.osbuild.noop"));

    ASSERT_EQ(registry.lookup("org.osbuild.noop")->program, "/usr/lib/arbor/stages/org.osbuild.noop");
    ASSERT_THROW(registry.lookup("org.osbuild.copy"), ManifestError);
}

TEST(StageDescriptor, unresolvableSchemaIsRejected)
{
    ASSERT_THROW(
        StageDescriptor("org.osbuild.bad", "/bin/false", json{{"schema", {{"$ref", "#/definitions/missing"}}}}),
        ManifestError);
}

} // namespace arbor
