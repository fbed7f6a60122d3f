#include <gtest/gtest.h>

#include "arbor/store/build/sandbox.hh"
#include "arbor/store/build/stage-runner.hh"
#include "arbor/util/file-system.hh"
#include "arbor/util/linux-namespaces.hh"

#include <unistd.h>

namespace arbor {

/**
 * Whether this host can create build roots: root or unprivileged user
 * namespaces, plus mount and PID namespaces.
 */
static bool canSandbox()
{
    return (geteuid() == 0 || userNamespacesSupported()) && mountAndPidNamespacesSupported();
}

class SandboxTest : public ::testing::Test
{
    std::unique_ptr<AutoDelete> delTmpDir;

protected:
    Path tmpDir;
    BuildRootConfig config;

    void SetUp() override
    {
        if (!canSandbox())
            GTEST_SKIP() << "this host has no user, mount or PID namespaces";

        tmpDir = createTempDir();
        delTmpDir = std::make_unique<AutoDelete>(tmpDir, true);

        config.hostPaths = {"/usr", "/bin", "/sbin", "/lib", "/lib64", "/etc"};
        config.tree = tmpDir + "/tree";
        config.libDir = tmpDir + "/lib";
        config.tempDir = tmpDir + "/tmp";
        config.capabilities = {"CAP_CHOWN", "CAP_DAC_OVERRIDE", "CAP_FOWNER"};
        createDirs(config.tree);
        createDirs(config.libDir + "/stages");
        createDirs(config.tempDir);
    }

    void TearDown() override
    {
        delTmpDir.reset();
    }

    StageRunRequest stage(const std::string & script)
    {
        auto program = config.libDir + "/stages/org.arbor.test";
        writeFile(program, "#!/bin/sh\n" + script, 0755);

        StageRunRequest request;
        request.stage = {.pipeline = "tree", .index = 0, .type = "org.arbor.test", .fingerprint = "f00"};
        request.program = program;
        return request;
    }
};

TEST_F(SandboxTest, stageWritesOnlyToItsTree)
{
    auto request = stage(
        "touch /run/arbor/tree/hello\n"
        "if touch /usr/arbor-escape 2>/dev/null; then exit 1; fi\n"
        "hostname > /run/arbor/tree/hostname\n");

    BuildRoot root(config);
    runStage(root, request);
    root.teardown();

    ASSERT_TRUE(pathExists(config.tree + "/hello"));
    ASSERT_EQ(readFile(config.tree + "/hostname"), "localhost\n");
    ASSERT_FALSE(pathExists("/usr/arbor-escape"));
}

TEST_F(SandboxTest, stageRunsAsPid1InItsOwnNamespace)
{
    auto request = stage("echo $$ > /run/arbor/tree/pid\n");

    BuildRoot root(config);
    runStage(root, request);
    root.teardown();

    ASSERT_EQ(readFile(config.tree + "/pid"), "1\n");
}

TEST_F(SandboxTest, programsOutsideTheLibDirAreRefused)
{
    BuildRoot root(config);

    ASSERT_THROW(root.programPath("/bin/sh"), SandboxError);
    ASSERT_EQ(root.programPath(config.libDir + "/stages/org.arbor.test"), "/run/arbor/lib/stages/org.arbor.test");
}

TEST_F(SandboxTest, devicesNeedRoot)
{
    if (geteuid() == 0)
        GTEST_SKIP() << "running as root";

    config.devices.push_back({.name = "disk", .type = "org.osbuild.loopback", .options = {{"filename", "disk.img"}}});

    ASSERT_THROW(BuildRoot root(config), SandboxError);
}

} // namespace arbor
