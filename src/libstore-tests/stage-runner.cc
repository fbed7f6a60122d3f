#include <gtest/gtest.h>

#include "arbor/store/build/stage-runner.hh"
#include "arbor/util/file-system.hh"

#include <algorithm>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace arbor {

using nlohmann::json;

/**
 * Runs stages as plain child processes, without isolation. The tree
 * and inputs are host directories.
 */
class ProcessStageHost : public StageHost
{
public:
    Path tree;
    Path inputs;

    Path treePath() const override
    {
        return tree;
    }

    Path inputsDir() const override
    {
        return inputs;
    }

    Path devicesDir() const override
    {
        return "/dev";
    }

    Path mountsDir() const override
    {
        return tree + "/mounts";
    }

    Path programPath(const Path & hostProgram) const override
    {
        return hostProgram;
    }

    std::map<std::string, Path> devicePaths() const override
    {
        return {};
    }

    std::map<std::string, Path> mountPaths() const override
    {
        return {};
    }

    Pid start(StageCommand && command, Descriptor outputReadSide) override
    {
        Strings envStrings;
        for (auto & [name, value] : command.env)
            envStrings.push_back(name + "=" + value);

        Strings args(command.args);
        args.push_front(command.program);

        std::vector<char *> argv, envp;
        for (auto & s : args)
            argv.push_back((char *) s.c_str());
        argv.push_back(nullptr);
        for (auto & s : envStrings)
            envp.push_back((char *) s.c_str());
        envp.push_back(nullptr);

        Pid pid = startProcess([&]() {
            if (dup2(command.stdinFd.get(), STDIN_FILENO) == -1 || dup2(command.outputFd.get(), STDOUT_FILENO) == -1
                || dup2(command.outputFd.get(), STDERR_FILENO) == -1)
                throw SysError("redirecting stage streams");
            if (command.apiFd.get() == 3) {
                if (fcntl(3, F_SETFD, 0) == -1)
                    throw SysError("clearing FD_CLOEXEC");
            } else if (dup2(command.apiFd.get(), 3) == -1)
                throw SysError("setting up the API channel");
            unix::closeExtraFDs({3});
            if (chdir(tree.c_str()) == -1)
                throw SysError("changing into '%s'", tree);
            execve(command.program.c_str(), argv.data(), envp.data());
            throw SysError("executing '%s'", command.program);
        });

        command.stdinFd.close();
        command.outputFd.close();
        command.apiFd.close();

        return pid;
    }
};

class StageRunnerTest : public ::testing::Test
{
    std::unique_ptr<AutoDelete> delTmpDir;

protected:
    Path tmpDir;
    ProcessStageHost host;

    void SetUp() override
    {
        tmpDir = createTempDir();
        delTmpDir = std::make_unique<AutoDelete>(tmpDir, true);
        host.tree = tmpDir + "/tree";
        host.inputs = tmpDir + "/inputs";
        createDirs(host.tree);
        createDirs(host.inputs);
    }

    void TearDown() override
    {
        delTmpDir.reset();
    }

    StageRunRequest stage(const std::string & script)
    {
        auto program = tmpDir + "/stage";
        writeFile(program, "#!/bin/sh\n" + script, 0755);

        StageRunRequest request;
        request.stage = {.pipeline = "tree", .index = 0, .type = "org.arbor.test", .fingerprint = "f00"};
        request.program = program;
        return request;
    }
};

TEST_F(StageRunnerTest, argumentsDocument)
{
    auto request = stage("");
    request.options = {{"packages", json::array({"bash"})}};
    request.inputs["rpms"] = json{{"files", json::object()}};

    auto args = stageArguments(host, request);

    ASSERT_EQ(args["tree"], host.tree);
    ASSERT_EQ(args["options"]["packages"][0], "bash");
    ASSERT_EQ(args["inputs"]["rpms"]["path"], host.inputs + "/rpms");
    ASSERT_EQ(args["inputs"]["rpms"]["data"]["files"], json::object());
    ASSERT_EQ(args["paths"]["devices"], "/dev");
    ASSERT_EQ(args["meta"]["id"], "f00");
    ASSERT_TRUE(args["devices"].empty());
    ASSERT_TRUE(args["mounts"].empty());
}

TEST_F(StageRunnerTest, environment)
{
    auto request = stage("");

    auto env = stageEnvironment(host, request);
    ASSERT_EQ(env["ARBOR_API_FD"], "3");
    ASSERT_EQ(env["HOME"], host.tree);
    ASSERT_EQ(env.count("SOURCE_DATE_EPOCH"), 0u);

    request.sourceEpoch = 1700000000;
    env = stageEnvironment(host, request);
    ASSERT_EQ(env["SOURCE_DATE_EPOCH"], "1700000000");
}

TEST_F(StageRunnerTest, stageReceivesItsArgumentsOnStdin)
{
    auto request = stage("cat > \"$HOME/args.json\"\n");
    request.options = {{"greeting", "hello"}};

    runStage(host, request);

    auto args = json::parse(readFile(host.tree + "/args.json"));
    ASSERT_EQ(args["options"]["greeting"], "hello");
    ASSERT_EQ(args["tree"], host.tree);
}

TEST_F(StageRunnerTest, outputAndMetadataAreCollected)
{
    auto request = stage(
        "echo 'hello from the stage'\n"
        "echo 'to stderr' >&2\n"
        "echo '{\"type\": \"metadata\", \"data\": {\"answer\": 42}}' >&3\n"
        "echo '{\"type\": \"log\", \"data\": \"through the API\"}' >&3\n");

    auto outcome = runStage(host, request);

    ASSERT_EQ(outcome.metadata["answer"], 42);
    ASSERT_EQ(outcome.logTail.size(), 3u);
    ASSERT_NE(std::find(outcome.logTail.begin(), outcome.logTail.end(), "hello from the stage"), outcome.logTail.end());
    ASSERT_NE(std::find(outcome.logTail.begin(), outcome.logTail.end(), "to stderr"), outcome.logTail.end());
    ASSERT_NE(std::find(outcome.logTail.begin(), outcome.logTail.end(), "through the API"), outcome.logTail.end());
}

TEST_F(StageRunnerTest, logTailIsBounded)
{
    auto request = stage("for i in 1 2 3 4 5 6 7 8 9 10; do echo line $i; done\n");
    request.maxLogLines = 3;

    auto outcome = runStage(host, request);

    ASSERT_EQ(outcome.logTail, (Strings{"line 8", "line 9", "line 10"}));
}

TEST_F(StageRunnerTest, nonZeroExitIsStageError)
{
    auto request = stage("echo 'something broke'\nexit 3\n");

    try {
        runStage(host, request);
        FAIL() << "stage should have failed";
    } catch (StageError & e) {
        ASSERT_EQ(e.stage.pipeline, "tree");
        ASSERT_EQ(e.stage.type, "org.arbor.test");
        ASSERT_TRUE(WIFEXITED(e.status));
        ASSERT_EQ(WEXITSTATUS(e.status), 3);
        ASSERT_EQ(e.logTail, Strings{"something broke"});
        ASSERT_TRUE(e.payload.is_null());
    }
}

TEST_F(StageRunnerTest, reportedExceptionIsStageError)
{
    auto request = stage("echo '{\"type\": \"exception\", \"data\": {\"value\": \"no space left\"}}' >&3\n");

    try {
        runStage(host, request);
        FAIL() << "stage should have failed";
    } catch (StageError & e) {
        ASSERT_EQ(e.status, 0);
        ASSERT_EQ(e.payload["value"], "no space left");
    }
}

TEST_F(StageRunnerTest, timeoutKillsTheStage)
{
    auto request = stage("exec sleep 30\n");
    request.timeout = 1;

    try {
        runStage(host, request);
        FAIL() << "stage should have timed out";
    } catch (StageError & e) {
        ASSERT_EQ(e.status, -1);
    }
}

TEST_F(StageRunnerTest, loopRequestsAreRefusedByPlainHosts)
{
    auto request = stage(
        "echo '{\"id\": 1, \"type\": \"loop-attach\", \"data\": {\"filename\": \"disk.img\"}}' >&3\n"
        "read reply <&3\n"
        "echo \"$reply\" > \"$HOME/reply.json\"\n");

    runStage(host, request);

    auto reply = json::parse(readFile(host.tree + "/reply.json"));
    ASSERT_EQ(reply["id"], 1);
    ASSERT_TRUE(reply.contains("error"));
}

} // namespace arbor
