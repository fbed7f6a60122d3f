#include <gtest/gtest.h>

#include "arbor/util/file-descriptor.hh"
#include "arbor/util/logging.hh"
#include "arbor/util/strings.hh"

#include <nlohmann/json.hpp>

namespace arbor {

using nlohmann::json;

class JSONLoggerTest : public ::testing::Test
{
protected:
    std::vector<json> records;
    std::unique_ptr<Logger> jsonLogger = makeJSONLogger([this](const json & j) { records.push_back(j); });
};

TEST_F(JSONLoggerTest, activityLifecycle)
{
    {
        Activity act(*jsonLogger, lvlInfo, actStage, "running stage", {"tree", (uint64_t) 0, "org.osbuild.noop"});
        act.result(resBuildLogLine, "hello from the stage");
        act.progress(1, 2);
    }

    ASSERT_EQ(records.size(), 4u);

    ASSERT_EQ(records[0]["action"], "start");
    ASSERT_EQ(records[0]["type"], actStage);
    ASSERT_EQ(records[0]["text"], "running stage");
    ASSERT_EQ(records[0]["fields"], json::parse(R"(["tree", 0, "org.osbuild.noop"])"));

    auto id = records[0]["id"];

    ASSERT_EQ(records[1]["action"], "result");
    ASSERT_EQ(records[1]["id"], id);
    ASSERT_EQ(records[1]["type"], resBuildLogLine);
    ASSERT_EQ(records[1]["fields"][0], "hello from the stage");

    ASSERT_EQ(records[2]["type"], resProgress);
    ASSERT_EQ(records[2]["fields"], json::parse("[1, 2, 0, 0]"));

    ASSERT_EQ(records[3]["action"], "stop");
    ASSERT_EQ(records[3]["id"], id);
}

TEST_F(JSONLoggerTest, nestedActivitiesRecordTheirParent)
{
    Activity outer(*jsonLogger, actBuild);
    Activity inner(*jsonLogger, lvlInfo, actPipeline, "", {}, outer.id);

    ASSERT_EQ(records.size(), 2u);
    ASSERT_EQ(records[1]["parent"], outer.id);
    ASSERT_NE(outer.id, inner.id);
}

TEST_F(JSONLoggerTest, messages)
{
    jsonLogger->log(lvlWarn, "disk almost full");

    ASSERT_EQ(records.size(), 1u);
    ASSERT_EQ(records[0]["action"], "msg");
    ASSERT_EQ(records[0]["level"], lvlWarn);
    ASSERT_EQ(records[0]["msg"], "disk almost full");
}

TEST_F(JSONLoggerTest, errorsCarryTheirTrace)
{
    Error e("stage exited with status 1");
    e.addTrace("while building pipeline '%s'", "tree");

    jsonLogger->logEI(e.info());

    ASSERT_EQ(records.size(), 1u);
    ASSERT_EQ(records[0]["raw_msg"], "stage exited with status 1");
    ASSERT_EQ(records[0]["trace"].size(), 1u);
    ASSERT_NE(records[0]["trace"][0]["raw_msg"].get<std::string>().find("tree"), std::string::npos);
}

/**
 * Routes the global logger into `records` for the duration of a test.
 */
class GlobalLoggerTest : public JSONLoggerTest
{
protected:
    Verbosity savedVerbosity = verbosity;

    void SetUp() override
    {
        std::swap(logger, jsonLogger);
    }

    void TearDown() override
    {
        std::swap(logger, jsonLogger);
        verbosity = savedVerbosity;
    }
};

TEST_F(GlobalLoggerTest, logErrorSetsTheLevel)
{
    Error e("stage exited with status 1");

    logError(e.info());

    ASSERT_EQ(records.size(), 1u);
    ASSERT_EQ(records[0]["level"], lvlError);
    ASSERT_EQ(records[0]["raw_msg"], "stage exited with status 1");
}

TEST_F(GlobalLoggerTest, logErrorInfoHonoursVerbosity)
{
    verbosity = lvlInfo;

    logErrorInfo(lvlWarn, Error("teardown left a loop device behind").info());
    logErrorInfo(lvlDebug, Error("not shown").info());

    ASSERT_EQ(records.size(), 1u);
    ASSERT_EQ(records[0]["level"], lvlWarn);
}

TEST(makeJSONLogger, writesPrefixedLinesToFd)
{
    Pipe pipe;
    pipe.create();

    {
        auto jsonLogger = makeJSONLogger(pipe.writeSide.get());
        jsonLogger->log(lvlInfo, "hello");
    }
    pipe.writeSide.close();

    auto lines = tokenizeString<std::vector<std::string>>(drainFD(pipe.readSide.get()), "\n");
    ASSERT_EQ(lines.size(), 1u);
    ASSERT_TRUE(hasPrefix(lines[0], "@arbor "));
    auto record = json::parse(lines[0].substr(7));
    ASSERT_EQ(record["msg"], "hello");
}

TEST(makeJSONLogger, withoutPrefix)
{
    Pipe pipe;
    pipe.create();

    {
        auto jsonLogger = makeJSONLogger(pipe.writeSide.get(), false);
        jsonLogger->log(lvlInfo, "hello");
    }
    pipe.writeSide.close();

    auto record = json::parse(drainFD(pipe.readSide.get()));
    ASSERT_EQ(record["action"], "msg");
}

TEST(makeTeeLogger, forwardsToEveryLogger)
{
    std::vector<json> first, second;

    std::vector<std::unique_ptr<Logger>> extra;
    extra.push_back(makeJSONLogger([&](const json & j) { second.push_back(j); }));
    auto tee = makeTeeLogger(makeJSONLogger([&](const json & j) { first.push_back(j); }), std::move(extra));

    {
        Activity act(*tee, actFetchSources);
        act.result(resCacheHit, "tree", (uint64_t) 2);
    }

    ASSERT_EQ(first.size(), 3u);
    ASSERT_EQ(second.size(), 3u);
    ASSERT_EQ(first[1], second[1]);
}

} // namespace arbor
