#include <gtest/gtest.h>

#include "arbor/build/stage-executor.hh"

namespace arbor {

static StageIdentity identity{.pipeline = "tree", .index = 0, .type = "org.osbuild.noop", .fingerprint = "f00"};

TEST(runThenTearDown, tearsDownAfterSuccess)
{
    bool tornDown = false;

    auto outcome = runThenTearDown(
        []() { return StageOutcome{.metadata = {{"ok", true}}}; }, [&]() { tornDown = true; });

    ASSERT_TRUE(tornDown);
    ASSERT_EQ(outcome.metadata["ok"], true);
}

TEST(runThenTearDown, stageErrorSurvivesCleanTeardown)
{
    bool tornDown = false;

    ASSERT_THROW(
        runThenTearDown(
            []() -> StageOutcome { throw StageError(identity, 1 << 8, Strings{}, nullptr, "stage failed"); },
            [&]() { tornDown = true; }),
        StageError);

    ASSERT_TRUE(tornDown);
}

TEST(runThenTearDown, teardownFailureWinsOverStageError)
{
    try {
        runThenTearDown(
            []() -> StageOutcome { throw StageError(identity, 1 << 8, Strings{}, nullptr, "exit status 1"); },
            []() { throw SandboxError("cannot unmount '/run/arbor/tree'"); });
        FAIL() << "no exception was thrown";
    } catch (SandboxError & e) {
        ASSERT_NE(e.message().find("cannot unmount"), std::string::npos);
        ASSERT_EQ(e.info().traces.size(), 1u);
        ASSERT_NE(e.info().traces.front().hint.str().find("exit status 1"), std::string::npos);
    }
}

TEST(runThenTearDown, teardownFailureAfterSuccessIsFatal)
{
    ASSERT_THROW(
        runThenTearDown([]() { return StageOutcome{}; }, []() { throw SandboxError("cannot remove build root"); }),
        SandboxError);
}

} // namespace arbor
