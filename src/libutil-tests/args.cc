#include <gtest/gtest.h>

#include "arbor/util/args.hh"

#include <sstream>

namespace arbor {

struct TestArgs : Args
{
    std::string manifest;
    std::optional<std::string> output;
    std::vector<std::string> exports;
    bool failFast = false;
    int verbosity = 0;
    std::pair<std::string, std::string> option;

    TestArgs()
    {
        addFlag({
            .longName = "output-directory",
            .aliases = {"output-dir"},
            .description = "where exports are written",
            .labels = {"dir"},
            .handler = {&output},
        });

        addFlag({
            .longName = "export",
            .description = "export a pipeline",
            .labels = {"name"},
            .handler = {[this](std::string name) { exports.push_back(name); }},
        });

        addFlag({
            .longName = "fail-fast",
            .description = "stop after the first failure",
            .handler = {&failFast, true},
        });

        addFlag({
            .longName = "verbose",
            .shortName = 'v',
            .description = "increase verbosity",
            .handler = {[this]() { verbosity++; }},
        });

        addFlag({
            .longName = "option",
            .description = "set an option",
            .labels = {"name", "value"},
            .handler = {[this](std::string name, std::string value) { option = {name, value}; }},
        });

        expectArg("manifest", &manifest, true);
    }
};

TEST(Args, positionalAndFlags)
{
    TestArgs args;
    args.parseCmdline({"--export", "image", "manifest.json", "--output-directory", "out", "--export", "tree"});

    ASSERT_EQ(args.manifest, "manifest.json");
    ASSERT_EQ(args.output, "out");
    ASSERT_EQ(args.exports, (std::vector<std::string>{"image", "tree"}));
}

TEST(Args, aliasesResolveToTheSameFlag)
{
    TestArgs args;
    args.parseCmdline({"--output-dir", "out"});

    ASSERT_EQ(args.output, "out");
}

TEST(Args, booleanFlag)
{
    TestArgs args;
    args.parseCmdline({"--fail-fast"});

    ASSERT_TRUE(args.failFast);
}

TEST(Args, compoundShortFlags)
{
    TestArgs args;
    args.parseCmdline({"-vvv"});

    ASSERT_EQ(args.verbosity, 3);
}

TEST(Args, twoArgumentFlag)
{
    TestArgs args;
    args.parseCmdline({"--option", "max-jobs", "4"});

    ASSERT_EQ(args.option.first, "max-jobs");
    ASSERT_EQ(args.option.second, "4");
}

TEST(Args, singleDashIsPositional)
{
    TestArgs args;
    args.parseCmdline({"-"});

    ASSERT_EQ(args.manifest, "-");
}

TEST(Args, dashDashEndsFlags)
{
    TestArgs args;
    args.parseCmdline({"--", "--fail-fast"});

    ASSERT_EQ(args.manifest, "--fail-fast");
    ASSERT_FALSE(args.failFast);
}

TEST(Args, optionalPositionalMayBeOmitted)
{
    TestArgs args;
    args.parseCmdline({"--fail-fast"});

    ASSERT_EQ(args.manifest, "");
}

TEST(Args, unknownFlagIsUsageError)
{
    TestArgs args;

    ASSERT_THROW(args.parseCmdline({"--bogus"}), UsageError);
}

TEST(Args, missingFlagArgumentIsUsageError)
{
    TestArgs args;

    ASSERT_THROW(args.parseCmdline({"--option", "max-jobs"}), UsageError);
}

TEST(Args, extraPositionalIsUsageError)
{
    TestArgs args;

    ASSERT_THROW(args.parseCmdline({"a.json", "b.json"}), UsageError);
}

TEST(Args, printFlagsListsEveryFlagOnce)
{
    TestArgs args;
    std::ostringstream out;
    args.printFlags(out);

    auto s = out.str();
    ASSERT_NE(s.find("--output-directory <dir>"), std::string::npos);
    ASSERT_NE(s.find("--verbose, -v"), std::string::npos);
    ASSERT_EQ(s.find("--output-dir "), std::string::npos);
}

TEST(argvToStrings, skipsProgramName)
{
    char arg0[] = "arbor", arg1[] = "--json", arg2[] = "manifest.json";
    char * argv[] = {arg0, arg1, arg2, nullptr};

    ASSERT_EQ(argvToStrings(3, argv), (Strings{"--json", "manifest.json"}));
}

} // namespace arbor
