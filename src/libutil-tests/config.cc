#include "arbor/util/configuration.hh"
#include "arbor/util/file-system.hh"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <stdlib.h>

namespace arbor {

/* ----------------------------------------------------------------------------
 * Config
 * --------------------------------------------------------------------------*/

struct TestConfig : Config
{
    Setting<std::string> name{this, "default", "name", "a string setting"};
    Setting<unsigned int> jobs{this, 1, "max-jobs", "an integer setting", {"j"}};
    Setting<bool> filter{this, true, "filter-syscalls", "a boolean setting"};
    Setting<Strings> paths{this, {"/usr"}, "host-paths", "a list setting"};
    Setting<StringSet> caps{this, {}, "capabilities", "a set setting"};
};

TEST(Config, setUndefinedSetting)
{
    TestConfig config;

    ASSERT_EQ(config.set("undefined-key", "value"), false);
}

TEST(Config, setDefinedSetting)
{
    TestConfig config;

    ASSERT_EQ(config.set("name", "value"), true);
    ASSERT_EQ(config.name.get(), "value");
    ASSERT_TRUE(config.name.overridden);
}

TEST(Config, setThroughAlias)
{
    TestConfig config;

    ASSERT_TRUE(config.set("j", "8"));
    ASSERT_EQ(config.jobs.get(), 8u);
}

TEST(Config, setInvalidIntegerThrows)
{
    TestConfig config;

    ASSERT_THROW(config.set("max-jobs", "many"), UsageError);
}

TEST(Config, parsesBooleans)
{
    TestConfig config;

    config.set("filter-syscalls", "no");
    ASSERT_FALSE(config.filter.get());
    config.set("filter-syscalls", "1");
    ASSERT_TRUE(config.filter.get());
    ASSERT_THROW(config.set("filter-syscalls", "maybe"), UsageError);
}

TEST(Config, extraAppendsToLists)
{
    TestConfig config;

    ASSERT_TRUE(config.set("extra-host-paths", "/etc /opt"));
    ASSERT_EQ(config.paths.get(), (Strings{"/usr", "/etc", "/opt"}));

    ASSERT_TRUE(config.set("host-paths", "/srv"));
    ASSERT_EQ(config.paths.get(), (Strings{"/srv"}));
}

TEST(Config, extraRejectedForScalars)
{
    TestConfig config;

    ASSERT_FALSE(config.set("extra-name", "value"));
}

TEST(Config, applyConfigSkipsCommentsAndBlankLines)
{
    TestConfig config;

    config.applyConfig(
        "# comment\n"
        "\n"
        "name = hello world # trailing comment\n"
        "max-jobs = 3\n"
        "capabilities = CAP_SYS_ADMIN CAP_MKNOD\n");

    ASSERT_EQ(config.name.get(), "hello world");
    ASSERT_EQ(config.jobs.get(), 3u);
    ASSERT_EQ(config.caps.get(), (StringSet{"CAP_MKNOD", "CAP_SYS_ADMIN"}));
}

TEST(Config, applyConfigSyntaxError)
{
    TestConfig config;

    ASSERT_THROW(config.applyConfig("name hello\n"), UsageError);
    ASSERT_THROW(config.applyConfig("name\n"), UsageError);
}

TEST(Config, applyConfigIncludes)
{
    auto tmpDir = createTempDir();
    AutoDelete delTmpDir(tmpDir, true);

    writeFile(tmpDir + "/extra.conf", "name = included\n");
    writeFile(tmpDir + "/arbor.conf", "include extra.conf\n!include missing.conf\nmax-jobs = 2\n");

    TestConfig config;
    config.applyConfig(readFile(tmpDir + "/arbor.conf"), tmpDir + "/arbor.conf");

    ASSERT_EQ(config.name.get(), "included");
    ASSERT_EQ(config.jobs.get(), 2u);
}

TEST(Config, applyConfigMissingIncludeThrows)
{
    auto tmpDir = createTempDir();
    AutoDelete delTmpDir(tmpDir, true);

    TestConfig config;

    ASSERT_THROW(config.applyConfig("include nowhere.conf\n", tmpDir + "/arbor.conf"), Error);
}

TEST(Config, applyEnvironment)
{
    setenv("ARBOR_TEST_CFG_MAX_JOBS", "6", 1);
    setenv("ARBOR_TEST_CFG_FILTER_SYSCALLS", "false", 1);

    TestConfig config;
    config.applyEnvironment("ARBOR_TEST_CFG_");

    unsetenv("ARBOR_TEST_CFG_MAX_JOBS");
    unsetenv("ARBOR_TEST_CFG_FILTER_SYSCALLS");

    ASSERT_EQ(config.jobs.get(), 6u);
    ASSERT_FALSE(config.filter.get());
}

TEST(Config, getSettingsOverriddenOnly)
{
    TestConfig config;
    config.set("name", "changed");

    std::map<std::string, Config::SettingInfo> all, overridden;
    config.getSettings(all);
    config.getSettings(overridden, true);

    ASSERT_EQ(all.size(), 5u);
    ASSERT_EQ(overridden.size(), 1u);
    ASSERT_EQ(overridden["name"].value, "changed");
}

TEST(Config, resetOverridden)
{
    TestConfig config;
    config.set("name", "changed");
    config.resetOverridden();

    std::map<std::string, Config::SettingInfo> overridden;
    config.getSettings(overridden, true);

    ASSERT_TRUE(overridden.empty());
}

TEST(Config, toJSON)
{
    TestConfig config;
    config.set("max-jobs", "4");

    auto json = config.toJSON();

    ASSERT_EQ(json["max-jobs"]["value"], "4");
    ASSERT_EQ(json["host-paths"]["value"], "/usr");
    ASSERT_FALSE(json.contains("j"));
}

} // namespace arbor
