#include <gtest/gtest.h>

#include "arbor/store/build/capabilities.hh"
#include "arbor/store/filetransfer.hh"
#include "arbor/store/globals.hh"

namespace arbor {

TEST(Settings, defaults)
{
    Settings s;

    ASSERT_EQ(s.storeDir.get(), "/var/cache/arbor");
    ASSERT_EQ(s.libDir.get(), "/usr/lib/arbor");
    ASSERT_GE(s.maxJobs.get(), 1u);
    ASSERT_TRUE(s.filterSyscalls.get());
    ASSERT_FALSE(s.allowNewPrivileges.get());
    ASSERT_EQ(s.stageTimeout.get(), 0u);
}

TEST(Settings, aliasForMaxJobs)
{
    Settings s;

    ASSERT_TRUE(s.set("j", "3"));
    ASSERT_EQ(s.maxJobs.get(), 3u);
}

TEST(Settings, configFileSyntax)
{
    Settings s;
    s.applyConfig(
        "store = /srv/arbor\n"
        "download-attempts = 2\n"
        "extra-sandbox-extra-capabilities = CAP_NET_ADMIN\n");

    ASSERT_EQ(s.storeDir.get(), "/srv/arbor");
    ASSERT_EQ(s.downloadAttempts.get(), 2u);
    ASSERT_TRUE(s.sandboxExtraCapabilities.get().count("CAP_NET_ADMIN"));
    ASSERT_TRUE(s.sandboxExtraCapabilities.get().count("CAP_SYS_ADMIN"));
}

TEST(FileTransferSettings, fromSettings)
{
    Settings s;
    s.set("connect-timeout", "10");
    s.set("download-attempts", "7");
    s.set("download-retry-base-ms", "100");

    auto res = FileTransferSettings::fromSettings(s);

    ASSERT_EQ(res.connectTimeout, 10u);
    ASSERT_EQ(res.stalledDownloadTimeout, 300u);
    ASSERT_EQ(res.tries, 7u);
    ASSERT_EQ(res.baseRetryTimeMs, 100u);
}

TEST(makeCapabilityPolicy, followsSettings)
{
    Settings s;
    s.set("sandbox-capabilities", "CAP_CHOWN");
    s.set("sandbox-extra-capabilities", "CAP_SYS_ADMIN");

    auto policy = makeCapabilityPolicy(s);

    ASSERT_EQ(policy->allowedCapabilities({}), StringSet{"CAP_CHOWN"});
    ASSERT_EQ(policy->allowedCapabilities({"CAP_SYS_ADMIN"}), (StringSet{"CAP_CHOWN", "CAP_SYS_ADMIN"}));
    ASSERT_THROW(policy->allowedCapabilities({"CAP_MKNOD"}), SandboxError);
}

} // namespace arbor
