#include <gtest/gtest.h>

#include "arbor/store/build/capabilities.hh"
#include "arbor/util/file-system.hh"
#include "arbor/util/processes.hh"
#include "arbor/util/strings.hh"

#include <linux/capability.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace arbor {

TEST(parseCapability, knownNames)
{
    ASSERT_EQ(*parseCapability("CAP_CHOWN"), CAP_CHOWN);
    ASSERT_EQ(*parseCapability("CAP_SYS_ADMIN"), CAP_SYS_ADMIN);
}

TEST(parseCapability, unknownNames)
{
    ASSERT_FALSE(parseCapability("CAP_FLY"));
    ASSERT_FALSE(parseCapability("cap_chown"));
}

TEST(AllowListCapabilityPolicy, baseIsAlwaysGranted)
{
    AllowListCapabilityPolicy policy({"CAP_CHOWN", "CAP_MKNOD"}, {"CAP_SYS_ADMIN"});

    ASSERT_EQ(policy.allowedCapabilities({}), (StringSet{"CAP_CHOWN", "CAP_MKNOD"}));
}

TEST(AllowListCapabilityPolicy, extraIsGrantedOnRequest)
{
    AllowListCapabilityPolicy policy({"CAP_CHOWN"}, {"CAP_SYS_ADMIN"});

    ASSERT_EQ(policy.allowedCapabilities({"CAP_SYS_ADMIN"}), (StringSet{"CAP_CHOWN", "CAP_SYS_ADMIN"}));
}

TEST(AllowListCapabilityPolicy, requestOutsideTheListsFails)
{
    AllowListCapabilityPolicy policy({"CAP_CHOWN"}, {"CAP_SYS_ADMIN"});

    ASSERT_THROW(policy.allowedCapabilities({"CAP_SYS_MODULE"}), SandboxError);
    ASSERT_THROW(policy.allowedCapabilities({"CAP_FLY"}), SandboxError);
}

TEST(AllowListCapabilityPolicy, unknownNamesInSettingsAreRejected)
{
    ASSERT_THROW(AllowListCapabilityPolicy({"CAP_FLY"}, {}), UsageError);
    ASSERT_THROW(AllowListCapabilityPolicy({}, {"CAP_FLY"}), UsageError);
}

/**
 * Whether the `CapInh` and `CapAmb` lines of /proc/self/status are
 * both zero. A kernel without ambient capabilities has no `CapAmb`.
 */
static bool inheritableAndAmbientAreEmpty()
{
    for (auto & line : tokenizeString<std::vector<std::string>>(readFile("/proc/self/status"), "\n")) {
        if (!hasPrefix(line, "CapInh:") && !hasPrefix(line, "CapAmb:"))
            continue;
        auto value = trim(line.substr(line.find(':') + 1));
        if (std::stoull(value, nullptr, 16) != 0)
            return false;
    }
    return true;
}

TEST(dropCapabilities, clearsInheritableAndAmbientSets)
{
    Pid pid = startProcess([]() {
        clearInheritableCapabilities();
        _exit(inheritableAndAmbientAreEmpty() ? 0 : 1);
    });
    ASSERT_EQ(pid.wait(), 0);
}

TEST(dropCapabilities, privilegedDropLeavesNothingToInherit)
{
    if (geteuid() != 0)
        GTEST_SKIP() << "trimming the bounding set needs root";

    Pid pid = startProcess([]() {
        dropCapabilities({"CAP_CHOWN"});
        bool ok = inheritableAndAmbientAreEmpty() && prctl(PR_CAPBSET_READ, CAP_CHOWN, 0, 0, 0) == 1
                  && prctl(PR_CAPBSET_READ, CAP_SYS_ADMIN, 0, 0, 0) == 0;
        _exit(ok ? 0 : 1);
    });
    ASSERT_EQ(pid.wait(), 0);
}

} // namespace arbor
