#include "arbor/store/build/capabilities.hh"
#include "arbor/store/globals.hh"
#include "arbor/util/file-system.hh"
#include "arbor/util/logging.hh"
#include "arbor/util/strings.hh"

#include <linux/capability.h>
#include <sys/prctl.h>
#include <sys/syscall.h>
#include <unistd.h>

namespace arbor {

static const std::map<std::string_view, int> capabilityNames = {
    {"CAP_CHOWN", CAP_CHOWN},
    {"CAP_DAC_OVERRIDE", CAP_DAC_OVERRIDE},
    {"CAP_DAC_READ_SEARCH", CAP_DAC_READ_SEARCH},
    {"CAP_FOWNER", CAP_FOWNER},
    {"CAP_FSETID", CAP_FSETID},
    {"CAP_KILL", CAP_KILL},
    {"CAP_SETGID", CAP_SETGID},
    {"CAP_SETUID", CAP_SETUID},
    {"CAP_SETPCAP", CAP_SETPCAP},
    {"CAP_LINUX_IMMUTABLE", CAP_LINUX_IMMUTABLE},
    {"CAP_NET_BIND_SERVICE", CAP_NET_BIND_SERVICE},
    {"CAP_NET_BROADCAST", CAP_NET_BROADCAST},
    {"CAP_NET_ADMIN", CAP_NET_ADMIN},
    {"CAP_NET_RAW", CAP_NET_RAW},
    {"CAP_IPC_LOCK", CAP_IPC_LOCK},
    {"CAP_IPC_OWNER", CAP_IPC_OWNER},
    {"CAP_SYS_MODULE", CAP_SYS_MODULE},
    {"CAP_SYS_RAWIO", CAP_SYS_RAWIO},
    {"CAP_SYS_CHROOT", CAP_SYS_CHROOT},
    {"CAP_SYS_PTRACE", CAP_SYS_PTRACE},
    {"CAP_SYS_PACCT", CAP_SYS_PACCT},
    {"CAP_SYS_ADMIN", CAP_SYS_ADMIN},
    {"CAP_SYS_BOOT", CAP_SYS_BOOT},
    {"CAP_SYS_NICE", CAP_SYS_NICE},
    {"CAP_SYS_RESOURCE", CAP_SYS_RESOURCE},
    {"CAP_SYS_TIME", CAP_SYS_TIME},
    {"CAP_SYS_TTY_CONFIG", CAP_SYS_TTY_CONFIG},
    {"CAP_MKNOD", CAP_MKNOD},
    {"CAP_LEASE", CAP_LEASE},
    {"CAP_AUDIT_WRITE", CAP_AUDIT_WRITE},
    {"CAP_AUDIT_CONTROL", CAP_AUDIT_CONTROL},
    {"CAP_SETFCAP", CAP_SETFCAP},
    {"CAP_MAC_OVERRIDE", CAP_MAC_OVERRIDE},
    {"CAP_MAC_ADMIN", CAP_MAC_ADMIN},
    {"CAP_SYSLOG", CAP_SYSLOG},
    {"CAP_WAKE_ALARM", CAP_WAKE_ALARM},
    {"CAP_BLOCK_SUSPEND", CAP_BLOCK_SUSPEND},
    {"CAP_AUDIT_READ", CAP_AUDIT_READ},
    {"CAP_PERFMON", CAP_PERFMON},
    {"CAP_BPF", CAP_BPF},
    {"CAP_CHECKPOINT_RESTORE", CAP_CHECKPOINT_RESTORE},
};

std::optional<int> parseCapability(std::string_view name)
{
    auto i = capabilityNames.find(name);
    if (i == capabilityNames.end())
        return std::nullopt;
    return i->second;
}

AllowListCapabilityPolicy::AllowListCapabilityPolicy(StringSet base, StringSet extra)
    : base(std::move(base))
    , extra(std::move(extra))
{
    for (auto & cap : this->base)
        if (!parseCapability(cap))
            throw UsageError("unknown capability '%s' in 'sandbox-capabilities'", cap);
    for (auto & cap : this->extra)
        if (!parseCapability(cap))
            throw UsageError("unknown capability '%s' in 'sandbox-extra-capabilities'", cap);
}

StringSet AllowListCapabilityPolicy::allowedCapabilities(const StringSet & requested) const
{
    auto res = base;
    for (auto & cap : requested) {
        if (!parseCapability(cap))
            throw SandboxError("stage requests unknown capability '%s'", cap);
        if (!base.count(cap) && !extra.count(cap))
            throw SandboxError(
                "stage requests capability '%s', which is not permitted by 'sandbox-extra-capabilities'", cap);
        res.insert(cap);
    }
    return res;
}

std::unique_ptr<CapabilityPolicy> makeCapabilityPolicy(const Settings & settings)
{
    return std::make_unique<AllowListCapabilityPolicy>(
        settings.sandboxCapabilities.get(), settings.sandboxExtraCapabilities.get());
}

static int lastCapability()
{
    try {
        if (auto n = string2Int<int>(trim(readFile("/proc/sys/kernel/cap_last_cap"))))
            return *n;
    } catch (SystemError &) {
    }
    return CAP_LAST_CAP;
}

void dropCapabilities(const StringSet & keep)
{
    std::set<int> keepNumbers;
    for (auto & cap : keep)
        if (auto n = parseCapability(cap))
            keepNumbers.insert(*n);

    auto last = lastCapability();
    for (int cap = 0; cap <= last; ++cap) {
        if (keepNumbers.count(cap))
            continue;
        if (prctl(PR_CAPBSET_DROP, cap, 0, 0, 0) == -1 && errno != EINVAL)
            throw SysError("dropping capability %d from the bounding set", cap);
    }

    clearInheritableCapabilities();
}

void clearInheritableCapabilities()
{
    /* Kernels before 4.3 have no ambient set. */
    if (prctl(PR_CAP_AMBIENT, PR_CAP_AMBIENT_CLEAR_ALL, 0, 0, 0) == -1 && errno != EINVAL)
        throw SysError("clearing the ambient capability set");

    __user_cap_header_struct header{.version = _LINUX_CAPABILITY_VERSION_3, .pid = 0};
    __user_cap_data_struct data[_LINUX_CAPABILITY_U32S_3] = {};

    if (syscall(SYS_capget, &header, data) == -1)
        throw SysError("getting the capabilities of the sandbox process");

    for (auto & d : data)
        d.inheritable = 0;

    if (syscall(SYS_capset, &header, data) == -1)
        throw SysError("clearing the inheritable capability set");
}

} // namespace arbor
