#include "arbor/util/linux-namespaces.hh"
#include "arbor/util/file-system.hh"
#include "arbor/util/logging.hh"
#include "arbor/util/processes.hh"
#include "arbor/util/strings.hh"

#include <sched.h>
#include <sys/mount.h>
#include <unistd.h>

namespace arbor {

/**
 * Run `child` in a process created with `cloneFlags` and report whether
 * it exited successfully. Failure to create the process counts as
 * failure.
 */
static bool probeClone(std::string_view what, int cloneFlags, std::function<void()> child)
{
    try {
        Pid pid = startProcess(std::move(child), {.cloneFlags = cloneFlags});
        if (auto status = pid.wait()) {
            debug("%s: probe %s", what, statusToString(status));
            return false;
        }
        return true;
    } catch (SysError & e) {
        debug("%s: %s", what, e.msg());
        return false;
    }
}

/**
 * Whether a sysctl knob that gates user namespaces is set to 0. A knob
 * that does not exist does not disable anything.
 */
static bool sysctlDisabled(const Path & knob)
{
    if (!pathExists(knob) || trim(readFile(knob)) != "0")
        return false;
    debug("user namespaces are disabled by '%s'", knob);
    return true;
}

bool userNamespacesSupported()
{
    static const bool supported = []() {
        if (!pathExists("/proc/self/ns/user")) {
            debug("the kernel does not support user namespaces");
            return false;
        }

        if (sysctlDisabled("/proc/sys/kernel/unprivileged_userns_clone"))
            return false;

        /* Unlike the knob above, this one disables user namespaces when it is absent. */
        if (!pathExists("/proc/sys/user/max_user_namespaces") || sysctlDisabled("/proc/sys/user/max_user_namespaces"))
            return false;

        return probeClone("user namespaces", CLONE_NEWUSER, []() { _exit(0); });
    }();
    return supported;
}

bool mountAndPidNamespacesSupported()
{
    static const bool supported = []() {
        int flags = CLONE_NEWNS | CLONE_NEWPID;
        if (userNamespacesSupported())
            flags |= CLONE_NEWUSER;

        return probeClone("mount and PID namespaces", flags, []() {
            if (mount(nullptr, "/", nullptr, MS_PRIVATE | MS_REC, nullptr) == -1)
                _exit(1);

            /* Fails if something is mounted over part of the parent's /proc. */
            if (mount("none", "/proc", "proc", 0, nullptr) == -1)
                _exit(2);

            _exit(0);
        });
    }();
    return supported;
}

} // namespace arbor
