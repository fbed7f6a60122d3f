#include "arbor/store/build/sandbox.hh"
#include "arbor/store/build/capabilities.hh"
#include "arbor/store/build/mounts.hh"
#include "arbor/util/linux-namespaces.hh"
#include "arbor/util/logging.hh"
#include "arbor/util/mount.hh"
#include "arbor/util/signals.hh"
#include "arbor/util/strings.hh"

#include <algorithm>
#include <cstring>

#include <fcntl.h>
#include <net/if.h>
#include <netinet/ip.h>
#include <sched.h>
#include <sys/ioctl.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/socket.h>
#include <sys/syscall.h>
#include <sys/sysmacros.h>

#include <seccomp.h>

#define pivot_root(new_root, put_old) (syscall(SYS_pivot_root, new_root, put_old))

namespace arbor {

/**
 * Top-level directories of a build tree that the sandbox provides
 * itself.
 */
static const StringSet sandboxOwnedDirs = {"dev", "proc", "sys", "run", "tmp"};

static void setupSeccomp(bool filterSyscalls, bool allowNewPrivileges)
{
    if (!filterSyscalls) {
        if (!allowNewPrivileges && prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) == -1)
            throw SysError("setting PR_SET_NO_NEW_PRIVS");
        return;
    }

    scmp_filter_ctx ctx;

    if (!(ctx = seccomp_init(SCMP_ACT_ALLOW)))
        throw SysError("unable to initialize seccomp mode 2");

    Finally cleanup([&]() { seccomp_release(ctx); });

#if defined(__x86_64__)
    if (seccomp_arch_add(ctx, SCMP_ARCH_X86) != 0)
        throw SysError("unable to add 32-bit seccomp architecture");

    if (seccomp_arch_add(ctx, SCMP_ARCH_X32) != 0)
        throw SysError("unable to add X32 seccomp architecture");
#elif defined(__aarch64__)
    if (seccomp_arch_add(ctx, SCMP_ARCH_ARM) != 0)
        printError("unable to add ARM seccomp architecture");
#endif

    /* These affect the host kernel rather than the tree being built. */
    for (auto syscall :
         {SCMP_SYS(kexec_load),
          SCMP_SYS(kexec_file_load),
          SCMP_SYS(reboot),
          SCMP_SYS(init_module),
          SCMP_SYS(finit_module),
          SCMP_SYS(delete_module),
          SCMP_SYS(swapon),
          SCMP_SYS(swapoff),
          SCMP_SYS(bpf),
          SCMP_SYS(perf_event_open),
          SCMP_SYS(acct),
          SCMP_SYS(settimeofday),
          SCMP_SYS(clock_settime),
          SCMP_SYS(clock_adjtime),
          SCMP_SYS(adjtimex)})
        if (seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EPERM), syscall, 0) != 0)
            throw SysError("unable to add seccomp rule");

    if (seccomp_attr_set(ctx, SCMP_FLTATR_CTL_NNP, allowNewPrivileges ? 0 : 1) != 0)
        throw SysError("unable to set 'no new privileges' seccomp attribute");

    if (seccomp_load(ctx) != 0)
        throw SysError("unable to load seccomp BPF program");
}

static std::vector<char *> stringsToCharPtrs(const Strings & ss)
{
    std::vector<char *> res;
    for (auto & s : ss)
        res.push_back((char *) s.c_str());
    res.push_back(0);
    return res;
}

/**
 * Read the messages a sandboxed child writes while setting itself up:
 * `\1` followed by an error message, or `\2` once it is about to
 * `exec`.
 */
static void processSandboxSetupMessages(Descriptor fd, Pid & pid)
{
    std::vector<std::string> msgs;
    while (true) {
        std::string msg = [&]() {
            try {
                return readLine(fd);
            } catch (Error & e) {
                auto status = pid.wait();
                throw SandboxError(
                    "the sandbox did not initialize: %s (%s, previous messages: %s)",
                    e.message(),
                    statusToString(status),
                    concatStringsSep("|", msgs));
            }
        }();
        if (msg.substr(0, 1) == "\2")
            break;
        if (msg.substr(0, 1) == "\1") {
            auto error = readLine(fd, true);
            pid.wait();
            SandboxError e("%s", error);
            e.addTrace("while setting up the sandbox");
            throw e;
        }
        debug("sandbox setup: " + msg);
        msgs.push_back(std::move(msg));
    }
}

BuildRoot::BuildRoot(BuildRootConfig config_)
    : config(std::move(config_))
    , privileged(geteuid() == 0)
{
    if (!privileged) {
        if (!config.devices.empty() || !config.mounts.empty())
            throw SandboxError("stages with devices or mounts can only be run as root");
        if (!userNamespacesSupported())
            throw SandboxError(
                "cannot create a sandbox because user namespaces are not available; check /proc/sys/user/max_user_namespaces");
        usingUserNamespace = true;
    }

    if (!mountAndPidNamespacesSupported())
        throw SandboxError("cannot create a sandbox because mount and PID namespaces are not available");

    for (auto & m : config.mounts)
        if (filesystemType(m.type) != ""
            && std::none_of(
                config.devices.begin(), config.devices.end(), [&](auto & d) { return d.name == m.source; }))
            throw SandboxError("mount '%s' refers to unknown device '%s'", m.name, m.source);

    stagingDir.reset(createTempDir(config.tempDir, "sandbox", 0700));

    try {
        attachDevices();
    } catch (Error & e) {
        e.addTrace("while attaching the devices of a stage");
        try {
            teardown();
        } catch (Error & e2) {
            logError(e2.info());
        }
        throw;
    }
}

BuildRoot::~BuildRoot()
{
    try {
        teardown();
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

void BuildRoot::attachDevices()
{
    /* Attach parents before the devices stacked on them. */
    auto pending = config.devices;
    while (!pending.empty()) {
        auto ready = std::find_if(pending.begin(), pending.end(), [&](const SandboxDevice & d) {
            return !d.parent
                   || std::any_of(devices.begin(), devices.end(), [&](auto & i) { return i.first == *d.parent; });
        });
        if (ready == pending.end())
            throw SandboxError("device '%s' has a missing or cyclic parent", pending.front().name);

        if (ready->type != "org.osbuild.loopback")
            throw SandboxError("device '%s' has unsupported type '%s'", ready->name, ready->type);

        LoopOptions options;
        try {
            options = parseLoopOptions(ready->options, config.tree);
        } catch (SandboxError &) {
            throw;
        } catch (Error & e) {
            throw SandboxError("invalid options for device '%s': %s", ready->name, e.message());
        }

        if (ready->parent)
            options.filename = device(*ready->parent).path;
        else if (options.filename.empty())
            throw SandboxError("device '%s' has no file name", ready->name);

        try {
            devices.emplace_back(ready->name, attachLoopDevice(options));
        } catch (SysError & e) {
            throw SandboxError("cannot attach device '%s': %s", ready->name, e.message());
        }

        pending.erase(ready);
    }
}

const LoopDevice & BuildRoot::device(const std::string & name) const
{
    for (auto & [n, dev] : devices)
        if (n == name)
            return dev;
    throw SandboxError("unknown device '%s'", name);
}

Path BuildRoot::programPath(const Path & hostProgram) const
{
    auto libDir = canonPath(config.libDir);
    auto program = canonPath(hostProgram);
    if (!isInDir(program, libDir))
        throw SandboxError("stage executable '%s' is not inside '%s'", hostProgram, libDir);
    return std::string(sandboxLib) + program.substr(libDir.size());
}

std::map<std::string, Path> BuildRoot::devicePaths() const
{
    std::map<std::string, Path> res;
    for (auto & [name, dev] : devices)
        res.emplace(name, dev.path);
    return res;
}

std::map<std::string, Path> BuildRoot::mountPaths() const
{
    std::map<std::string, Path> res;
    for (auto & m : config.mounts)
        res.emplace(m.name, canonPath(std::string(sandboxMounts) + "/" + m.target));
    return res;
}

Pid BuildRoot::start(StageCommand && command, Descriptor outputReadSide)
{
    if (childPid != -1)
        throw SandboxError("a sandbox can only run one stage");

    Pipe userNamespaceSync;
    userNamespaceSync.create();

    ProcessOptions options;
    options.cloneFlags = CLONE_NEWPID | CLONE_NEWNS | CLONE_NEWIPC | CLONE_NEWUTS | CLONE_NEWNET;
    if (usingUserNamespace)
        options.cloneFlags |= CLONE_NEWUSER;

    Pid pid = startProcess([&]() { runChild(command, userNamespaceSync); }, options);

    childPid = pid;

    command.stdinFd.close();
    command.outputFd.close();
    command.apiFd.close();
    userNamespaceSync.readSide.close();

    bool userNamespaceSyncDone = false;
    Finally cleanup([&]() {
        try {
            if (!userNamespaceSyncDone)
                writeFull(userNamespaceSync.writeSide.get(), "0\n");
        } catch (SysError & e) {
            debug("cannot abort sandbox set-up: %s", e.message());
        }
        userNamespaceSync.writeSide.close();
    });

    if (usingUserNamespace) {
        auto procPath = fmt("/proc/%d", (pid_t) pid);
        try {
            writeFile(procPath + "/uid_map", fmt("0 %d 1", getuid()));
            writeFile(procPath + "/setgroups", "deny");
            writeFile(procPath + "/gid_map", fmt("0 %d 1", getgid()));
        } catch (SysError & e) {
            throw SandboxError("cannot set up the user namespace of the sandbox: %s", e.message());
        }
    }

    writeFull(userNamespaceSync.writeSide.get(), "1\n");
    userNamespaceSyncDone = true;

    processSandboxSetupMessages(outputReadSide, pid);

    return pid;
}

void BuildRoot::runChild(StageCommand & command, Pipe & userNamespaceSync)
{
    bool sendException = true;

    try {
        userNamespaceSync.writeSide.close();

        if (dup2(command.outputFd.get(), STDOUT_FILENO) == -1 || dup2(command.outputFd.get(), STDERR_FILENO) == -1)
            throw SysError("cannot redirect the output of the stage");

        if (readLine(userNamespaceSync.readSide.get()) != "1")
            throw Error("user namespace initialisation failed");
        userNamespaceSync.readSide.close();

        enterSandbox();

        if (dup2(command.stdinFd.get(), STDIN_FILENO) == -1)
            throw SysError("cannot redirect the input of the stage");

        if (command.apiFd.get() == 3) {
            if (fcntl(3, F_SETFD, 0) == -1)
                throw SysError("cannot clear FD_CLOEXEC on the API channel");
        } else if (dup2(command.apiFd.get(), 3) == -1)
            throw SysError("cannot set up the API channel");

        unix::closeExtraFDs({3});

        dropCapabilities(config.capabilities);
        setupSeccomp(config.filterSyscalls, config.allowNewPrivileges);

        if (chdir("/") == -1)
            throw SysError("changing into '/'");

        Strings envStrings;
        for (auto & [name, value] : command.env)
            envStrings.push_back(name + "=" + value);

        Strings args(command.args);
        args.push_front(command.program);
        auto argv = stringsToCharPtrs(args);
        auto envp = stringsToCharPtrs(envStrings);

        writeFull(STDERR_FILENO, std::string("\2\n"));

        sendException = false;

        execve(command.program.c_str(), argv.data(), envp.data());

        throw SysError("executing '%s'", command.program);
    } catch (std::exception & e) {
        std::string msg = e.what();
        std::replace(msg.begin(), msg.end(), '\n', ' ');
        try {
            writeFull(STDERR_FILENO, sendException ? "\1\n" + msg + "\n" : msg + "\n");
        } catch (SysError &) {
            /* The output pipe is gone; the exit status is all the parent gets. */
        }
    }

    _exit(1);
}

void BuildRoot::enterSandbox()
{
    /* Initialise the loopback interface. */
    AutoCloseFD fd(socket(PF_INET, SOCK_DGRAM, IPPROTO_IP));
    if (!fd)
        throw SysError("cannot open IP socket");

    struct ifreq ifr;
    strcpy(ifr.ifr_name, "lo");
    ifr.ifr_flags = IFF_UP | IFF_LOOPBACK | IFF_RUNNING;
    if (ioctl(fd.get(), SIOCSIFFLAGS, &ifr) == -1)
        throw SysError("cannot set loopback interface flags");
    fd.close();

    char hostname[] = "localhost";
    if (sethostname(hostname, sizeof(hostname)) == -1)
        throw SysError("cannot set host name");

    makeMountsPrivate();

    auto root = stagingDir.path().string() + "/root";
    mountFilesystem("tmpfs", root, "tmpfs", 0, "mode=0755");

    setupMounts(root);

    if (chdir(root.c_str()) == -1)
        throw SysError("cannot change directory to '%1%'", root);

    if (mkdir("real-root", 0500) == -1)
        throw SysError("cannot create real-root directory");

    if (pivot_root(".", "real-root") == -1)
        throw SysError("cannot pivot old root directory onto '%1%'", root + "/real-root");

    if (chroot(".") == -1)
        throw SysError("cannot change root directory to '%1%'", root);

    if (umount2("real-root", MNT_DETACH) == -1)
        throw SysError("cannot unmount real root filesystem");

    if (rmdir("real-root") == -1)
        throw SysError("cannot remove real-root directory");

    remountReadOnly("/");
}

void BuildRoot::setupMounts(const Path & root)
{
    /* The read-only base. */
    if (config.buildTree) {
        for (auto & entry : std::filesystem::directory_iterator(*config.buildTree)) {
            auto name = entry.path().filename().string();
            if (sandboxOwnedDirs.count(name))
                continue;
            bindPath(entry.path().string(), root + "/" + name, true);
        }
    } else {
        for (auto & path : config.hostPaths)
            bindPath(path, root + path, true, true);
    }

    /* A minimal /dev. */
    auto dev = root + "/dev";
    mountFilesystem("tmpfs", dev, "tmpfs", MS_NOSUID | MS_NOEXEC, "mode=0755");
    for (auto name : {"null", "zero", "full", "random", "urandom", "tty"})
        bindPath(fmt("/dev/%s", name), fmt("%s/%s", dev, name), false, true);
    createSymlink("/proc/self/fd", dev + "/fd");
    createSymlink("/proc/self/fd/0", dev + "/stdin");
    createSymlink("/proc/self/fd/1", dev + "/stdout");
    createSymlink("/proc/self/fd/2", dev + "/stderr");

    createDirs(dev + "/pts");
    if (mount("devpts", (dev + "/pts").c_str(), "devpts", 0, "newinstance,ptmxmode=0666,mode=0620") == 0)
        createSymlink("pts/ptmx", dev + "/ptmx");
    else
        debug("cannot mount devpts in the sandbox: %s", strerror(errno));

    mountFilesystem("tmpfs", dev + "/shm", "tmpfs", MS_NOSUID | MS_NODEV);

    for (auto & [name, loop] : devices) {
        bindPath(loop.path, root + loop.path);
        /* Partitions found by partscan. */
        for (auto & entry : std::filesystem::directory_iterator("/dev")) {
            auto node = entry.path().string();
            if (hasPrefix(node, loop.path + "p"))
                bindPath(node, root + node);
        }
    }

    /* The stage's view of the build. */
    createDirs(root + std::string(sandboxApi));
    bindPath(config.tree, root + std::string(sandboxTree));
    for (auto & [name, path] : config.inputs)
        bindPath(path, root + std::string(sandboxInputs) + "/" + name, true);
    bindPath(config.libDir, root + std::string(sandboxLib), true);
    createDirs(root + std::string(sandboxMounts));

    /* Parents before children. */
    auto mounts = config.mounts;
    std::stable_sort(mounts.begin(), mounts.end(), [](const SandboxMount & a, const SandboxMount & b) {
        return std::count(a.target.begin(), a.target.end(), '/') < std::count(b.target.begin(), b.target.end(), '/');
    });

    for (auto & m : mounts) {
        auto target = canonPath(root + std::string(sandboxMounts) + "/" + m.target);
        auto fsType = filesystemType(m.type);
        if (fsType.empty()) {
            createDirs(target);
            continue;
        }
        auto source = device(m.source).path;
        if (m.partition)
            source += "p" + *m.partition;
        auto flags = toMountFlags(translateMountOptions(m.options));
        try {
            mountFilesystem(source, target, fsType, flags.flags, flags.data);
        } catch (SysError & e) {
            throw SandboxError("cannot mount '%s': %s", m.name, e.message());
        }
    }

    mountFilesystem("proc", root + "/proc", "proc", MS_NOSUID | MS_NODEV | MS_NOEXEC);
    mountFilesystem("tmpfs", root + "/tmp", "tmpfs", MS_NOSUID | MS_NODEV, "mode=1777");
}

Path BuildRoot::attachLoop(const nlohmann::json & options)
{
    if (!privileged)
        throw SandboxError("loop devices can only be attached when running as root");
    if (childPid == -1)
        throw SandboxError("the sandbox is not running");

    auto loop = attachLoopDevice(parseLoopOptions(options, config.tree));
    auto path = loop.path;

    /* Make the node visible in the stage's private /dev. */
    auto node = fmt("/proc/%d/root%s", childPid, path);
    if (mknod(node.c_str(), S_IFBLK | 0660, loop.rdev) == -1 && errno != EEXIST) {
        auto err = errno;
        detachLoopDevice(loop);
        throw SysError(err, "creating device node '%s' in the sandbox", path);
    }

    apiDevices.emplace(path, std::move(loop));
    return path;
}

void BuildRoot::detachLoop(const Path & device)
{
    auto i = apiDevices.find(device);
    if (i == apiDevices.end())
        throw SandboxError("'%s' was not attached by this stage", device);

    detachLoopDevice(i->second);
    apiDevices.erase(i);

    if (childPid != -1) {
        auto node = fmt("/proc/%d/root%s", childPid, device);
        if (unlink(node.c_str()) == -1 && errno != ENOENT)
            debug("cannot remove '%s' from the sandbox: %s", device, strerror(errno));
    }
}

void BuildRoot::teardown()
{
    if (tornDown)
        return;
    tornDown = true;

    Strings errors;

    for (auto & [path, loop] : apiDevices)
        try {
            detachLoopDevice(loop);
        } catch (Error & e) {
            errors.push_back(e.message());
        }
    apiDevices.clear();

    for (auto i = devices.rbegin(); i != devices.rend(); ++i)
        try {
            detachLoopDevice(i->second);
        } catch (Error & e) {
            errors.push_back(e.message());
        }
    devices.clear();

    if (!stagingDir.path().empty())
        try {
            deletePath(stagingDir.path());
            stagingDir.cancel();
        } catch (Error & e) {
            errors.push_back(e.message());
        }

    if (!errors.empty())
        throw SandboxError("tearing down the sandbox failed: %s", concatStringsSep("; ", errors));
}

} // namespace arbor
