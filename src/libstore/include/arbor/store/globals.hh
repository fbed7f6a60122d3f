#pragma once
///@file

#include <sys/types.h>

#include "arbor/util/types.hh"
#include "arbor/util/configuration.hh"

namespace arbor {

class Settings : public Config
{

    static unsigned int getDefaultCores();

public:

    Settings();

    /**
     * The directory holding `arbor.conf`; `$ARBOR_CONF_DIR` or
     * `/etc/arbor`.
     */
    Path arborConfDir;

    PathSetting storeDir{
        this,
        "/var/cache/arbor",
        "store",
        R"(
          The root of the object store. Committed trees live below
          `objects/`, downloaded sources below `sources/`.
        )"};

    PathSetting libDir{
        this,
        "/usr/lib/arbor",
        "libdir",
        R"(
          The directory containing the stage executables (`stages/`)
          and their descriptors. It is bind-mounted read-only into every
          sandbox at `/run/arbor/lib`.
        )"};

    Setting<unsigned int> maxJobs{
        this,
        getDefaultCores(),
        "max-jobs",
        R"(
          The maximum number of pipelines that are built in parallel.
          Stages within one pipeline always run sequentially.
        )",
        {"j"}};

    Setting<unsigned int> sourceFetchJobs{
        this,
        4,
        "source-fetch-jobs",
        "The maximum number of sources that are downloaded in parallel."};

    Setting<unsigned int> stageTimeout{
        this,
        0,
        "stage-timeout",
        R"(
          The number of seconds a single stage may run before it is
          killed and reported as failed. `0` disables the timeout.
        )"};

    Setting<unsigned int> maxLogLines{
        this,
        100,
        "max-log-lines",
        "The number of lines of stage output kept for error reports."};

    Setting<bool> filterSyscalls{
        this,
        true,
        "filter-syscalls",
        R"(
          Whether to prevent stages from calling system calls that
          affect the host kernel, such as `kexec_load`, `init_module`
          or `reboot`.
        )"};

    Setting<bool> allowNewPrivileges{
        this,
        false,
        "allow-new-privileges",
        R"(
          Whether stages may acquire new privileges by executing
          setuid binaries. When disabled, `PR_SET_NO_NEW_PRIVS` is set
          in the sandbox.
        )"};

    Setting<StringSet> sandboxCapabilities{
        this,
        {"CAP_CHOWN",
         "CAP_DAC_OVERRIDE",
         "CAP_FOWNER",
         "CAP_FSETID",
         "CAP_SETGID",
         "CAP_SETUID",
         "CAP_MKNOD",
         "CAP_SETFCAP",
         "CAP_SYS_CHROOT",
         "CAP_AUDIT_WRITE"},
        "sandbox-capabilities",
        "The capabilities every stage keeps in its bounding set."};

    Setting<StringSet> sandboxExtraCapabilities{
        this,
        {"CAP_MAC_ADMIN", "CAP_MAC_OVERRIDE", "CAP_SYS_ADMIN", "CAP_LINUX_IMMUTABLE"},
        "sandbox-extra-capabilities",
        R"(
          Additional capabilities a stage may request through its
          descriptor. A request for anything outside this list and
          `sandbox-capabilities` fails the build before the stage is
          started.
        )"};

    Setting<Strings> sandboxHostPaths{
        this,
        {"/usr", "/bin", "/sbin", "/lib", "/lib64", "/etc"},
        "sandbox-host-paths",
        R"(
          Host directories bound read-only into the sandbox root of
          pipelines that have no `build` pipeline.
        )"};

    Setting<unsigned long> connectTimeout{
        this,
        0,
        "connect-timeout",
        R"(
          The timeout (in seconds) for establishing connections when
          downloading sources. `0` uses curl's default.
        )"};

    Setting<unsigned long> stalledDownloadTimeout{
        this,
        300,
        "stalled-download-timeout",
        R"(
          The timeout (in seconds) for receiving data from servers
          during a download. Downloads that receive no data for this
          long are aborted and retried.
        )"};

    Setting<unsigned int> downloadAttempts{
        this,
        5,
        "download-attempts",
        "The number of times a source download is attempted before it fails."};

    Setting<unsigned int> downloadRetryBaseMs{
        this,
        250,
        "download-retry-base-ms",
        "The initial delay between download attempts; it doubles on every retry."};
};

/**
 * The global settings object, loaded by `initArbor()`.
 */
extern Settings settings;

/**
 * Load `arbor.conf` and `ARBOR_*` environment variables into `config`.
 */
void loadConfFile(Config & config);

void initLibStore(bool loadConfig = true);

} // namespace arbor
