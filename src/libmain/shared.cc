#include "arbor/main/shared.hh"
#include "arbor/store/globals.hh"
#include "arbor/util/ansicolor.hh"
#include "arbor/util/file-system.hh"
#include "arbor/util/logging.hh"
#include "arbor/util/signals.hh"

#include <iostream>

#include <signal.h>
#include <sys/stat.h>

namespace arbor {

const std::string arborVersion = ARBOR_VERSION;

static void setDisposition(int signo, void (*handler)(int))
{
    struct sigaction act = {};
    sigemptyset(&act.sa_mask);
    act.sa_handler = handler;
    if (sigaction(signo, &act, nullptr) == -1)
        throw SysError("setting the disposition of signal %d", signo);
}

void initArbor(bool loadConfig)
{
    initLibStore(loadConfig);

    startSignalHandlerThread();

    /* The disposition of these is inherited from whoever started us.
       Stages are reaped explicitly, and a stage that closes its end of
       a pipe must give us EPIPE rather than kill us. */
    setDisposition(SIGCHLD, SIG_DFL);
    setDisposition(SIGPIPE, SIG_IGN);

    umask(0022);
}

void printVersion(const std::string & programName)
{
    std::cout << programName << " (arbor) " << arborVersion << std::endl;

    if (verbosity > lvlInfo) {
        std::cout << fmt("Configuration file: %s/arbor.conf\n", settings.arborConfDir)
                  << fmt("Store directory: %s\n", settings.storeDir.get())
                  << fmt("Library directory: %s\n", settings.libDir.get());
    }

    throw Exit();
}

int handleExceptions(const std::string & programName, std::function<void()> fun)
{
    ErrorInfo::programName = std::string(baseNameOf(programName));

    const std::string prefix = ANSI_RED "error:" ANSI_NORMAL " ";

    try {
        try {
            fun();
        } catch (...) {
            /* A pending interrupt would make the printing below throw. */
            setInterruptThrown();
            throw;
        }
        return 0;
    } catch (Exit & e) {
        return e.status;
    } catch (UsageError & e) {
        logError(e.info());
        printError("Try '%1% --help' for more information.", programName);
        return 2;
    } catch (BaseError & e) {
        logError(e.info());
        return e.info().status;
    } catch (std::bad_alloc &) {
        printError(prefix + "out of memory");
    } catch (std::exception & e) {
        printError(prefix + e.what());
    }

    return 1;
}

} // namespace arbor
