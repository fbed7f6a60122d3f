#include "arbor/store/globals.hh"
#include "arbor/util/file-system.hh"
#include "arbor/util/logging.hh"

#include <algorithm>
#include <thread>

#include <curl/curl.h>

namespace arbor {

Settings settings;

static std::string getConfDir()
{
    auto dir = getenv("ARBOR_CONF_DIR");
    return dir && *dir ? dir : "/etc/arbor";
}

Settings::Settings()
    : arborConfDir(canonPath(getConfDir()))
{
}

unsigned int Settings::getDefaultCores()
{
    return std::max(1U, std::thread::hardware_concurrency());
}

void loadConfFile(Config & config)
{
    auto path = settings.arborConfDir + "/arbor.conf";
    if (pathExists(path)) {
        try {
            config.applyConfig(readFile(path), path);
        } catch (Error & e) {
            e.addTrace("while loading configuration file '%s'", path);
            throw;
        }
    }

    config.applyEnvironment("ARBOR_");
}

static bool initLibStoreDone = false;

void initLibStore(bool loadConfig)
{
    if (initLibStoreDone)
        return;

    if (loadConfig)
        loadConfFile(settings);

    /* Initialise curl before any thread or child process uses it. */
    curl_global_init(CURL_GLOBAL_ALL);

    initLibStoreDone = true;
}

} // namespace arbor
