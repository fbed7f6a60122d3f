#include "arbor/store/object-store.hh"
#include "arbor/util/finally.hh"
#include "arbor/util/logging.hh"
#include "arbor/util/strings.hh"

#include <algorithm>
#include <ctime>

#include <signal.h>

namespace arbor {

namespace fs = std::filesystem;

static void checkFingerprint(std::string_view fingerprint)
{
    if (fingerprint.empty()
        || !std::all_of(fingerprint.begin(), fingerprint.end(), [](char c) { return isalnum((unsigned char) c); }))
        throw CacheError("'%s' is not a valid object fingerprint", fingerprint);
}

std::unique_ptr<ObjectStore> ObjectStore::open(const fs::path & rootDir)
{
    auto store = std::make_unique<ObjectStore>(rootDir);
    try {
        createDirs(store->objectsDir());
        createDirs(store->tempDir());
        createDirs(store->locksDir());
        createDirs(store->sourcesDir());
    } catch (SystemError & e) {
        throw CacheError("cannot open object store '%s': %s", rootDir.string(), e.message());
    }
    return store;
}

ObjectStore::ObjectStore(const fs::path & rootDir)
    : rootDir_(absPath(rootDir.string()))
{
}

std::optional<ObjectStore::Entry> ObjectStore::lookup(const std::string & fingerprint) const
{
    checkFingerprint(fingerprint);

    auto dir = objectsDir() / fingerprint;
    if (!maybeLstat(dir.string()))
        return std::nullopt;

    Entry entry{.fingerprint = fingerprint, .treePath = dir / "tree"};

    try {
        entry.metadata = nlohmann::json::parse(readFile((dir / "meta.json").string()));
    } catch (nlohmann::json::exception & e) {
        throw CacheError("metadata of store object '%s' is corrupt: %s", fingerprint, e.what());
    } catch (SystemError & e) {
        throw CacheError("cannot read metadata of store object '%s': %s", fingerprint, e.message());
    }

    if (!entry.metadata.is_object())
        throw CacheError("metadata of store object '%s' is not a JSON object", fingerprint);

    auto st = maybeLstat(entry.treePath.string());
    if (!st || !S_ISDIR(st->st_mode))
        throw CacheError("store object '%s' has no tree", fingerprint);

    return entry;
}

ObjectStore::Reservation ObjectStore::reserve(const std::string & fingerprint)
{
    if (auto entry = lookup(fingerprint))
        return {.entry = std::move(entry)};

    if (auto entry = reservations.claim(fingerprint)) {
        debug("object '%s' was built by another worker", fingerprint);
        return {.entry = std::move(entry)};
    }

    try {
        PathLocks lock(
            {locksDir() / fingerprint}, fmt("waiting for another process to finish building '%s'...", fingerprint));

        /* Another process may have committed it while we waited for
           the lock. */
        if (auto entry = lookup(fingerprint)) {
            reservations.complete(fingerprint, *entry);
            lock.setDeletion(true);
            return {.entry = std::move(entry)};
        }

        return {.ticket = std::unique_ptr<Ticket>(new Ticket(*this, fingerprint, std::move(lock)))};
    } catch (...) {
        reservations.abandon(fingerprint);
        throw;
    }
}

void ObjectStore::materialize(const Entry & entry, const fs::path & dest) const
{
    try {
        copyTree(entry.treePath, dest);
    } catch (SystemError & e) {
        throw CacheError("cannot copy store object '%s' to '%s': %s", entry.fingerprint, dest.string(), e.message());
    }
}

void ObjectStore::clearTemp()
{
    std::error_code ec;
    for (auto & i : fs::directory_iterator(tempDir(), ec)) {
        auto name = i.path().filename().string();

        /* Staging directories are named `<prefix>-<pid>-<n>`; keep
           those whose owner is still alive. */
        auto fields = tokenizeString<std::vector<std::string>>(name, "-");
        if (fields.size() >= 3) {
            auto pid = string2Int<pid_t>(fields[fields.size() - 2]);
            if (pid && (*pid == getpid() || kill(*pid, 0) == 0 || errno == EPERM))
                continue;
        }

        debug("removing stale staging directory '%s'", i.path().string());
        deletePath(i.path());
    }
    if (ec)
        throw CacheError("cannot read '%s': %s", tempDir().string(), ec.message());
}

ObjectStore::Ticket::Ticket(ObjectStore & store, std::string fingerprint, PathLocks && lock)
    : store(store)
    , fingerprint_(std::move(fingerprint))
    , staging(createTempDir(store.tempDir().string(), "stage"), true)
    , lock(std::move(lock))
{
    createDirs(treePath());
}

ObjectStore::Ticket::~Ticket()
{
    try {
        if (!finished)
            discard();
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

ObjectStore::Entry ObjectStore::Ticket::commit(nlohmann::json metadata)
{
    if (finished)
        throw CacheError("reservation of '%s' was already released", fingerprint_);

    if (!metadata.is_object())
        throw CacheError("metadata of '%s' must be a JSON object", fingerprint_);

    metadata["fingerprint"] = fingerprint_;
    metadata["created"] = (uint64_t) time(nullptr);

    auto dest = store.objectsDir() / fingerprint_;

    try {
        writeFile((staging.path() / "meta.json").string(), metadata.dump(2), 0644, true);
        renameFile(staging.path().string(), dest.string());
        staging.cancel();
        syncParent(dest.string());
    } catch (SysError & e) {
        if (e.errNo != EEXIST && e.errNo != ENOTEMPTY)
            throw CacheError("cannot commit store object '%s': %s", fingerprint_, e.message());
        debug("store object '%s' was committed concurrently; dropping our copy", fingerprint_);
        deletePath(staging.path());
        staging.cancel();
    }

    auto entry = store.lookup(fingerprint_);
    if (!entry)
        throw CacheError("store object '%s' disappeared after commit", fingerprint_);

    finished = true;
    store.reservations.complete(fingerprint_, *entry);
    lock.setDeletion(true);
    lock.unlock();

    return *entry;
}

void ObjectStore::Ticket::discard()
{
    if (finished)
        return;
    finished = true;

    debug("discarding build of '%s'", fingerprint_);

    Finally wake([&]() { store.reservations.abandon(fingerprint_); });

    deletePath(staging.path());
    staging.cancel();
    lock.setDeletion(true);
    lock.unlock();
}

} // namespace arbor
