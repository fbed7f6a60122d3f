#include "arbor/store/source-cache.hh"
#include "arbor/store/pathlocks.hh"
#include "arbor/util/file-system.hh"
#include "arbor/util/finally.hh"
#include "arbor/util/logging.hh"

namespace arbor {

namespace fs = std::filesystem;

SourceCache::SourceCache(const fs::path & rootDir)
    : rootDir_(absPath(rootDir.string()))
{
    createDirs(tempDir());
}

fs::path SourceCache::pathFor(const Hash & checksum) const
{
    return rootDir_ / std::string(printHashAlgo(checksum.algo)) / checksum.to_string(false);
}

std::optional<SourceCache::Entry> SourceCache::lookup(const Hash & checksum) const
{
    auto path = pathFor(checksum);
    if (!pathExists(path.string()))
        return std::nullopt;
    return Entry{.checksum = checksum, .path = path};
}

SourceCache::Entry SourceCache::add(const Hash & checksum, const Fetcher & fetch)
{
    if (auto entry = lookup(checksum))
        return *entry;

    auto key = checksum.to_string();

    if (auto entry = reservations.claim(key))
        return *entry;

    try {
        auto lockPath =
            tempDir() / fmt("%s-%s.lock", printHashAlgo(checksum.algo), checksum.to_string(false));
        auto fd = acquireExclusiveFileLock(lockPath, 0, key);
        Finally releaseLock([&]() { deleteLockFile(lockPath, fd.get()); });

        if (auto entry = lookup(checksum)) {
            reservations.complete(key, *entry);
            return *entry;
        }

        AutoDelete staging(createTempDir(tempDir().string(), "fetch"), true);
        auto tmpFile = staging.path() / "data";

        fetch(tmpFile);

        auto actual = hashFile(checksum.algo, tmpFile.string());
        if (actual != checksum)
            throw ChecksumMismatch(
                "checksum mismatch for source '%s': got '%s'", key, actual.to_string());

        if (chmod(tmpFile.c_str(), 0444) == -1)
            throw SysError("making '%s' read-only", tmpFile.string());

        auto dest = pathFor(checksum);
        createDirs(dest.parent_path());
        renameFile(tmpFile.string(), dest.string());

        debug("added source '%s' to the cache", key);

        Entry entry{.checksum = checksum, .path = dest};
        reservations.complete(key, entry);
        return entry;
    } catch (...) {
        reservations.abandon(key);
        throw;
    }
}

} // namespace arbor
