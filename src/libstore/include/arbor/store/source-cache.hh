#pragma once
///@file

#include "arbor/store/reservation.hh"
#include "arbor/util/hash.hh"

#include <filesystem>
#include <functional>
#include <optional>

namespace arbor {

/**
 * A source could not be obtained or did not have the expected
 * checksum.
 */
MakeError(SourceFetchError, Error);
MakeError(ChecksumMismatch, SourceFetchError);

/**
 * A cache of externally fetched content, keyed by checksum. The
 * content of `<algo>/<hex>` always hashes to `<algo>:<hex>`: files are
 * verified in a staging area before they are renamed into place.
 */
class SourceCache
{
public:

    struct Entry
    {
        Hash checksum;
        std::filesystem::path path;
    };

    /**
     * Called with a path that does not exist yet; must create it as a
     * regular file holding the content.
     */
    typedef std::function<void(const std::filesystem::path & dest)> Fetcher;

    explicit SourceCache(const std::filesystem::path & rootDir);

    const std::filesystem::path & rootDir() const
    {
        return rootDir_;
    }

    std::filesystem::path pathFor(const Hash & checksum) const;

    std::optional<Entry> lookup(const Hash & checksum) const;

    /**
     * Return the entry for `checksum`, calling `fetch` to obtain it if
     * it is not cached. Concurrent calls for the same checksum, in
     * this or another process, fetch only once.
     *
     * @throws ChecksumMismatch if the fetched content does not match.
     */
    Entry add(const Hash & checksum, const Fetcher & fetch);

private:

    std::filesystem::path rootDir_;

    std::filesystem::path tempDir() const
    {
        return rootDir_ / "tmp";
    }

    Reservations<Entry> reservations;
};

} // namespace arbor
