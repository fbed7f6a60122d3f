#pragma once
///@file

#include "arbor/store/pathlocks.hh"
#include "arbor/store/reservation.hh"
#include "arbor/util/file-system.hh"

#include <filesystem>
#include <memory>
#include <optional>

#include <nlohmann/json.hpp>

namespace arbor {

/**
 * The store is corrupt or could not be read or written.
 */
MakeError(CacheError, Error);

/**
 * A content-addressed cache of committed trees, keyed by stage
 * fingerprint. Entries are published by a single `rename(2)` and are
 * never modified afterwards.
 */
class ObjectStore
{
public:

    struct Entry
    {
        std::string fingerprint;
        std::filesystem::path treePath;
        nlohmann::json metadata;
    };

    /**
     * The right to build one fingerprint. The tree is assembled in
     * `treePath()`, a private staging directory, and published by
     * `commit()`. A ticket that is destroyed without being committed
     * discards its staging data and wakes any waiters.
     */
    class Ticket
    {
        friend class ObjectStore;

        ObjectStore & store;
        std::string fingerprint_;
        AutoDelete staging;
        PathLocks lock;
        bool finished = false;

        Ticket(ObjectStore & store, std::string fingerprint, PathLocks && lock);

    public:

        Ticket(const Ticket &) = delete;
        Ticket & operator=(const Ticket &) = delete;

        ~Ticket();

        const std::string & fingerprint() const
        {
            return fingerprint_;
        }

        std::filesystem::path treePath() const
        {
            return staging.path() / "tree";
        }

        /**
         * Publish the staging tree with `metadata` (merged into
         * `meta.json`). If another writer already published this
         * fingerprint, its entry is returned and the staging data is
         * dropped.
         */
        Entry commit(nlohmann::json metadata = nlohmann::json::object());

        void discard();
    };

    /**
     * Either an existing entry (a cache hit, possibly produced by a
     * concurrent builder) or a ticket to build it.
     */
    struct Reservation
    {
        std::optional<Entry> entry;
        std::unique_ptr<Ticket> ticket;
    };

    /**
     * Open the store rooted at `rootDir`, creating its layout if
     * necessary.
     */
    static std::unique_ptr<ObjectStore> open(const std::filesystem::path & rootDir);

    explicit ObjectStore(const std::filesystem::path & rootDir);

    ObjectStore(const ObjectStore &) = delete;

    const std::filesystem::path & rootDir() const
    {
        return rootDir_;
    }

    std::filesystem::path objectsDir() const
    {
        return rootDir_ / "objects";
    }

    std::filesystem::path tempDir() const
    {
        return rootDir_ / "tmp";
    }

    std::filesystem::path locksDir() const
    {
        return rootDir_ / "locks";
    }

    std::filesystem::path sourcesDir() const
    {
        return rootDir_ / "sources";
    }

    /**
     * Return the committed entry for `fingerprint`, if any.
     *
     * @throws CacheError if the entry exists but is damaged.
     */
    std::optional<Entry> lookup(const std::string & fingerprint) const;

    /**
     * Reserve `fingerprint` for building. At most one ticket per
     * fingerprint exists at any time, both within this process and
     * across processes sharing the store. Other callers block until the
     * holder commits, and then receive its entry.
     *
     * @throws BuildAbandoned if the holder discarded its ticket while
     * we were waiting.
     */
    Reservation reserve(const std::string & fingerprint);

    /**
     * Copy the tree of `entry` to `dest`, reflinking where the file
     * system supports it.
     */
    void materialize(const Entry & entry, const std::filesystem::path & dest) const;

    /**
     * Remove staging directories left behind by crashed runs.
     */
    void clearTemp();

private:

    std::filesystem::path rootDir_;

    Reservations<Entry> reservations;
};

} // namespace arbor
