#include <gtest/gtest.h>

#include "arbor/store/object-store.hh"
#include "arbor/util/file-system.hh"
#include "arbor/util/processes.hh"

#include <atomic>
#include <thread>

#include <sys/stat.h>
#include <unistd.h>

namespace arbor {

class ObjectStoreTest : public ::testing::Test
{
    std::unique_ptr<AutoDelete> delTmpDir;

protected:
    Path tmpDir;
    std::unique_ptr<ObjectStore> store;

    void SetUp() override
    {
        tmpDir = createTempDir();
        delTmpDir = std::make_unique<AutoDelete>(tmpDir, true);
        store = ObjectStore::open(tmpDir + "/store");
    }

    void TearDown() override
    {
        store.reset();
        delTmpDir.reset();
    }

    ObjectStore::Entry commitFile(const std::string & fingerprint, const std::string & content)
    {
        auto res = store->reserve(fingerprint);
        EXPECT_FALSE(res.entry);
        writeFile((res.ticket->treePath() / "file").string(), content);
        return res.ticket->commit({{"stage", "org.osbuild.noop"}});
    }
};

TEST_F(ObjectStoreTest, openCreatesLayout)
{
    ASSERT_TRUE(pathExists(store->objectsDir().string()));
    ASSERT_TRUE(pathExists(store->tempDir().string()));
    ASSERT_TRUE(pathExists(store->locksDir().string()));
    ASSERT_TRUE(pathExists(store->sourcesDir().string()));
}

TEST_F(ObjectStoreTest, lookupOfUnknownFingerprint)
{
    ASSERT_FALSE(store->lookup("0123abcd"));
}

TEST_F(ObjectStoreTest, commitPublishesTreeAndMetadata)
{
    auto entry = commitFile("abc123", "hello");

    ASSERT_EQ(entry.fingerprint, "abc123");
    ASSERT_EQ(readFile((entry.treePath / "file").string()), "hello");
    ASSERT_EQ(entry.metadata["stage"], "org.osbuild.noop");
    ASSERT_EQ(entry.metadata["fingerprint"], "abc123");
    ASSERT_TRUE(entry.metadata.contains("created"));

    auto found = store->lookup("abc123");
    ASSERT_TRUE(found);
    ASSERT_EQ(found->treePath, entry.treePath);
    ASSERT_EQ(found->metadata, entry.metadata);
}

TEST_F(ObjectStoreTest, reserveReturnsCommittedEntry)
{
    commitFile("abc123", "hello");

    auto res = store->reserve("abc123");

    ASSERT_TRUE(res.entry);
    ASSERT_FALSE(res.ticket);
    ASSERT_EQ(readFile((res.entry->treePath / "file").string()), "hello");
}

TEST_F(ObjectStoreTest, discardLeavesNothingBehind)
{
    {
        auto res = store->reserve("abc123");
        ASSERT_TRUE(res.ticket);
        writeFile((res.ticket->treePath() / "file").string(), "partial");
        res.ticket->discard();
    }

    ASSERT_FALSE(store->lookup("abc123"));
    ASSERT_TRUE(std::filesystem::is_empty(store->tempDir()));

    /* The fingerprint can be built again. */
    auto res = store->reserve("abc123");
    ASSERT_TRUE(res.ticket);
}

TEST_F(ObjectStoreTest, destroyedTicketIsDiscarded)
{
    {
        auto res = store->reserve("abc123");
        ASSERT_TRUE(res.ticket);
    }

    ASSERT_FALSE(store->lookup("abc123"));
    ASSERT_TRUE(store->reserve("abc123").ticket);
}

TEST_F(ObjectStoreTest, invalidFingerprintIsRejected)
{
    ASSERT_THROW(store->lookup(""), CacheError);
    ASSERT_THROW(store->lookup("../etc"), CacheError);
    ASSERT_THROW(store->reserve("a/b"), CacheError);
}

TEST_F(ObjectStoreTest, corruptMetadataIsCacheError)
{
    auto entry = commitFile("abc123", "hello");
    auto meta = store->objectsDir() / "abc123" / "meta.json";
    chmod(meta.c_str(), 0644);
    writeFile(meta.string(), "{ not json");

    ASSERT_THROW(store->lookup("abc123"), CacheError);
}

TEST_F(ObjectStoreTest, missingTreeIsCacheError)
{
    createDirs((store->objectsDir() / "abc123").string());
    writeFile((store->objectsDir() / "abc123" / "meta.json").string(), "{}");

    ASSERT_THROW(store->lookup("abc123"), CacheError);
}

TEST_F(ObjectStoreTest, materializeCopiesTree)
{
    auto entry = commitFile("abc123", "hello");

    store->materialize(entry, tmpDir + "/out");

    ASSERT_EQ(readFile(tmpDir + "/out/file"), "hello");

    /* The copy does not alias the store. */
    writeFile(tmpDir + "/out/file", "changed");
    ASSERT_EQ(readFile((entry.treePath / "file").string()), "hello");
}

TEST_F(ObjectStoreTest, concurrentReserveBuildsOnce)
{
    std::atomic<int> builds{0};
    std::vector<std::thread> threads;
    std::vector<std::string> contents(4);

    for (size_t i = 0; i < contents.size(); ++i)
        threads.emplace_back([&, i]() {
            auto res = store->reserve("shared");
            if (res.ticket) {
                ++builds;
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
                writeFile((res.ticket->treePath() / "file").string(), "built");
                res.entry = res.ticket->commit();
            }
            contents[i] = readFile((res.entry->treePath / "file").string());
        });

    for (auto & t : threads)
        t.join();

    ASSERT_EQ(builds.load(), 1);
    for (auto & c : contents)
        ASSERT_EQ(c, "built");
}

TEST_F(ObjectStoreTest, waitersSeeAbandonedBuild)
{
    auto res = store->reserve("shared");
    ASSERT_TRUE(res.ticket);

    std::atomic<bool> abandoned{false};
    std::thread waiter([&]() {
        try {
            store->reserve("shared");
        } catch (BuildAbandoned &) {
            abandoned = true;
        }
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    res.ticket->discard();
    waiter.join();

    ASSERT_TRUE(abandoned);
}

TEST_F(ObjectStoreTest, clearTempRemovesStaleStagingDirectories)
{
    /* No process has pid 0x7fffffff. */
    auto stale = store->tempDir() / "stage-2147483647-1";
    createDirs(stale.string());

    auto res = store->reserve("abc123");
    ASSERT_TRUE(res.ticket);

    store->clearTemp();

    ASSERT_FALSE(pathExists(stale.string()));
    ASSERT_TRUE(pathExists(res.ticket->treePath().string()));
}

TEST_F(ObjectStoreTest, crashBeforeCommitLeavesNoEntry)
{
    /* The child dies holding a filled staging tree, without committing,
       discarding or running any destructor. */
    Pid pid = startProcess([&]() {
        auto res = store->reserve("abc123");
        writeFile((res.ticket->treePath() / "file").string(), "built but never committed");
        _exit(0);
    });
    ASSERT_EQ(pid.wait(), 0);

    ASSERT_FALSE(store->lookup("abc123"));
    ASSERT_FALSE(std::filesystem::is_empty(store->tempDir()));

    store->clearTemp();
    ASSERT_TRUE(std::filesystem::is_empty(store->tempDir()));

    /* The dead builder's lock does not block a new one. */
    auto res = store->reserve("abc123");
    ASSERT_TRUE(res.ticket);
    ASSERT_FALSE(res.entry);
}

} // namespace arbor
