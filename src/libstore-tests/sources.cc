#include <gtest/gtest.h>

#include "arbor/store/sources.hh"
#include "arbor/util/file-system.hh"

#include <atomic>
#include <thread>

#include <sys/stat.h>

namespace arbor {

class SourceCacheTest : public ::testing::Test
{
    std::unique_ptr<AutoDelete> delTmpDir;

protected:
    Path tmpDir;
    std::unique_ptr<SourceCache> cache;

    Hash helloHash = hashString(HashAlgorithm::SHA256, "hello");

    void SetUp() override
    {
        tmpDir = createTempDir();
        delTmpDir = std::make_unique<AutoDelete>(tmpDir, true);
        cache = std::make_unique<SourceCache>(tmpDir + "/sources");
    }

    void TearDown() override
    {
        cache.reset();
        delTmpDir.reset();
    }
};

TEST_F(SourceCacheTest, pathIsDerivedFromChecksum)
{
    ASSERT_EQ(
        cache->pathFor(helloHash).string(),
        tmpDir + "/sources/sha256/2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824");
}

TEST_F(SourceCacheTest, addStoresVerifiedContent)
{
    ASSERT_FALSE(cache->lookup(helloHash));

    auto entry = cache->add(helloHash, [](const std::filesystem::path & dest) { writeFile(dest.string(), "hello"); });

    ASSERT_EQ(entry.path, cache->pathFor(helloHash));
    ASSERT_EQ(readFile(entry.path.string()), "hello");
    ASSERT_EQ(lstat(entry.path.string()).st_mode & 0222, 0u);
    ASSERT_TRUE(cache->lookup(helloHash));
}

TEST_F(SourceCacheTest, cachedContentIsNotFetchedAgain)
{
    int fetches = 0;
    auto fetch = [&](const std::filesystem::path & dest) {
        ++fetches;
        writeFile(dest.string(), "hello");
    };

    cache->add(helloHash, fetch);
    cache->add(helloHash, fetch);

    ASSERT_EQ(fetches, 1);
}

TEST_F(SourceCacheTest, mismatchIsRejected)
{
    ASSERT_THROW(
        cache->add(helloHash, [](const std::filesystem::path & dest) { writeFile(dest.string(), "goodbye"); }),
        ChecksumMismatch);

    ASSERT_FALSE(cache->lookup(helloHash));
}

TEST_F(SourceCacheTest, concurrentAddsFetchOnce)
{
    std::atomic<int> fetches{0};
    std::vector<std::thread> threads;

    for (int i = 0; i < 4; ++i)
        threads.emplace_back([&]() {
            cache->add(helloHash, [&](const std::filesystem::path & dest) {
                ++fetches;
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
                writeFile(dest.string(), "hello");
            });
        });

    for (auto & t : threads)
        t.join();

    ASSERT_EQ(fetches.load(), 1);
}

/* ----------------------------------------------------------------------------
 * Fetchers
 * --------------------------------------------------------------------------*/

TEST_F(SourceCacheTest, inlineSourceIsDecoded)
{
    auto fetcher = makeInlineSourceFetcher();
    SourceItem item{.type = "org.osbuild.inline", .checksum = helloHash, .encoding = "base64", .data = "aGVsbG8="};

    fetcher->fetch(item, tmpDir + "/out");

    ASSERT_EQ(readFile(tmpDir + "/out"), "hello");
}

TEST_F(SourceCacheTest, inlineSourceRejectsUnknownEncoding)
{
    auto fetcher = makeInlineSourceFetcher();
    SourceItem item{.type = "org.osbuild.inline", .checksum = helloHash, .encoding = "lzma", .data = ""};

    ASSERT_THROW(fetcher->fetch(item, tmpDir + "/out"), SourceFetchError);
}

TEST_F(SourceCacheTest, inlineSourceRejectsInvalidBase64)
{
    auto fetcher = makeInlineSourceFetcher();
    SourceItem item{.type = "org.osbuild.inline", .checksum = helloHash, .encoding = "base64", .data = "!!!!"};

    ASSERT_THROW(fetcher->fetch(item, tmpDir + "/out"), SourceFetchError);
}

/**
 * Fails a configurable number of times before producing `content`.
 */
struct FlakySourceFetcher : SourceFetcher
{
    std::string content;
    unsigned int failures;
    FileTransferError::Kind kind;
    std::atomic<unsigned int> calls{0};

    FlakySourceFetcher(std::string content, unsigned int failures, FileTransferError::Kind kind)
        : content(std::move(content))
        , failures(failures)
        , kind(kind)
    {
    }

    void fetch(const SourceItem & item, const std::filesystem::path & dest) override
    {
        if (calls++ < failures)
            throw FileTransferError(kind, "simulated failure");
        writeFile(dest.string(), content);
    }
};

class FetchSourceTest : public SourceCacheTest
{
protected:
    SourceFetchers fetchers;
    FlakySourceFetcher * flaky = nullptr;
    FetchRetryPolicy policy{.tries = 3, .baseRetryTimeMs = 1};

    SourceItem item{.type = "test.flaky", .checksum = helloHash};

    void useFetcher(std::string content, unsigned int failures, FileTransferError::Kind kind)
    {
        auto f = std::make_unique<FlakySourceFetcher>(std::move(content), failures, kind);
        flaky = f.get();
        fetchers.add("test.flaky", std::move(f));
    }
};

TEST_F(FetchSourceTest, transientErrorsAreRetried)
{
    useFetcher("hello", 2, FileTransferError::Transient);

    auto entry = fetchSource(*cache, fetchers, item, policy);

    ASSERT_EQ(flaky->calls.load(), 3u);
    ASSERT_EQ(readFile(entry.path.string()), "hello");
}

TEST_F(FetchSourceTest, attemptsAreBounded)
{
    useFetcher("hello", 10, FileTransferError::Transient);

    ASSERT_THROW(fetchSource(*cache, fetchers, item, policy), SourceFetchError);
    ASSERT_EQ(flaky->calls.load(), 3u);
}

TEST_F(FetchSourceTest, permanentErrorsAreNotRetried)
{
    useFetcher("hello", 10, FileTransferError::NotFound);

    ASSERT_THROW(fetchSource(*cache, fetchers, item, policy), SourceFetchError);
    ASSERT_EQ(flaky->calls.load(), 1u);
}

TEST_F(FetchSourceTest, checksumMismatchIsRetriedThenReported)
{
    useFetcher("goodbye", 0, FileTransferError::Transient);

    ASSERT_THROW(fetchSource(*cache, fetchers, item, policy), ChecksumMismatch);
    ASSERT_EQ(flaky->calls.load(), 3u);
    ASSERT_FALSE(cache->lookup(helloHash));
}

TEST_F(FetchSourceTest, cachedSourceIsNotFetched)
{
    useFetcher("hello", 0, FileTransferError::Transient);
    cache->add(helloHash, [](const std::filesystem::path & dest) { writeFile(dest.string(), "hello"); });

    fetchSource(*cache, fetchers, item, policy);

    ASSERT_EQ(flaky->calls.load(), 0u);
}

TEST_F(FetchSourceTest, unknownTypeIsRejected)
{
    item.type = "org.osbuild.ostree";

    ASSERT_THROW(fetchSource(*cache, fetchers, item, policy), SourceFetchError);
}

TEST(SourceFetchers, defaultsCoverCurlAndInline)
{
    struct NoTransfer : FileTransfer
    {
        FileTransferResult download(const FileTransferRequest & request) override
        {
            throw FileTransferError(FileTransferError::NotFound, "no network in tests");
        }
    };

    NoTransfer transfer;
    auto fetchers = SourceFetchers::makeDefault(transfer);

    ASSERT_TRUE(fetchers.has("org.osbuild.curl"));
    ASSERT_TRUE(fetchers.has("org.osbuild.inline"));
    ASSERT_FALSE(fetchers.has("org.osbuild.ostree"));
}

TEST(CurlSourceFetcher, triesMirrorsInOrder)
{
    struct MirrorTransfer : FileTransfer
    {
        std::vector<std::string> requested;

        FileTransferResult download(const FileTransferRequest & request) override
        {
            requested.push_back(request.uri);
            if (request.uri != "https://mirror-2.example/hello")
                throw FileTransferError(FileTransferError::NotFound, "HTTP error 404");
            request.dataCallback("hello");
            return {.httpStatus = 200, .effectiveUri = request.uri, .bodySize = 5};
        }
    };

    auto tmpDir = createTempDir();
    AutoDelete delTmpDir(tmpDir, true);

    MirrorTransfer transfer;
    auto fetcher = makeCurlSourceFetcher(transfer);
    SourceItem item{
        .type = "org.osbuild.curl",
        .checksum = hashString(HashAlgorithm::SHA256, "hello"),
        .urls = {"https://mirror-1.example/hello", "https://mirror-2.example/hello"},
    };

    fetcher->fetch(item, tmpDir + "/out");

    ASSERT_EQ(transfer.requested, item.urls);
    ASSERT_EQ(readFile(tmpDir + "/out"), "hello");
}

} // namespace arbor
