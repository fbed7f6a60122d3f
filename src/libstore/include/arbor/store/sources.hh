#pragma once
///@file

#include "arbor/store/filetransfer.hh"
#include "arbor/store/source-cache.hh"

#include <map>
#include <memory>
#include <vector>

namespace arbor {

/**
 * One item of a manifest's `sources` section: the content expected
 * under `checksum` and where to obtain it.
 */
struct SourceItem
{
    std::string type;
    Hash checksum{HashAlgorithm::SHA256};

    /**
     * `org.osbuild.curl`: mirrors, tried in order.
     */
    std::vector<std::string> urls;

    /**
     * `org.osbuild.inline`: the encoded payload.
     */
    std::string encoding;
    std::string data;
};

/**
 * Writes the content of one kind of source to a file.
 */
class SourceFetcher
{
public:
    virtual ~SourceFetcher() {}

    virtual void fetch(const SourceItem & item, const std::filesystem::path & dest) = 0;
};

std::unique_ptr<SourceFetcher> makeCurlSourceFetcher(FileTransfer & fileTransfer);

std::unique_ptr<SourceFetcher> makeInlineSourceFetcher();

/**
 * The fetchers known to this build, keyed by source type.
 */
class SourceFetchers
{
    std::map<std::string, std::unique_ptr<SourceFetcher>> fetchers;

public:

    void add(const std::string & type, std::unique_ptr<SourceFetcher> fetcher)
    {
        fetchers[type] = std::move(fetcher);
    }

    bool has(const std::string & type) const
    {
        return fetchers.count(type);
    }

    SourceFetcher & get(const std::string & type) const;

    /**
     * The `org.osbuild.curl` and `org.osbuild.inline` fetchers.
     */
    static SourceFetchers makeDefault(FileTransfer & fileTransfer);
};

struct FetchRetryPolicy
{
    unsigned int tries = 5;
    unsigned int baseRetryTimeMs = 250;
};

/**
 * Ensure `item` is in `cache`, fetching it if necessary. Transient
 * transfer errors and checksum mismatches are retried with exponential
 * backoff.
 *
 * @throws SourceFetchError once the attempts are exhausted or on a
 * permanent error.
 */
SourceCache::Entry fetchSource(
    SourceCache & cache, const SourceFetchers & fetchers, const SourceItem & item, const FetchRetryPolicy & policy);

} // namespace arbor
