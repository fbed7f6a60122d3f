#include "arbor/store/sources.hh"
#include "arbor/util/file-system.hh"
#include "arbor/util/signals.hh"
#include "arbor/util/strings.hh"

#include <fcntl.h>

#include <chrono>
#include <cmath>
#include <random>
#include <thread>

namespace arbor {

namespace {

class CurlSourceFetcher : public SourceFetcher
{
    FileTransfer & fileTransfer;

public:

    CurlSourceFetcher(FileTransfer & fileTransfer)
        : fileTransfer(fileTransfer)
    {
    }

    void fetch(const SourceItem & item, const std::filesystem::path & dest) override
    {
        if (item.urls.empty())
            throw SourceFetchError("source '%s' has no URL", item.checksum.to_string());

        std::optional<FileTransferError> lastError;
        bool anyTransient = false;

        for (auto & url : item.urls) {
            AutoCloseFD fd = ::open(dest.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
            if (!fd)
                throw SysError("creating '%s'", dest.string());

            FileTransferRequest request(url);
            request.dataCallback = [&](std::string_view data) { writeFull(fd.get(), data); };

            try {
                fileTransfer.download(request);
                fd.fsync();
                return;
            } catch (FileTransferError & e) {
                if (e.kind == FileTransferError::Interrupted)
                    throw;
                if (item.urls.size() > 1)
                    printTalkative("mirror '%s' failed: %s", url, e.message());
                anyTransient = anyTransient || e.isTransient();
                lastError = e;
            }
        }

        /* A retry is worthwhile if any mirror might still work. */
        if (anyTransient && !lastError->isTransient())
            throw FileTransferError(FileTransferError::Transient, lastError->info());
        throw *lastError;
    }
};

class InlineSourceFetcher : public SourceFetcher
{
public:

    void fetch(const SourceItem & item, const std::filesystem::path & dest) override
    {
        if (item.encoding != "base64")
            throw SourceFetchError(
                "inline source '%s' has unsupported encoding '%s'", item.checksum.to_string(), item.encoding);

        std::string content;
        try {
            content = base64Decode(item.data);
        } catch (FormatError & e) {
            throw SourceFetchError("inline source '%s' is not valid base64: %s", item.checksum.to_string(), e.message());
        }

        writeFile(dest.string(), content, 0644, true);
    }
};

} // namespace

std::unique_ptr<SourceFetcher> makeCurlSourceFetcher(FileTransfer & fileTransfer)
{
    return std::make_unique<CurlSourceFetcher>(fileTransfer);
}

std::unique_ptr<SourceFetcher> makeInlineSourceFetcher()
{
    return std::make_unique<InlineSourceFetcher>();
}

SourceFetcher & SourceFetchers::get(const std::string & type) const
{
    auto i = fetchers.find(type);
    if (i == fetchers.end())
        throw SourceFetchError("unsupported source type '%s'", type);
    return *i->second;
}

SourceFetchers SourceFetchers::makeDefault(FileTransfer & fileTransfer)
{
    SourceFetchers res;
    res.add("org.osbuild.curl", makeCurlSourceFetcher(fileTransfer));
    res.add("org.osbuild.inline", makeInlineSourceFetcher());
    return res;
}

SourceCache::Entry fetchSource(
    SourceCache & cache, const SourceFetchers & fetchers, const SourceItem & item, const FetchRetryPolicy & policy)
{
    auto & fetcher = fetchers.get(item.type);
    auto key = item.checksum.to_string();

    thread_local std::minstd_rand random{std::random_device{}()};

    for (unsigned int attempt = 1;; ++attempt) {
        checkInterrupt();
        try {
            return cache.add(item.checksum, [&](const std::filesystem::path & dest) { fetcher.fetch(item, dest); });
        } catch (ChecksumMismatch & e) {
            if (attempt >= policy.tries)
                throw;
            auto ms = policy.baseRetryTimeMs
                      * std::pow(2.0f, attempt - 1 + std::uniform_real_distribution<>(0.0, 0.5)(random));
            warn("%s; retrying in %d ms", e.what(), ms);
            std::this_thread::sleep_for(std::chrono::milliseconds((unsigned long) ms));
        } catch (FileTransferError & e) {
            if (e.kind == FileTransferError::Interrupted)
                checkInterrupt();
            if (!e.isTransient() || attempt >= policy.tries) {
                SourceFetchError err("unable to fetch source '%s': %s", key, e.message());
                if (e.isTransient())
                    err.addTrace("after %d attempts", attempt);
                throw err;
            }
            auto ms = policy.baseRetryTimeMs
                      * std::pow(2.0f, attempt - 1 + std::uniform_real_distribution<>(0.0, 0.5)(random));
            warn("%s; retrying in %d ms", e.what(), ms);
            std::this_thread::sleep_for(std::chrono::milliseconds((unsigned long) ms));
        } catch (SystemError & e) {
            throw SourceFetchError("unable to fetch source '%s': %s", key, e.message());
        }
    }
}

} // namespace arbor
