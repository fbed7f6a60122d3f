#pragma once
///@file

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "arbor/util/logging.hh"
#include "arbor/util/types.hh"

namespace arbor {

class Settings;

struct FileTransferSettings
{
    /**
     * Connection timeout in seconds; 0 uses curl's default.
     */
    unsigned long connectTimeout = 0;

    /**
     * Abort a transfer that receives no data for this many seconds.
     */
    unsigned long stalledDownloadTimeout = 300;

    unsigned int tries = 5;

    unsigned int baseRetryTimeMs = 250;

    std::string userAgentSuffix;

    static FileTransferSettings fromSettings(const Settings & settings);
};

struct FileTransferRequest
{
    std::string uri;
    ActivityId parentAct = 0;

    /**
     * Receives the body as it arrives. Returning normally continues
     * the transfer; throwing aborts it.
     */
    std::function<void(std::string_view data)> dataCallback;

    FileTransferRequest(std::string uri)
        : uri(std::move(uri))
    {
    }
};

struct FileTransferResult
{
    long httpStatus = 0;
    std::string effectiveUri;
    uint64_t bodySize = 0;
};

class FileTransferError : public Error
{
public:
    enum Kind { Transient, NotFound, Forbidden, Misc, Interrupted };

    Kind kind;

    template<typename... Args>
    FileTransferError(Kind kind, const Args &... args)
        : Error(args...)
        , kind(kind)
    {
    }

    bool isTransient() const
    {
        return kind == Transient;
    }
};

/**
 * A single-attempt downloader. Retrying is left to the caller, which
 * knows whether a partial download can be restarted.
 */
class FileTransfer
{
public:

    virtual ~FileTransfer() {}

    /**
     * Download `request.uri`, streaming the body to
     * `request.dataCallback`. Throws `FileTransferError`.
     */
    virtual FileTransferResult download(const FileTransferRequest & request) = 0;
};

/**
 * A libcurl based `FileTransfer`. Supports every protocol curl was
 * built with, including `file://`.
 */
std::unique_ptr<FileTransfer> makeCurlFileTransfer(const FileTransferSettings & settings);

} // namespace arbor
