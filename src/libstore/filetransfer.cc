#include "arbor/store/filetransfer.hh"
#include "arbor/store/globals.hh"
#include "arbor/util/signals.hh"

#include <curl/curl.h>

#include <mutex>

namespace arbor {

FileTransferSettings FileTransferSettings::fromSettings(const Settings & settings)
{
    FileTransferSettings res;
    res.connectTimeout = settings.connectTimeout;
    res.stalledDownloadTimeout = settings.stalledDownloadTimeout;
    res.tries = settings.downloadAttempts;
    res.baseRetryTimeMs = settings.downloadRetryBaseMs;
    return res;
}

namespace {

struct CurlTransfer
{
    const FileTransferSettings & settings;
    const FileTransferRequest & request;

    CURL * req;
    Activity act;
    FileTransferResult result;
    std::exception_ptr writeException;

    CurlTransfer(const FileTransferSettings & settings, const FileTransferRequest & request)
        : settings(settings)
        , request(request)
        , req(curl_easy_init())
        , act(*logger, lvlTalkative, actFetchSource, fmt("downloading '%s'", request.uri), {request.uri}, request.parentAct)
    {
        if (!req)
            throw FileTransferError(FileTransferError::Misc, "cannot create curl handle");
    }

    ~CurlTransfer()
    {
        curl_easy_cleanup(req);
    }

    size_t writeCallback(void * contents, size_t size, size_t nmemb)
    {
        try {
            size_t realSize = size * nmemb;
            result.bodySize += realSize;
            if (request.dataCallback)
                request.dataCallback({(const char *) contents, realSize});
            return realSize;
        } catch (...) {
            writeException = std::current_exception();
            return 0;
        }
    }

    static size_t writeCallbackWrapper(void * contents, size_t size, size_t nmemb, void * userp)
    {
        return ((CurlTransfer *) userp)->writeCallback(contents, size, nmemb);
    }

    int progressCallback(curl_off_t dltotal, curl_off_t dlnow)
    {
        try {
            act.progress(dlnow, dltotal);
        } catch (...) {
            ignoreExceptionInDestructor();
        }
        return getInterrupted();
    }

    static int progressCallbackWrapper(
        void * userp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t ultotal, curl_off_t ulnow)
    {
        return ((CurlTransfer *) userp)->progressCallback(dltotal, dlnow);
    }

    FileTransferResult run()
    {
        std::string userAgent = "curl/" LIBCURL_VERSION " arbor";
        if (!settings.userAgentSuffix.empty())
            userAgent += " " + settings.userAgentSuffix;

        curl_easy_setopt(req, CURLOPT_URL, request.uri.c_str());
        curl_easy_setopt(req, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(req, CURLOPT_MAXREDIRS, 10);
        curl_easy_setopt(req, CURLOPT_NOSIGNAL, 1);
        curl_easy_setopt(
            req,
            CURLOPT_USERAGENT,
            userAgent.c_str());
        curl_easy_setopt(req, CURLOPT_WRITEFUNCTION, CurlTransfer::writeCallbackWrapper);
        curl_easy_setopt(req, CURLOPT_WRITEDATA, this);
        curl_easy_setopt(req, CURLOPT_XFERINFOFUNCTION, progressCallbackWrapper);
        curl_easy_setopt(req, CURLOPT_XFERINFODATA, this);
        curl_easy_setopt(req, CURLOPT_NOPROGRESS, 0);
        curl_easy_setopt(req, CURLOPT_CONNECTTIMEOUT, (long) settings.connectTimeout);
        curl_easy_setopt(req, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(req, CURLOPT_LOW_SPEED_TIME, (long) settings.stalledDownloadTimeout);

        auto code = curl_easy_perform(req);

        long httpStatus = 0;
        curl_easy_getinfo(req, CURLINFO_RESPONSE_CODE, &httpStatus);
        result.httpStatus = httpStatus;

        char * effectiveUriCStr = nullptr;
        curl_easy_getinfo(req, CURLINFO_EFFECTIVE_URL, &effectiveUriCStr);
        if (effectiveUriCStr)
            result.effectiveUri = effectiveUriCStr;

        debug(
            "finished download of '%s'; curl status = %d, HTTP status = %d, body = %d bytes",
            request.uri,
            code,
            httpStatus,
            result.bodySize);

        if (writeException)
            std::rethrow_exception(writeException);

        /* file:// and other non-HTTP transfers report status 0. */
        if (code == CURLE_OK && (httpStatus == 0 || httpStatus == 200 || httpStatus == 201 || httpStatus == 204)) {
            act.progress(result.bodySize, result.bodySize);
            return result;
        }

        // We treat most errors as transient, but won't retry when hopeless
        auto err = FileTransferError::Transient;

        if (httpStatus == 404 || httpStatus == 410 || code == CURLE_FILE_COULDNT_READ_FILE) {
            // The file is definitely not there
            err = FileTransferError::NotFound;
        } else if (httpStatus == 401 || httpStatus == 403 || httpStatus == 407) {
            // Don't retry on authentication/authorization failures
            err = FileTransferError::Forbidden;
        } else if (httpStatus >= 400 && httpStatus < 500 && httpStatus != 408 && httpStatus != 429) {
            // Most 4xx errors are client errors and are probably not worth retrying:
            //   * 408 means the server timed out waiting for us, so we try again
            //   * 429 means too many requests, so we retry (with a delay)
            err = FileTransferError::Misc;
        } else if (httpStatus == 501 || httpStatus == 505 || httpStatus == 511) {
            err = FileTransferError::Misc;
        } else {
            // Don't bother retrying on certain cURL errors either
            switch (code) {
            case CURLE_FAILED_INIT:
            case CURLE_URL_MALFORMAT:
            case CURLE_NOT_BUILT_IN:
            case CURLE_REMOTE_ACCESS_DENIED:
            case CURLE_FUNCTION_NOT_FOUND:
            case CURLE_BAD_FUNCTION_ARGUMENT:
            case CURLE_INTERFACE_FAILED:
            case CURLE_UNKNOWN_OPTION:
            case CURLE_SSL_CACERT_BADFILE:
            case CURLE_TOO_MANY_REDIRECTS:
            case CURLE_WRITE_ERROR:
            case CURLE_UNSUPPORTED_PROTOCOL:
                err = FileTransferError::Misc;
                break;
            default: // Shut up warnings
                break;
            }
        }

        if (code == CURLE_ABORTED_BY_CALLBACK && getInterrupted())
            throw FileTransferError(FileTransferError::Interrupted, "download of '%s' was interrupted", request.uri);

        if (httpStatus != 0)
            throw FileTransferError(
                err,
                "unable to download '%s': HTTP error %d%s",
                request.uri,
                httpStatus,
                code == CURLE_OK ? "" : fmt(" (curl error: %s)", curl_easy_strerror(code)));

        throw FileTransferError(err, "unable to download '%s': %s (%d)", request.uri, curl_easy_strerror(code), code);
    }
};

class CurlFileTransfer : public FileTransfer
{
    FileTransferSettings settings;

public:

    CurlFileTransfer(const FileTransferSettings & settings)
        : settings(settings)
    {
        static std::once_flag globalInit;
        std::call_once(globalInit, curl_global_init, CURL_GLOBAL_ALL);
    }

    FileTransferResult download(const FileTransferRequest & request) override
    {
        checkInterrupt();
        CurlTransfer transfer(settings, request);
        return transfer.run();
    }
};

} // namespace

std::unique_ptr<FileTransfer> makeCurlFileTransfer(const FileTransferSettings & settings)
{
    return std::make_unique<CurlFileTransfer>(settings);
}

} // namespace arbor
