// =============================================================================
// refdb - Genome Archive Fetcher Implementation
// =============================================================================

#include "refdb/net/archive_fetcher.h"

#include <curl/curl.h>

#include <cstdio>
#include <memory>

#include "refdb/common/error.h"
#include "refdb/common/logger.h"

namespace refdb::net {

namespace {

/// @brief Process-wide libcurl initialisation.
class CurlGlobal {
public:
    CurlGlobal() {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw IOError("curl_global_init failed");
        }
    }

    ~CurlGlobal() { curl_global_cleanup(); }

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

void ensureCurlInitialized() {
    static CurlGlobal global;
}

struct CurlEasyDeleter {
    void operator()(CURL* handle) const noexcept { curl_easy_cleanup(handle); }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
};

struct FileCloser {
    void operator()(std::FILE* file) const noexcept { std::fclose(file); }
};

using CurlHandle = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlHeaders = std::unique_ptr<curl_slist, CurlSlistDeleter>;
using FileHandle = std::unique_ptr<std::FILE, FileCloser>;

CurlHeaders appendHeader(CurlHeaders headers, const std::string& header) {
    curl_slist* list = curl_slist_append(headers.get(), header.c_str());
    if (list == nullptr) {
        throw IOError("Out of memory building request headers");
    }
    headers.release();
    return CurlHeaders(list);
}

}  // namespace

std::string buildDownloadUrl(const FetchOptions& options, const Accession& accession) {
    std::string url = options.endpointTemplate;
    std::size_t pos = 0;
    while ((pos = url.find(kAccessionPlaceholder, pos)) != std::string::npos) {
        url.replace(pos, kAccessionPlaceholder.size(), accession);
        pos += accession.size();
    }
    return url;
}

CurlArchiveFetcher::CurlArchiveFetcher(FetchOptions options) : options_(std::move(options)) {
    ensureCurlInitialized();
}

FetchOutcome CurlArchiveFetcher::fetch(const Accession& accession,
                                       const std::filesystem::path& destination) {
    FetchOutcome outcome;

    FileHandle file(std::fopen(destination.c_str(), "wb"));
    if (!file) {
        outcome.message = "cannot open " + destination.string() + " for writing";
        return outcome;
    }

    CurlHandle curl(curl_easy_init());
    if (!curl) {
        outcome.message = "curl_easy_init failed";
        return outcome;
    }

    const std::string url = buildDownloadUrl(options_, accession);
    CurlHeaders headers = appendHeader(nullptr, "Accept: application/zip");
    if (!options_.apiKey.empty()) {
        headers = appendHeader(std::move(headers), "api-key: " + options_.apiKey);
    }

    char errorBuffer[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, file.get());
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errorBuffer);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, options_.connectTimeoutSec);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, options_.lowSpeedTimeSec);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, options_.lowSpeedLimit);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    REFDB_LOG_DEBUG("GET {}", url);
    const CURLcode code = curl_easy_perform(curl.get());
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &outcome.httpStatus);

    // Close before the caller inspects the file size
    const bool closed = std::fclose(file.release()) == 0;

    if (code != CURLE_OK) {
        outcome.message = errorBuffer[0] != '\0' ? std::string(errorBuffer)
                                                 : std::string(curl_easy_strerror(code));
        return outcome;
    }
    if (!closed) {
        outcome.message = "failed to flush " + destination.string();
        return outcome;
    }

    outcome.transferOk = true;
    return outcome;
}

}  // namespace refdb::net
