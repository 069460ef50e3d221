// =============================================================================
// refdb - Genome Archive Fetcher
// =============================================================================
// Network access to the NCBI Datasets genome download endpoint.
//
// This module provides:
// - FetchOptions: endpoint template, API key and transfer timeouts
// - FetchOutcome: result of one transfer attempt
// - ArchiveFetcher: interface used by the acquisition stage
// - CurlArchiveFetcher: libcurl implementation
//
// One call to fetch() is one transfer attempt; retrying is the caller's
// business (see pipeline/retry_policy.h).
// =============================================================================

#ifndef REFDB_NET_ARCHIVE_FETCHER_H
#define REFDB_NET_ARCHIVE_FETCHER_H

#include <filesystem>
#include <string>
#include <string_view>

#include "refdb/common/types.h"

namespace refdb::net {

/// @brief Placeholder replaced by the accession in the endpoint template.
inline constexpr std::string_view kAccessionPlaceholder = "{accession}";

/// @brief NCBI Datasets genome package endpoint (FASTA only).
inline constexpr std::string_view kDefaultEndpointTemplate =
    "https://api.ncbi.nlm.nih.gov/datasets/v2alpha/genome/accession/{accession}/download"
    "?include_annotation_type=GENOME_FASTA&filename={accession}.zip";

/// @brief Transfer settings.
struct FetchOptions {
    /// @brief URL template; every kAccessionPlaceholder is substituted.
    std::string endpointTemplate = std::string(kDefaultEndpointTemplate);

    /// @brief NCBI API key sent as the `api-key` header (empty = none).
    std::string apiKey;

    /// @brief Connection timeout in seconds.
    long connectTimeoutSec = 60;

    /// @brief Abort when the transfer stays below lowSpeedLimit for this long.
    long lowSpeedTimeSec = 300;

    /// @brief Bytes per second below which a transfer counts as stalled.
    long lowSpeedLimit = 1;
};

/// @brief Result of one transfer attempt.
struct FetchOutcome {
    /// @brief Transfer completed with a 2xx response.
    bool transferOk = false;

    /// @brief HTTP status code (0 if no response was received).
    long httpStatus = 0;

    /// @brief Human-readable failure reason.
    std::string message;
};

/// @brief Build the download URL for one accession.
[[nodiscard]] std::string buildDownloadUrl(const FetchOptions& options,
                                           const Accession& accession);

/// @brief Source of genome archives.
class ArchiveFetcher {
public:
    virtual ~ArchiveFetcher() = default;

    /// @brief Attempt to download the archive of `accession` into `destination`.
    /// @note May leave a partial or empty file behind on failure.
    [[nodiscard]] virtual FetchOutcome fetch(const Accession& accession,
                                             const std::filesystem::path& destination) = 0;
};

/// @brief ArchiveFetcher backed by the libcurl easy interface.
class CurlArchiveFetcher : public ArchiveFetcher {
public:
    explicit CurlArchiveFetcher(FetchOptions options);

    [[nodiscard]] FetchOutcome fetch(const Accession& accession,
                                     const std::filesystem::path& destination) override;

    [[nodiscard]] const FetchOptions& options() const noexcept { return options_; }

private:
    FetchOptions options_;
};

}  // namespace refdb::net

#endif  // REFDB_NET_ARCHIVE_FETCHER_H
