// =============================================================================
// refdb - Pipeline Configuration
// =============================================================================
// The single configuration value threaded through every stage.
//
// This module provides:
// - PipelineConfig: output directory, version tag, backup directory,
//   manifest location, retry and transfer settings
// - PipelineRun: per-invocation identity (version, backup, start time)
// - Path helpers for the on-disk layout:
//
//   <output>/genomes/<accession>.zip
//   <output>/genomes/<accession>.fna
//   <output>/genomes/empty_list.txt
//   <output>/genomes/status.tsv
//   <output>/missing_fna.txt
//   <output>/refseq_database_<version>.fa[.gz]
//   <output>/logs/<scope>_<version>_<timestamp>.{out,err}
// =============================================================================

#ifndef REFDB_PIPELINE_CONFIG_H
#define REFDB_PIPELINE_CONFIG_H

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

#include "refdb/common/error.h"
#include "refdb/common/types.h"
#include "refdb/io/compressed_stream.h"
#include "refdb/net/archive_fetcher.h"
#include "refdb/pipeline/retry_policy.h"

namespace refdb::pipeline {

/// @brief Manifest location relative to the output directory when not given.
inline constexpr std::string_view kDefaultManifestRelativePath = "data/ftp_reference_genomes.tsv";

/// @brief Extraction retries are local and short.
inline constexpr RetryPolicy kDefaultExtractionRetry{2, std::chrono::seconds{1}};

/// @brief Artifact file name for a version: refseq_database_<version>.fa
[[nodiscard]] std::string artifactFileName(std::string_view version);

/// @brief Configuration shared by all stages of one run.
struct PipelineConfig {
    /// @brief Working/output directory.
    std::filesystem::path outputDir = ".";

    /// @brief Version tag embedded verbatim in the artifact name.
    std::string version;

    /// @brief Previous output directory consulted before the network.
    std::optional<std::filesystem::path> backupDir;

    /// @brief Accession manifest (tab-separated, header row).
    std::filesystem::path manifestPath;

    /// @brief Download attempts and backoff.
    RetryPolicy downloadRetry;

    /// @brief Extraction attempts and backoff.
    RetryPolicy extractionRetry = kDefaultExtractionRetry;

    /// @brief Transfer settings.
    net::FetchOptions fetchOptions;

    /// @brief Progress line interval (entries).
    std::size_t progressInterval = kDefaultProgressInterval;

    /// @brief gzip level for the final artifact.
    int gzipLevel = io::kDefaultGzipLevel;

    /// @brief Check invariants required before any stage runs.
    /// @return kUsageError if the version tag is empty or not a plain file-name component.
    [[nodiscard]] VoidResult validate() const;

    /// @brief Manifest path, defaulting to <output>/data/ftp_reference_genomes.tsv.
    [[nodiscard]] std::filesystem::path resolvedManifestPath() const;

    [[nodiscard]] std::filesystem::path genomesDir() const;
    [[nodiscard]] std::filesystem::path logsDir() const;
    [[nodiscard]] std::filesystem::path archivePath(const Accession& accession) const;
    [[nodiscard]] std::filesystem::path sequencePath(const Accession& accession) const;

    /// @brief Archive in the backup directory, if one is configured.
    [[nodiscard]] std::optional<std::filesystem::path> backupArchivePath(
        const Accession& accession) const;

    /// @brief Sequence file in the backup directory, if one is configured.
    [[nodiscard]] std::optional<std::filesystem::path> backupSequencePath(
        const Accession& accession) const;

    [[nodiscard]] std::filesystem::path emptyManifestPath() const;
    [[nodiscard]] std::filesystem::path alternateEmptyManifestPath() const;
    [[nodiscard]] std::filesystem::path missingReportPath() const;
    [[nodiscard]] std::filesystem::path statusTablePath() const;
    [[nodiscard]] std::filesystem::path downloadFailuresPath() const;
    [[nodiscard]] std::filesystem::path extractionFailuresPath() const;
    [[nodiscard]] std::filesystem::path artifactPath() const;
    [[nodiscard]] std::filesystem::path compressedArtifactPath() const;
};

/// @brief Identity of one orchestrator invocation.
struct PipelineRun {
    std::string version;
    std::optional<std::filesystem::path> backupDir;
    std::chrono::system_clock::time_point startTime;

    /// @brief startTime formatted for log file names.
    std::string timestamp;
};

}  // namespace refdb::pipeline

#endif  // REFDB_PIPELINE_CONFIG_H
