// =============================================================================
// refdb - Acquisition Stage
// =============================================================================
// Ensures every manifest accession has an archive in the genomes directory.
//
// Decision order per entry (first match wins):
// 1. Local archive present and usable -> cached. An archive the status
//    table records as acquired needs a readable zip directory; any other
//    archive must also pass a CRC check of every member. An unusable
//    leftover is deleted and re-acquired.
// 2. Backup directory holds a non-empty archive -> copied, restored.
// 3. Network fetch through the RetryPolicy into a `.part` file, renamed
//    into place only when the transfer succeeded and produced bytes.
// 4. Exhausted -> accession appended to logs/failed_downloads.txt; the
//    batch continues.
//
// Re-running the stage over the same manifest performs no network work
// for accessions that already have a usable archive.
// =============================================================================

#ifndef REFDB_PIPELINE_ACQUISITION_STAGE_H
#define REFDB_PIPELINE_ACQUISITION_STAGE_H

#include <cstddef>
#include <memory>

#include "refdb/net/archive_fetcher.h"
#include "refdb/pipeline/retry_policy.h"
#include "refdb/pipeline/stage.h"
#include "refdb/pipeline/status_table.h"

namespace refdb::pipeline {

/// @brief Counters of one acquisition pass.
struct AcquisitionReport {
    std::size_t total = 0;
    std::size_t cached = 0;
    std::size_t restored = 0;
    std::size_t downloaded = 0;
    std::size_t failed = 0;
};

/// @brief Acquisition stage.
class AcquisitionStage final : public Stage {
public:
    /// @brief Construct with a fetcher and the delay used between attempts.
    /// @param fetcher Network collaborator (owned).
    /// @param sleeper Backoff delay; defaults to a cancellation-aware sleep.
    explicit AcquisitionStage(std::unique_ptr<net::ArchiveFetcher> fetcher,
                              Sleeper sleeper = {});

    [[nodiscard]] std::string_view name() const noexcept override { return "acquisition"; }

    [[nodiscard]] VoidResult run(RunContext& context) override;

    [[nodiscard]] bool needsManifest() const noexcept override { return true; }

    /// @brief Counters of the most recent run.
    [[nodiscard]] const AcquisitionReport& report() const noexcept { return report_; }

private:
    void acquireAll(RunContext& context);
    [[nodiscard]] EntryStatus acquire(const PipelineConfig& config, const StatusTable& status,
                                      const Accession& accession);
    [[nodiscard]] bool download(const PipelineConfig& config, const Accession& accession);

    std::unique_ptr<net::ArchiveFetcher> fetcher_;
    Sleeper sleeper_;
    AcquisitionReport report_;
};

}  // namespace refdb::pipeline

#endif  // REFDB_PIPELINE_ACQUISITION_STAGE_H
