// =============================================================================
// refdb - Extraction Stage
// =============================================================================
// Unpacks every archive in the genomes directory into <accession>.fna.
//
// Per archive (sorted by name):
// (a) a non-empty <accession>.fna already exists -> skipped
// (b) the backup directory holds a non-empty <accession>.fna -> copied
// (c) every "*.fna" member is inflated, in central-directory order, into
//     <accession>.fna.part and renamed into place
//
// An unpack that fails after the retry budget leaves no sequence file.
// An unpack that yields no bytes leaves a zero-byte sequence file for the
// integrity filter. Both are appended to logs/failed_extractions.txt.
// =============================================================================

#ifndef REFDB_PIPELINE_EXTRACTION_STAGE_H
#define REFDB_PIPELINE_EXTRACTION_STAGE_H

#include <cstddef>
#include <filesystem>

#include "refdb/pipeline/retry_policy.h"
#include "refdb/pipeline/stage.h"

namespace refdb::pipeline {

/// @brief Counters of one extraction pass.
struct ExtractionReport {
    std::size_t archives = 0;
    std::size_t present = 0;
    std::size_t restored = 0;
    std::size_t extracted = 0;
    std::size_t failed = 0;
};

/// @brief Extraction stage.
class ExtractionStage final : public Stage {
public:
    /// @param sleeper Delay between extraction attempts; defaults to a
    ///        cancellation-aware sleep.
    explicit ExtractionStage(Sleeper sleeper = {});

    [[nodiscard]] std::string_view name() const noexcept override { return "extraction"; }

    [[nodiscard]] VoidResult run(RunContext& context) override;

    [[nodiscard]] const ExtractionReport& report() const noexcept { return report_; }

private:
    void extractAll(RunContext& context);
    [[nodiscard]] SequenceStatus extract(const PipelineConfig& config,
                                         const std::filesystem::path& archive,
                                         const Accession& accession);

    Sleeper sleeper_;
    ExtractionReport report_;
};

}  // namespace refdb::pipeline

#endif  // REFDB_PIPELINE_EXTRACTION_STAGE_H
