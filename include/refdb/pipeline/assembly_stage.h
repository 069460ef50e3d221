// =============================================================================
// refdb - Assembly Stage
// =============================================================================
// Builds the versioned database artifact and the missing-genome report.
//
// - refseq_database_<version>.fa is the byte-exact concatenation of every
//   surviving genomes/*.fna, in file-name order. The output size is checked
//   against the sum of the input sizes.
// - missing_fna.txt is the de-duplicated union, in first-seen order, of
//   genomes/empty_list.txt, genomes/empty_list2.txt and both failure
//   manifests, restricted to accessions without a surviving sequence file.
// =============================================================================

#ifndef REFDB_PIPELINE_ASSEMBLY_STAGE_H
#define REFDB_PIPELINE_ASSEMBLY_STAGE_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <vector>

#include "refdb/pipeline/stage.h"

namespace refdb::pipeline {

/// @brief Result of one assembly.
struct AssemblyReport {
    std::size_t sequenceFiles = 0;
    std::uint64_t bytesWritten = 0;
    std::vector<Accession> missing;
};

/// @brief Merge the missing-accession lists into the report contents.
/// @param sources Lists in priority order; later duplicates are dropped.
/// @param survivors Accessions that still have a sequence file.
[[nodiscard]] std::vector<Accession> mergeMissingAccessions(
    const std::vector<std::vector<Accession>>& sources, const std::vector<Accession>& survivors);

/// @brief Assembly stage.
class AssemblyStage final : public Stage {
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "assembly"; }

    [[nodiscard]] VoidResult run(RunContext& context) override;

    [[nodiscard]] const AssemblyReport& report() const noexcept { return report_; }

private:
    void assemble(const PipelineConfig& config);
    void writeMissingReport(const PipelineConfig& config,
                            const std::vector<std::filesystem::path>& sequences);

    AssemblyReport report_;
};

}  // namespace refdb::pipeline

#endif  // REFDB_PIPELINE_ASSEMBLY_STAGE_H
