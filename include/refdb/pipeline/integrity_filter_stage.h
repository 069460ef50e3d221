// =============================================================================
// refdb - Integrity Filter Stage
// =============================================================================
// Quarantines zero-byte sequence files.
//
// Every <accession>.fna of length zero in the genomes directory is recorded
// as a bare accession in genomes/empty_list.txt and deleted. The list is
// rewritten on every run, so it always describes the latest filter pass.
// After the stage no zero-length sequence file remains.
// =============================================================================

#ifndef REFDB_PIPELINE_INTEGRITY_FILTER_STAGE_H
#define REFDB_PIPELINE_INTEGRITY_FILTER_STAGE_H

#include <vector>

#include "refdb/pipeline/stage.h"

namespace refdb::pipeline {

/// @brief Integrity filter stage.
class IntegrityFilterStage final : public Stage {
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "integrity-filter"; }

    [[nodiscard]] VoidResult run(RunContext& context) override;

    /// @brief Accessions quarantined by the most recent run, sorted.
    [[nodiscard]] const std::vector<Accession>& quarantined() const noexcept {
        return quarantined_;
    }

private:
    void filter(RunContext& context);

    std::vector<Accession> quarantined_;
};

}  // namespace refdb::pipeline

#endif  // REFDB_PIPELINE_INTEGRITY_FILTER_STAGE_H
