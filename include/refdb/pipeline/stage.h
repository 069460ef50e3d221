// =============================================================================
// refdb - Pipeline Stage Interface
// =============================================================================
// Base interface for the sequential build stages and the context they share.
//
// Stage sequence of a full run:
//   acquisition -> extraction -> integrity-filter -> alternate-ids ->
//   alternate-genomes -> assembly -> compression
//
// A stage reports a fatal failure by returning an error Result; per-entry
// failures are recorded in failure manifests and do not fail the stage.
// =============================================================================

#ifndef REFDB_PIPELINE_STAGE_H
#define REFDB_PIPELINE_STAGE_H

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "refdb/common/error.h"
#include "refdb/common/types.h"
#include "refdb/pipeline/config.h"
#include "refdb/pipeline/status_table.h"

namespace refdb::pipeline {

// =============================================================================
// Run Context
// =============================================================================

/// @brief State shared by the stages of one run.
struct RunContext {
    /// @brief Run configuration (read-only).
    const PipelineConfig& config;

    /// @brief Manifest entries in manifest order; empty if no stage needs them.
    std::vector<GenomeManifestEntry>& entries;

    /// @brief Persistent per-accession status.
    StatusTable& status;
};

// =============================================================================
// Stage Interface
// =============================================================================

/// @brief One step of the build pipeline.
class Stage {
public:
    virtual ~Stage() = default;

    /// @brief Stage name used in log file names and failure reports.
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /// @brief Execute the stage.
    /// @return Success, or the error that halts the run.
    [[nodiscard]] virtual VoidResult run(RunContext& context) = 0;

    /// @brief Whether the stage consumes the accession manifest.
    [[nodiscard]] virtual bool needsManifest() const noexcept { return false; }
};

// =============================================================================
// Pass-Through Stage
// =============================================================================

/// @brief Placeholder for an externally provided stage.
///
/// Occupies the alternate-ID and alternate-genome positions of the sequence.
/// It performs no work and always succeeds; files those collaborators
/// produce (e.g. genomes/empty_list2.txt) are picked up by later stages
/// when present.
class PassThroughStage final : public Stage {
public:
    explicit PassThroughStage(std::string name) : name_(std::move(name)) {}

    [[nodiscard]] std::string_view name() const noexcept override { return name_; }

    [[nodiscard]] VoidResult run(RunContext& context) override;

private:
    std::string name_;
};

}  // namespace refdb::pipeline

#endif  // REFDB_PIPELINE_STAGE_H
