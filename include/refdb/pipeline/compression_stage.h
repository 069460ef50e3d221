// =============================================================================
// refdb - Compression Stage
// =============================================================================
// Compresses refseq_database_<version>.fa into a gzip container
// (refseq_database_<version>.fa.gz) and removes the uncompressed artifact.
// Runs as the last stage of a full build or on its own (`refdb compress`).
// =============================================================================

#ifndef REFDB_PIPELINE_COMPRESSION_STAGE_H
#define REFDB_PIPELINE_COMPRESSION_STAGE_H

#include "refdb/io/compressed_stream.h"
#include "refdb/pipeline/stage.h"

namespace refdb::pipeline {

/// @brief Compression stage.
class CompressionStage final : public Stage {
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "compression"; }

    [[nodiscard]] VoidResult run(RunContext& context) override;

    /// @brief Statistics of the most recent run.
    [[nodiscard]] const io::GzipStats& stats() const noexcept { return stats_; }

private:
    io::GzipStats stats_;
};

}  // namespace refdb::pipeline

#endif  // REFDB_PIPELINE_COMPRESSION_STAGE_H
