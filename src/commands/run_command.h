// =============================================================================
// refdb - Run Command
// =============================================================================
// Command handler for a full database build.
//
// This module provides:
// - RunOptions: CLI-facing options of `refdb run`
// - RunCommand: Maps options to a PipelineConfig and drives the standard
//   stage sequence through the orchestrator
// =============================================================================

#ifndef REFDB_COMMANDS_RUN_COMMAND_H
#define REFDB_COMMANDS_RUN_COMMAND_H

#include <filesystem>
#include <optional>
#include <string>

#include "refdb/pipeline/config.h"

namespace refdb::commands {

// =============================================================================
// Run Options
// =============================================================================

/// @brief Configuration options for a full build.
struct RunOptions {
    /// @brief Version tag of the artifact.
    std::string version;

    /// @brief Working/output directory.
    std::filesystem::path outputDir = ".";

    /// @brief Previous output directory to restore files from.
    std::optional<std::filesystem::path> backupDir;

    /// @brief Accession manifest (empty = <output>/data/ftp_reference_genomes.tsv).
    std::filesystem::path manifestPath;

    /// @brief NCBI API key (empty = anonymous).
    std::string apiKey;

    /// @brief Leave the artifact uncompressed.
    bool skipCompression = false;
};

/// @brief Translate CLI options into the pipeline configuration.
[[nodiscard]] pipeline::PipelineConfig toPipelineConfig(const RunOptions& options);

// =============================================================================
// RunCommand Class
// =============================================================================

/// @brief Command handler for `refdb run`.
class RunCommand {
public:
    explicit RunCommand(RunOptions options);

    RunCommand(const RunCommand&) = delete;
    RunCommand& operator=(const RunCommand&) = delete;

    /// @brief Execute the build.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const RunOptions& options() const noexcept { return options_; }

private:
    RunOptions options_;
};

}  // namespace refdb::commands

#endif  // REFDB_COMMANDS_RUN_COMMAND_H
