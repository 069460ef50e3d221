// =============================================================================
// refdb - Pipeline Orchestrator
// =============================================================================
// Validates a run, sequences its stages and owns its log sessions.
//
// State machine:
//   Unconfigured --validate()--> Validated --run()--> Running(stage_i)
//       Running --all stages succeed--> Completed
//       Running --any stage fails-----> Failed (no later stage runs)
//
// Validation checks the version tag and parses the manifest (when a stage
// consumes it) before anything is written, so configuration errors leave
// no partial work behind. During run() every message is also written to
// logs/<scope>_<version>_<timestamp>.{out,err}, and each stage gets its own
// logs/<stage>_<version>_<timestamp>.{out,err} pair.
// =============================================================================

#ifndef REFDB_PIPELINE_ORCHESTRATOR_H
#define REFDB_PIPELINE_ORCHESTRATOR_H

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "refdb/common/error.h"
#include "refdb/net/archive_fetcher.h"
#include "refdb/pipeline/config.h"
#include "refdb/pipeline/stage.h"
#include "refdb/pipeline/status_table.h"

namespace refdb::pipeline {

// =============================================================================
// Run State
// =============================================================================

/// @brief Lifecycle of one orchestrator invocation.
enum class RunState : std::uint8_t {
    kUnconfigured = 0,
    kValidated = 1,
    kRunning = 2,
    kCompleted = 3,
    kFailed = 4
};

/// @brief Convert RunState to string.
[[nodiscard]] constexpr std::string_view runStateToString(RunState state) noexcept {
    switch (state) {
        case RunState::kUnconfigured: return "unconfigured";
        case RunState::kValidated: return "validated";
        case RunState::kRunning: return "running";
        case RunState::kCompleted: return "completed";
        case RunState::kFailed: return "failed";
    }
    return "unknown";
}

// =============================================================================
// Pipeline Orchestrator
// =============================================================================

/// @brief Sequential stage runner.
class PipelineOrchestrator {
public:
    /// @brief Construct for one invocation.
    /// @param config Run configuration.
    /// @param startTime Invocation time; names the log files.
    explicit PipelineOrchestrator(
        PipelineConfig config,
        std::chrono::system_clock::time_point startTime = std::chrono::system_clock::now());

    PipelineOrchestrator(const PipelineOrchestrator&) = delete;
    PipelineOrchestrator& operator=(const PipelineOrchestrator&) = delete;

    /// @brief Append a stage to the sequence.
    void addStage(std::unique_ptr<Stage> stage);

    /// @brief Validate the configuration and load the inputs.
    /// @return kUsageError for a bad version tag or an absent/empty manifest.
    [[nodiscard]] VoidResult validate();

    /// @brief Run every stage in order, stopping at the first failure.
    /// @param scope Name of the run-level log files ("job", "compress").
    /// @return Success, or the failing stage's error.
    [[nodiscard]] VoidResult run(std::string_view scope);

    [[nodiscard]] RunState state() const noexcept { return state_; }

    /// @brief Name of the stage that failed, if any.
    [[nodiscard]] const std::optional<std::string>& failedStage() const noexcept {
        return failedStage_;
    }

    /// @brief Invocation identity.
    [[nodiscard]] const PipelineRun& pipelineRun() const noexcept { return run_; }

    [[nodiscard]] const PipelineConfig& config() const noexcept { return config_; }

    /// @brief Manifest entries loaded by validate().
    [[nodiscard]] const std::vector<GenomeManifestEntry>& entries() const noexcept {
        return entries_;
    }

private:
    void runStages(std::string_view scope);

    PipelineConfig config_;
    PipelineRun run_;
    RunState state_ = RunState::kUnconfigured;
    std::vector<std::unique_ptr<Stage>> stages_;
    std::vector<GenomeManifestEntry> entries_;
    std::optional<StatusTable> status_;
    std::optional<std::string> failedStage_;
};

// =============================================================================
// Stage Sequences
// =============================================================================

/// @brief Options for the standard stage sequence.
struct StageSequenceOptions {
    /// @brief Stop after assembly, leaving the uncompressed artifact.
    bool skipCompression = false;

    /// @brief Network collaborator; a libcurl fetcher is created when null.
    std::unique_ptr<net::ArchiveFetcher> fetcher;

    /// @brief Backoff delay; a cancellation-aware sleep when empty.
    Sleeper sleeper;
};

/// @brief acquisition, extraction, integrity-filter, alternate-ids,
///        alternate-genomes, assembly and (unless skipped) compression.
[[nodiscard]] std::vector<std::unique_ptr<Stage>> buildDefaultStages(
    const PipelineConfig& config, StageSequenceOptions options = {});

/// @brief The compression stage alone.
[[nodiscard]] std::vector<std::unique_ptr<Stage>> buildCompressionStages();

}  // namespace refdb::pipeline

#endif  // REFDB_PIPELINE_ORCHESTRATOR_H
