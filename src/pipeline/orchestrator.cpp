// =============================================================================
// refdb - Pipeline Orchestrator Implementation
// =============================================================================

#include "refdb/pipeline/orchestrator.h"

#include <algorithm>

#include "refdb/common/cancellation.h"
#include "refdb/common/logger.h"
#include "refdb/io/file_utils.h"
#include "refdb/io/manifest_reader.h"
#include "refdb/pipeline/acquisition_stage.h"
#include "refdb/pipeline/assembly_stage.h"
#include "refdb/pipeline/compression_stage.h"
#include "refdb/pipeline/extraction_stage.h"
#include "refdb/pipeline/integrity_filter_stage.h"

namespace refdb::pipeline {

PipelineOrchestrator::PipelineOrchestrator(PipelineConfig config,
                                           std::chrono::system_clock::time_point startTime)
    : config_(std::move(config)) {
    run_.version = config_.version;
    run_.backupDir = config_.backupDir;
    run_.startTime = startTime;
    run_.timestamp = log::formatTimestamp(startTime);
}

void PipelineOrchestrator::addStage(std::unique_ptr<Stage> stage) {
    stages_.push_back(std::move(stage));
}

VoidResult PipelineOrchestrator::validate() {
    if (state_ != RunState::kUnconfigured) {
        return makeVoidError(ErrorCode::kUsageError,
                             std::string("cannot validate a run that is ") +
                                 std::string(runStateToString(state_)));
    }

    if (auto valid = config_.validate(); !valid.has_value()) {
        return valid;
    }

    const bool needsManifest =
        std::any_of(stages_.begin(), stages_.end(),
                    [](const std::unique_ptr<Stage>& stage) { return stage->needsManifest(); });

    auto loaded = tryExecute([&] {
        if (needsManifest) {
            entries_ = io::readManifest(config_.resolvedManifestPath()).entries;
        }
        status_.emplace(StatusTable::load(config_.statusTablePath()));
    });
    if (!loaded.has_value()) {
        return loaded;
    }

    state_ = RunState::kValidated;
    return makeVoidSuccess();
}

VoidResult PipelineOrchestrator::run(std::string_view scope) {
    if (state_ != RunState::kValidated) {
        return makeVoidError(ErrorCode::kUsageError,
                             std::string("cannot run a pipeline that is ") +
                                 std::string(runStateToString(state_)));
    }

    state_ = RunState::kRunning;
    auto result = tryExecute([&] { runStages(scope); });
    state_ = result.has_value() ? RunState::kCompleted : RunState::kFailed;
    return result;
}

void PipelineOrchestrator::runStages(std::string_view scope) {
    io::ensureDirectory(config_.logsDir());
    log::LogSession session(config_.logsDir(), scope, run_.version, run_.timestamp);

    REFDB_LOG_INFO("Starting {} for version {} in {}", scope, run_.version,
                   config_.outputDir.string());
    if (run_.backupDir.has_value()) {
        REFDB_LOG_INFO("Backup directory: {}", run_.backupDir->string());
    }

    RunContext context{config_, entries_, *status_};
    for (const auto& stage : stages_) {
        const std::string stageName(stage->name());
        if (isCancelled()) {
            failedStage_ = stageName;
            REFDB_LOG_ERROR("Run cancelled before stage {}", stageName);
            throwIfCancelled();
        }

        VoidResult result = makeVoidSuccess();
        {
            log::LogSession stageSession(config_.logsDir(), stageName, run_.version,
                                         run_.timestamp);
            REFDB_LOG_INFO("Running stage {}", stageName);
            result = stage->run(context);
            if (!result.has_value()) {
                REFDB_LOG_ERROR("Stage {} failed: {}", stageName, result.error().message());
            }
        }

        if (!result.has_value()) {
            failedStage_ = stageName;
            REFDB_LOG_ERROR("Run {} for version {} halted at stage {}", scope, run_.version,
                            stageName);
            result.error().throwException();
        }
    }

    REFDB_LOG_INFO("Run {} for version {} completed", scope, run_.version);
}

std::vector<std::unique_ptr<Stage>> buildDefaultStages(const PipelineConfig& config,
                                                       StageSequenceOptions options) {
    if (!options.fetcher) {
        options.fetcher = std::make_unique<net::CurlArchiveFetcher>(config.fetchOptions);
    }

    std::vector<std::unique_ptr<Stage>> stages;
    stages.push_back(
        std::make_unique<AcquisitionStage>(std::move(options.fetcher), options.sleeper));
    stages.push_back(std::make_unique<ExtractionStage>(options.sleeper));
    stages.push_back(std::make_unique<IntegrityFilterStage>());
    stages.push_back(std::make_unique<PassThroughStage>("alternate-ids"));
    stages.push_back(std::make_unique<PassThroughStage>("alternate-genomes"));
    stages.push_back(std::make_unique<AssemblyStage>());
    if (!options.skipCompression) {
        stages.push_back(std::make_unique<CompressionStage>());
    }
    return stages;
}

std::vector<std::unique_ptr<Stage>> buildCompressionStages() {
    std::vector<std::unique_ptr<Stage>> stages;
    stages.push_back(std::make_unique<CompressionStage>());
    return stages;
}

}  // namespace refdb::pipeline
