// =============================================================================
// refdb - Run Command Implementation
// =============================================================================

#include "run_command.h"

#include <chrono>

#include "refdb/common/error.h"
#include "refdb/common/logger.h"
#include "refdb/pipeline/orchestrator.h"

namespace refdb::commands {

pipeline::PipelineConfig toPipelineConfig(const RunOptions& options) {
    pipeline::PipelineConfig config;
    config.version = options.version;
    config.outputDir = options.outputDir;
    config.backupDir = options.backupDir;
    config.manifestPath = options.manifestPath;
    config.fetchOptions.apiKey = options.apiKey;
    return config;
}

RunCommand::RunCommand(RunOptions options) : options_(std::move(options)) {}

int RunCommand::execute() {
    const auto startTime = std::chrono::steady_clock::now();

    try {
        auto config = toPipelineConfig(options_);
        // Validate before building stages so a bad tag never touches the network layer
        if (auto valid = config.validate(); !valid.has_value()) {
            REFDB_LOG_ERROR("{}", valid.error().message());
            return valid.error().exitCode();
        }

        pipeline::StageSequenceOptions sequence;
        sequence.skipCompression = options_.skipCompression;
        auto stages = pipeline::buildDefaultStages(config, std::move(sequence));

        pipeline::PipelineOrchestrator orchestrator(std::move(config));
        for (auto& stage : stages) {
            orchestrator.addStage(std::move(stage));
        }

        if (auto validated = orchestrator.validate(); !validated.has_value()) {
            REFDB_LOG_ERROR("Configuration error: {}", validated.error().message());
            return validated.error().exitCode();
        }
        REFDB_LOG_INFO("Loaded {} accessions", orchestrator.entries().size());

        auto result = orchestrator.run("job");
        if (!result.has_value()) {
            REFDB_LOG_ERROR("Build of {} failed at stage {}: {}", options_.version,
                            orchestrator.failedStage().value_or("startup"),
                            result.error().message());
            return result.error().exitCode();
        }

        const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                                           startTime)
                                 .count();
        REFDB_LOG_INFO("Build of {} finished in {:.1f} s", options_.version, elapsed);
        return 0;

    } catch (const RefdbException& e) {
        REFDB_LOG_ERROR("Build failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        REFDB_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kIOError);
    }
}

}  // namespace refdb::commands
