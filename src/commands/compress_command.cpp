// =============================================================================
// refdb - Compress Command Implementation
// =============================================================================

#include "compress_command.h"

#include "refdb/common/error.h"
#include "refdb/common/logger.h"
#include "refdb/pipeline/orchestrator.h"

namespace refdb::commands {

CompressCommand::CompressCommand(CompressOptions options) : options_(std::move(options)) {}

int CompressCommand::execute() {
    try {
        pipeline::PipelineConfig config;
        config.version = options_.version;
        config.outputDir = options_.outputDir;
        config.gzipLevel = options_.level;

        pipeline::PipelineOrchestrator orchestrator(std::move(config));
        for (auto& stage : pipeline::buildCompressionStages()) {
            orchestrator.addStage(std::move(stage));
        }

        if (auto validated = orchestrator.validate(); !validated.has_value()) {
            REFDB_LOG_ERROR("Configuration error: {}", validated.error().message());
            return validated.error().exitCode();
        }

        auto result = orchestrator.run("compress");
        if (!result.has_value()) {
            REFDB_LOG_ERROR("Compression of {} failed: {}", options_.version,
                            result.error().message());
            return result.error().exitCode();
        }
        return 0;

    } catch (const RefdbException& e) {
        REFDB_LOG_ERROR("Compression failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        REFDB_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kIOError);
    }
}

}  // namespace refdb::commands
