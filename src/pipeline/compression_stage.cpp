// =============================================================================
// refdb - Compression Stage Implementation
// =============================================================================

#include "refdb/pipeline/compression_stage.h"

#include "refdb/common/logger.h"
#include "refdb/io/file_utils.h"

namespace refdb::pipeline {

VoidResult CompressionStage::run(RunContext& context) {
    return tryExecute([&] {
        const PipelineConfig& config = context.config;
        const auto artifact = config.artifactPath();
        const auto compressed = config.compressedArtifactPath();

        std::error_code ec;
        if (!std::filesystem::is_regular_file(artifact, ec)) {
            throw StageFailure(std::string(name()), artifact.string() + " does not exist");
        }

        REFDB_LOG_INFO("Compressing {} (gzip level {})", artifact.string(), config.gzipLevel);
        stats_ = io::gzipFile(artifact, compressed, config.gzipLevel);

        std::filesystem::remove(artifact, ec);
        if (ec) {
            throw IOError("Cannot remove uncompressed artifact", ec,
                          ErrorContext(artifact.string()));
        }

        REFDB_LOG_INFO("Wrote {} ({} -> {} bytes, ratio {:.2f})", compressed.string(),
                       stats_.inputBytes, stats_.outputBytes, stats_.compressionRatio());
    });
}

}  // namespace refdb::pipeline
