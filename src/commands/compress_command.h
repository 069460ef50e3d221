// =============================================================================
// refdb - Compress Command
// =============================================================================
// Command handler for compressing an already assembled artifact
// (`refdb compress --version <tag>`), independent of the build stages.
// =============================================================================

#ifndef REFDB_COMMANDS_COMPRESS_COMMAND_H
#define REFDB_COMMANDS_COMPRESS_COMMAND_H

#include <filesystem>
#include <string>

#include "refdb/io/compressed_stream.h"

namespace refdb::commands {

/// @brief Configuration options for compression.
struct CompressOptions {
    /// @brief Version tag of the artifact to compress.
    std::string version;

    /// @brief Directory holding refseq_database_<version>.fa.
    std::filesystem::path outputDir = ".";

    /// @brief gzip level (1-9).
    int level = io::kDefaultGzipLevel;
};

/// @brief Command handler for `refdb compress`.
class CompressCommand {
public:
    explicit CompressCommand(CompressOptions options);

    CompressCommand(const CompressCommand&) = delete;
    CompressCommand& operator=(const CompressCommand&) = delete;

    /// @brief Execute the compression.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const CompressOptions& options() const noexcept { return options_; }

private:
    CompressOptions options_;
};

}  // namespace refdb::commands

#endif  // REFDB_COMMANDS_COMPRESS_COMMAND_H
