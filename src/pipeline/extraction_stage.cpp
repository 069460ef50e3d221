// =============================================================================
// refdb - Extraction Stage Implementation
// =============================================================================

#include "refdb/pipeline/extraction_stage.h"

#include <fstream>

#include "refdb/common/cancellation.h"
#include "refdb/common/logger.h"
#include "refdb/io/file_utils.h"
#include "refdb/io/zip_archive.h"

namespace refdb::pipeline {

namespace fs = std::filesystem;

namespace {

/// @brief Write the sequence members of `archive` to `partial`.
/// @return Number of bytes written.
std::uint64_t unpackSequences(const fs::path& archive, const fs::path& partial) {
    io::ZipArchive zip(archive);

    std::ofstream out(partial, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw IOError("Cannot open for writing", ErrorContext(partial.string()));
    }
    const std::uint64_t bytes = zip.extractMatching(kSequenceExtension, out);
    if (!out.flush()) {
        throw IOError("Write failed", ErrorContext(partial.string()));
    }
    return bytes;
}

}  // namespace

ExtractionStage::ExtractionStage(Sleeper sleeper) : sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = interruptibleSleep;
    }
}

VoidResult ExtractionStage::run(RunContext& context) {
    return tryExecute([&] { extractAll(context); });
}

void ExtractionStage::extractAll(RunContext& context) {
    const PipelineConfig& config = context.config;
    io::ensureDirectory(config.logsDir());

    const auto archives = io::listFilesWithExtension(config.genomesDir(), kArchiveExtension);
    if (archives.empty()) {
        throw StageFailure(std::string(name()),
                           "no archives found in " + config.genomesDir().string());
    }

    report_ = ExtractionReport{};
    report_.archives = archives.size();
    REFDB_LOG_INFO("Extracting sequences from {} archives", report_.archives);

    StatusCheckpoint checkpoint(context.status, config.progressInterval);
    std::size_t processed = 0;
    for (const auto& archive : archives) {
        throwIfCancelled();

        const Accession accession = bareAccession(archive.filename().string(), kArchiveExtension);
        const SequenceStatus status = extract(config, archive, accession);
        context.status.setSequenceStatus(accession, status);
        checkpoint.tick();
        for (auto& entry : context.entries) {
            if (entry.accession == accession) {
                entry.sequenceStatus = status;
            }
        }

        switch (status) {
            case SequenceStatus::kPresent:
                ++report_.present;
                break;
            case SequenceStatus::kRestoredFromBackup:
                ++report_.restored;
                break;
            case SequenceStatus::kExtracted:
                ++report_.extracted;
                break;
            case SequenceStatus::kFailed:
                io::appendLine(config.extractionFailuresPath(), accession);
                ++report_.failed;
                break;
            default:
                break;
        }

        ++processed;
        if (processed % config.progressInterval == 0) {
            REFDB_LOG_INFO("Extracted {} of {} archives ({} failed so far)", processed,
                           report_.archives, report_.failed);
        }
    }

    checkpoint.finish();

    REFDB_LOG_INFO(
        "Extraction finished: {} archives, {} present, {} restored from backup, {} extracted, "
        "{} failed",
        report_.archives, report_.present, report_.restored, report_.extracted, report_.failed);
}

SequenceStatus ExtractionStage::extract(const PipelineConfig& config, const fs::path& archive,
                                        const Accession& accession) {
    const fs::path target = config.sequencePath(accession);
    if (io::isNonEmptyFile(target)) {
        REFDB_LOG_DEBUG("{} already extracted, skipping", accession);
        return SequenceStatus::kPresent;
    }

    if (const auto backup = config.backupSequencePath(accession);
        backup.has_value() && io::isNonEmptyFile(*backup)) {
        auto copied = tryExecute([&] { io::copyFileAtomic(*backup, target); });
        if (copied.has_value()) {
            REFDB_LOG_INFO("Restored {} sequence from backup", accession);
            return SequenceStatus::kRestoredFromBackup;
        }
        REFDB_LOG_WARNING("Backup copy of {} sequence failed: {}", accession,
                          copied.error().message());
    }

    const fs::path partial = io::partialPath(target);
    std::uint64_t bytes = 0;
    auto attempt = [&](std::uint32_t /*attemptNumber*/) -> VoidResult {
        auto unpacked = tryExecute([&] { return unpackSequences(archive, partial); });
        if (!unpacked.has_value()) {
            io::removeQuietly(partial);
            return std::unexpected(unpacked.error());
        }
        bytes = *unpacked;
        return makeVoidSuccess();
    };

    const auto result = config.extractionRetry.run(accession, attempt, sleeper_);
    if (!result.has_value()) {
        REFDB_LOG_ERROR("Failed to extract {}: {}", archive.string(), result.error().message());
        return SequenceStatus::kFailed;
    }

    io::commitPartial(partial, target);
    if (bytes == 0) {
        REFDB_LOG_WARNING("Archive {} contains no sequence data", archive.string());
        return SequenceStatus::kFailed;
    }

    REFDB_LOG_DEBUG("Extracted {} ({} bytes)", accession, bytes);
    return SequenceStatus::kExtracted;
}

}  // namespace refdb::pipeline
