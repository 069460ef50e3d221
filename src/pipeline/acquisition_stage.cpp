// =============================================================================
// refdb - Acquisition Stage Implementation
// =============================================================================

#include "refdb/pipeline/acquisition_stage.h"

#include "refdb/common/cancellation.h"
#include "refdb/common/logger.h"
#include "refdb/io/file_utils.h"
#include "refdb/io/zip_archive.h"

namespace refdb::pipeline {

namespace fs = std::filesystem;

namespace {

bool isAcquired(EntryStatus status) noexcept {
    return status == EntryStatus::kCached || status == EntryStatus::kDownloaded ||
           status == EntryStatus::kRestoredFromBackup;
}

}  // namespace

AcquisitionStage::AcquisitionStage(std::unique_ptr<net::ArchiveFetcher> fetcher, Sleeper sleeper)
    : fetcher_(std::move(fetcher)), sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = interruptibleSleep;
    }
}

VoidResult AcquisitionStage::run(RunContext& context) {
    return tryExecute([&] { acquireAll(context); });
}

void AcquisitionStage::acquireAll(RunContext& context) {
    const PipelineConfig& config = context.config;
    io::ensureDirectory(config.genomesDir());
    io::ensureDirectory(config.logsDir());

    report_ = AcquisitionReport{};
    report_.total = context.entries.size();

    REFDB_LOG_INFO("Acquiring archives for {} genomes", report_.total);

    StatusCheckpoint checkpoint(context.status, config.progressInterval);
    std::size_t processed = 0;
    for (auto& entry : context.entries) {
        throwIfCancelled();

        entry.status = acquire(config, context.status, entry.accession);
        context.status.setArchiveStatus(entry.accession, entry.status);
        checkpoint.tick();

        switch (entry.status) {
            case EntryStatus::kCached:
                ++report_.cached;
                break;
            case EntryStatus::kRestoredFromBackup:
                ++report_.restored;
                break;
            case EntryStatus::kDownloaded:
                ++report_.downloaded;
                break;
            case EntryStatus::kFailed:
                io::appendLine(config.downloadFailuresPath(), entry.accession);
                ++report_.failed;
                break;
            case EntryStatus::kPending:
                break;
        }

        ++processed;
        if (processed % config.progressInterval == 0) {
            REFDB_LOG_INFO("Processed {} of {} genomes ({} failed so far)", processed,
                           report_.total, report_.failed);
        }
    }

    checkpoint.finish();

    REFDB_LOG_INFO(
        "Acquisition finished: {} total, {} cached, {} restored from backup, {} downloaded, "
        "{} failed",
        report_.total, report_.cached, report_.restored, report_.downloaded, report_.failed);
    if (report_.failed > 0) {
        REFDB_LOG_WARNING("{} archives could not be acquired, see {}", report_.failed,
                          config.downloadFailuresPath().string());
    }
}

EntryStatus AcquisitionStage::acquire(const PipelineConfig& config, const StatusTable& status,
                                      const Accession& accession) {
    const fs::path target = config.archivePath(accession);

    std::error_code ec;
    if (fs::exists(target, ec)) {
        // Archives this pipeline did not record as acquired get every member checked
        const auto record = status.find(accession);
        const bool recorded = record.has_value() && isAcquired(record->archive);
        const bool usable = io::isNonEmptyFile(target) &&
                            (recorded ? io::ZipArchive::isReadable(target)
                                      : io::ZipArchive::isIntact(target));
        if (usable) {
            REFDB_LOG_DEBUG("{} already present, skipping", accession);
            return EntryStatus::kCached;
        }
        REFDB_LOG_WARNING("Discarding unreadable archive {}", target.string());
        io::removeQuietly(target);
    }

    if (const auto backup = config.backupArchivePath(accession);
        backup.has_value() && io::isNonEmptyFile(*backup)) {
        auto copied = tryExecute([&] { io::copyFileAtomic(*backup, target); });
        if (copied.has_value()) {
            REFDB_LOG_INFO("Restored {} from backup", accession);
            return EntryStatus::kRestoredFromBackup;
        }
        REFDB_LOG_WARNING("Backup copy of {} failed: {}", accession, copied.error().message());
    }

    return download(config, accession) ? EntryStatus::kDownloaded : EntryStatus::kFailed;
}

bool AcquisitionStage::download(const PipelineConfig& config, const Accession& accession) {
    const fs::path target = config.archivePath(accession);
    const fs::path partial = io::partialPath(target);

    auto attempt = [&](std::uint32_t attemptNumber) -> VoidResult {
        REFDB_LOG_DEBUG("Downloading {} (attempt {})", accession, attemptNumber);
        io::removeQuietly(partial);

        const net::FetchOutcome outcome = fetcher_->fetch(accession, partial);
        if (!outcome.transferOk) {
            io::removeQuietly(partial);
            return makeVoidError(ErrorCode::kIOError, outcome.message);
        }
        if (!io::isNonEmptyFile(partial)) {
            io::removeQuietly(partial);
            return makeVoidError(ErrorCode::kIOError, "empty response");
        }

        io::commitPartial(partial, target);
        return makeVoidSuccess();
    };

    const auto result = config.downloadRetry.run(accession, attempt, sleeper_);
    if (!result.has_value()) {
        return false;
    }
    REFDB_LOG_INFO("Downloaded {}", accession);
    return true;
}

}  // namespace refdb::pipeline
