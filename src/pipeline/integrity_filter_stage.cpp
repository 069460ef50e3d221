// =============================================================================
// refdb - Integrity Filter Stage Implementation
// =============================================================================

#include "refdb/pipeline/integrity_filter_stage.h"

#include "refdb/common/logger.h"
#include "refdb/io/file_utils.h"

namespace refdb::pipeline {

VoidResult IntegrityFilterStage::run(RunContext& context) {
    return tryExecute([&] { filter(context); });
}

void IntegrityFilterStage::filter(RunContext& context) {
    const PipelineConfig& config = context.config;
    io::ensureDirectory(config.genomesDir());

    quarantined_.clear();
    for (const auto& sequence :
         io::listFilesWithExtension(config.genomesDir(), kSequenceExtension)) {
        if (io::fileSizeOrZero(sequence) > 0) {
            continue;
        }
        const Accession accession =
            bareAccession(sequence.filename().string(), kSequenceExtension);
        REFDB_LOG_WARNING("Removing empty sequence file {}", sequence.string());
        io::removeQuietly(sequence);
        context.status.setSequenceStatus(accession, SequenceStatus::kEmpty);
        for (auto& entry : context.entries) {
            if (entry.accession == accession) {
                entry.sequenceStatus = SequenceStatus::kEmpty;
            }
        }
        quarantined_.push_back(accession);
    }

    io::writeLinesAtomic(config.emptyManifestPath(), quarantined_);
    if (context.status.dirty()) {
        context.status.save();
    }

    if (quarantined_.empty()) {
        REFDB_LOG_INFO("No empty sequence files found");
    } else {
        REFDB_LOG_INFO("Quarantined {} empty sequence files into {}", quarantined_.size(),
                       config.emptyManifestPath().string());
    }
}

}  // namespace refdb::pipeline
