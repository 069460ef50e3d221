// =============================================================================
// refdb - Common Type Helpers
// =============================================================================

#include "refdb/common/types.h"

namespace refdb {

std::optional<EntryStatus> entryStatusFromString(std::string_view str) noexcept {
    for (auto status : {EntryStatus::kPending, EntryStatus::kCached,
                        EntryStatus::kRestoredFromBackup, EntryStatus::kDownloaded,
                        EntryStatus::kFailed}) {
        if (entryStatusToString(status) == str) {
            return status;
        }
    }
    return std::nullopt;
}

std::optional<SequenceStatus> sequenceStatusFromString(std::string_view str) noexcept {
    for (auto status : {SequenceStatus::kPending, SequenceStatus::kPresent,
                        SequenceStatus::kRestoredFromBackup, SequenceStatus::kExtracted,
                        SequenceStatus::kFailed, SequenceStatus::kEmpty}) {
        if (sequenceStatusToString(status) == str) {
            return status;
        }
    }
    return std::nullopt;
}

Accession bareAccession(std::string_view name, std::string_view extension) {
    const auto slash = name.find_last_of('/');
    if (slash != std::string_view::npos) {
        name.remove_prefix(slash + 1);
    }
    if (!extension.empty() && name.size() > extension.size() && name.ends_with(extension)) {
        name.remove_suffix(extension.size());
    }
    return Accession(name);
}

}  // namespace refdb
