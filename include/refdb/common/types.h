// =============================================================================
// refdb - Common Type Definitions
// =============================================================================
// Core type definitions for the refdb library.
//
// This module defines:
// - Accession: Type alias for genome assembly identifiers
// - EntryStatus: Acquisition state of one manifest entry
// - SequenceStatus: Extraction state of one manifest entry
// - GenomeManifestEntry: One accession with its current states
// - File naming constants shared by every stage
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef REFDB_COMMON_TYPES_H
#define REFDB_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace refdb {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Genome assembly accession (e.g. "GCF_000005845.2").
/// @note Drives all per-entry file naming.
using Accession = std::string;

// =============================================================================
// Constants
// =============================================================================

/// @brief Subdirectory of the output directory holding per-genome files.
inline constexpr std::string_view kGenomesDirName = "genomes";

/// @brief Subdirectory of the output directory holding run logs.
inline constexpr std::string_view kLogsDirName = "logs";

/// @brief Per-genome archive extension.
inline constexpr std::string_view kArchiveExtension = ".zip";

/// @brief Per-genome extracted sequence extension.
inline constexpr std::string_view kSequenceExtension = ".fna";

/// @brief Suffix of in-progress files; renamed away on success.
inline constexpr std::string_view kPartialSuffix = ".part";

/// @brief Accessions whose extracted sequence was zero bytes.
inline constexpr std::string_view kEmptyManifestName = "empty_list.txt";

/// @brief Missing accessions reported by the alternate-genome collaborator.
inline constexpr std::string_view kAlternateEmptyManifestName = "empty_list2.txt";

/// @brief Merged missing-genome report in the output directory.
inline constexpr std::string_view kMissingReportName = "missing_fna.txt";

/// @brief Persistent accession status table in the genomes directory.
inline constexpr std::string_view kStatusTableName = "status.tsv";

/// @brief Append-only download failure manifest in the logs directory.
inline constexpr std::string_view kDownloadFailureManifestName = "failed_downloads.txt";

/// @brief Append-only extraction failure manifest in the logs directory.
inline constexpr std::string_view kExtractionFailureManifestName = "failed_extractions.txt";

/// @brief Progress is reported after this many processed entries.
inline constexpr std::size_t kDefaultProgressInterval = 100;

// =============================================================================
// Entry Status Enumeration
// =============================================================================

/// @brief Acquisition state of a manifest entry.
/// @note Final states after acquisition are kCached, kRestoredFromBackup,
///       kDownloaded or kFailed; kPending only before the stage runs.
enum class EntryStatus : std::uint8_t {
    /// @brief Not yet processed.
    kPending = 0,

    /// @brief Archive already present locally.
    kCached = 1,

    /// @brief Archive copied from the backup directory.
    kRestoredFromBackup = 2,

    /// @brief Archive fetched from the network.
    kDownloaded = 3,

    /// @brief All sources exhausted.
    kFailed = 4
};

/// @brief Convert EntryStatus to its persisted string form.
[[nodiscard]] constexpr std::string_view entryStatusToString(EntryStatus status) noexcept {
    switch (status) {
        case EntryStatus::kPending:
            return "pending";
        case EntryStatus::kCached:
            return "cached";
        case EntryStatus::kRestoredFromBackup:
            return "restored_from_backup";
        case EntryStatus::kDownloaded:
            return "downloaded";
        case EntryStatus::kFailed:
            return "failed";
    }
    return "pending";
}

/// @brief Parse a persisted EntryStatus string.
/// @return The status, or std::nullopt for unknown strings.
[[nodiscard]] std::optional<EntryStatus> entryStatusFromString(std::string_view str) noexcept;

// =============================================================================
// Sequence Status Enumeration
// =============================================================================

/// @brief Extraction state of a manifest entry.
enum class SequenceStatus : std::uint8_t {
    /// @brief Not yet processed.
    kPending = 0,

    /// @brief Non-empty sequence file already present.
    kPresent = 1,

    /// @brief Sequence file copied from the backup directory.
    kRestoredFromBackup = 2,

    /// @brief Sequence unpacked from the archive.
    kExtracted = 3,

    /// @brief Unpacking failed or produced no output.
    kFailed = 4,

    /// @brief Removed by the integrity filter (zero bytes).
    kEmpty = 5
};

/// @brief Convert SequenceStatus to its persisted string form.
[[nodiscard]] constexpr std::string_view sequenceStatusToString(SequenceStatus status) noexcept {
    switch (status) {
        case SequenceStatus::kPending:
            return "pending";
        case SequenceStatus::kPresent:
            return "present";
        case SequenceStatus::kRestoredFromBackup:
            return "restored_from_backup";
        case SequenceStatus::kExtracted:
            return "extracted";
        case SequenceStatus::kFailed:
            return "failed";
        case SequenceStatus::kEmpty:
            return "empty";
    }
    return "pending";
}

/// @brief Parse a persisted SequenceStatus string.
[[nodiscard]] std::optional<SequenceStatus> sequenceStatusFromString(std::string_view str) noexcept;

// =============================================================================
// GenomeManifestEntry Structure
// =============================================================================

/// @brief One accession of the input manifest and its pipeline state.
/// @note Identity is the accession; entries are only status-transitioned,
///       never removed.
struct GenomeManifestEntry {
    /// @brief Assembly accession (first manifest column).
    Accession accession;

    /// @brief Acquisition state.
    EntryStatus status = EntryStatus::kPending;

    /// @brief Extraction state.
    SequenceStatus sequenceStatus = SequenceStatus::kPending;

    GenomeManifestEntry() = default;

    explicit GenomeManifestEntry(Accession accession_) : accession(std::move(accession_)) {}

    [[nodiscard]] bool operator==(const GenomeManifestEntry& other) const noexcept = default;
};

/// @brief Strip a directory prefix and a trailing extension from a file name.
/// @note "./genomes/GCF_1.2.fna" -> "GCF_1.2" when extension is ".fna".
[[nodiscard]] Accession bareAccession(std::string_view name, std::string_view extension);

}  // namespace refdb

#endif  // REFDB_COMMON_TYPES_H
