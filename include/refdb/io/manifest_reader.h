// =============================================================================
// refdb - Accession Manifest Reader
// =============================================================================
// Parses the tab-separated reference-genome listing into an ordered list of
// accessions.
//
// Input format:
//   assembly_accession<TAB>...     <- header row (required, ignored)
//   GCF_000005845.2<TAB>...        <- first column = accession
//
// Plain and gzip-compressed files are accepted.
// =============================================================================

#ifndef REFDB_IO_MANIFEST_READER_H
#define REFDB_IO_MANIFEST_READER_H

#include <cstddef>
#include <filesystem>
#include <istream>
#include <string>
#include <vector>

#include "refdb/common/error.h"
#include "refdb/common/types.h"

namespace refdb::io {

/// @brief Result of parsing a manifest.
struct Manifest {
    /// @brief Entries in input order, all kPending.
    std::vector<GenomeManifestEntry> entries;

    /// @brief Data rows skipped because the accession column was blank.
    std::size_t blankRows = 0;

    /// @brief Data rows skipped because the accession was already listed.
    std::size_t duplicateRows = 0;

    [[nodiscard]] std::size_t size() const noexcept { return entries.size(); }
};

/// @brief Parse a manifest from a stream.
/// @param in Input stream positioned at the header row.
/// @param sourceName Name used in warnings and errors.
/// @throws ManifestError if there are no data rows or no usable accession.
[[nodiscard]] Manifest parseManifest(std::istream& in, const std::string& sourceName);

/// @brief Read a manifest file (plain or gzip).
/// @throws ManifestError if the file is absent or has no data rows.
[[nodiscard]] Manifest readManifest(const std::filesystem::path& path);

}  // namespace refdb::io

#endif  // REFDB_IO_MANIFEST_READER_H
