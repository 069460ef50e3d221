// =============================================================================
// refdb - Accession Manifest Reader Implementation
// =============================================================================

#include "refdb/io/manifest_reader.h"

#include <unordered_set>

#include "refdb/common/logger.h"
#include "refdb/io/compressed_stream.h"
#include "refdb/io/file_utils.h"

namespace refdb::io {

Manifest parseManifest(std::istream& in, const std::string& sourceName) {
    Manifest manifest;
    std::string line;

    if (!std::getline(in, line)) {
        throw ManifestError("Manifest is empty (expected a header row)", ErrorContext(sourceName));
    }

    std::unordered_set<std::string> seen;
    std::size_t lineNumber = 1;
    std::size_t dataRows = 0;

    while (std::getline(in, line)) {
        ++lineNumber;

        // Empty lines are not data rows
        if (line.empty() || line == "\r") {
            continue;
        }
        ++dataRows;

        const auto tab = line.find('\t');
        const std::string_view firstColumn =
            trim(std::string_view(line).substr(0, tab == std::string::npos ? line.size() : tab));

        if (firstColumn.empty()) {
            REFDB_LOG_WARNING("Empty accession on line {} of {}, skipping", lineNumber,
                              sourceName);
            ++manifest.blankRows;
            continue;
        }

        std::string accession(firstColumn);
        if (!seen.insert(accession).second) {
            REFDB_LOG_WARNING("Duplicate accession {} on line {} of {}, skipping", accession,
                              lineNumber, sourceName);
            ++manifest.duplicateRows;
            continue;
        }

        manifest.entries.emplace_back(std::move(accession));
    }

    if (in.bad()) {
        throw IOError("Read failed", ErrorContext(sourceName));
    }

    if (dataRows == 0) {
        throw ManifestError("Manifest has no data rows (only header?)", ErrorContext(sourceName));
    }
    if (manifest.entries.empty()) {
        throw ManifestError("Manifest has no usable accessions", ErrorContext(sourceName));
    }

    return manifest;
}

Manifest readManifest(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw ManifestError("Genome manifest not found", ErrorContext(path.string()));
    }

    auto stream = openCompressedFile(path);
    Manifest manifest = parseManifest(*stream, path.string());

    REFDB_LOG_INFO("Read {} accessions from {} ({} blank, {} duplicate rows skipped)",
                   manifest.size(), path.string(), manifest.blankRows, manifest.duplicateRows);
    return manifest;
}

}  // namespace refdb::io
