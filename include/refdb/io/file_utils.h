// =============================================================================
// refdb - Filesystem Utilities
// =============================================================================
// Small filesystem helpers shared by the pipeline stages.
//
// All writers go through a `<name>.part` sibling that is renamed into place,
// so an interrupted process never leaves a truncated file under the final
// name. Accession lists are plain text, one entry per line.
// =============================================================================

#ifndef REFDB_IO_FILE_UTILS_H
#define REFDB_IO_FILE_UTILS_H

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace refdb::io {

/// @brief Size of a regular file, or 0 if it does not exist.
[[nodiscard]] std::uint64_t fileSizeOrZero(const std::filesystem::path& path) noexcept;

/// @brief Check that a regular file exists and holds at least one byte.
[[nodiscard]] bool isNonEmptyFile(const std::filesystem::path& path) noexcept;

/// @brief Path of the in-progress sibling of a file.
[[nodiscard]] std::filesystem::path partialPath(const std::filesystem::path& path);

/// @brief Regular files in `dir` with the given extension, sorted by name.
/// @note In-progress `.part` files never match.
/// @throws IOError if the directory cannot be listed.
[[nodiscard]] std::vector<std::filesystem::path> listFilesWithExtension(
    const std::filesystem::path& dir, std::string_view extension);

/// @brief Create a directory and its parents if missing.
/// @throws IOError on failure.
void ensureDirectory(const std::filesystem::path& dir);

/// @brief Copy a file via a partial sibling and rename it into place.
/// @throws IOError on failure; no file is left under `to`.
void copyFileAtomic(const std::filesystem::path& from, const std::filesystem::path& to);

/// @brief Rename a completed partial file to its final name.
/// @throws IOError on failure.
void commitPartial(const std::filesystem::path& partial, const std::filesystem::path& target);

/// @brief Remove a file, ignoring a missing file.
void removeQuietly(const std::filesystem::path& path) noexcept;

/// @brief Append one line to a text file, creating it if needed.
/// @throws IOError on failure.
void appendLine(const std::filesystem::path& path, std::string_view line);

/// @brief Replace a text file with the given lines.
/// @throws IOError on failure.
void writeLinesAtomic(const std::filesystem::path& path, const std::vector<std::string>& lines);

/// @brief Read the non-blank lines of a text file.
/// @return Empty vector if the file does not exist.
/// @throws IOError if the file exists but cannot be read.
[[nodiscard]] std::vector<std::string> readLines(const std::filesystem::path& path);

/// @brief Trim ASCII whitespace from both ends.
[[nodiscard]] std::string_view trim(std::string_view str) noexcept;

}  // namespace refdb::io

#endif  // REFDB_IO_FILE_UTILS_H
