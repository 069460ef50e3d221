// =============================================================================
// refdb - Zip Archive Reader
// =============================================================================
// Read-only access to the zip packages served by the NCBI Datasets API.
//
// This module provides:
// - ZipEntry: one central-directory record
// - ZipArchive: minizip-backed reader with streaming extraction of members
//
// minizip verifies each member's CRC-32 once it has been read to the end.
// A file whose central directory cannot be located (for example a transfer
// cut short) fails to open, which is how truncated archives are told apart
// from complete ones.
// =============================================================================

#ifndef REFDB_IO_ZIP_ARCHIVE_H
#define REFDB_IO_ZIP_ARCHIVE_H

#include <minizip/unzip.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "refdb/common/error.h"

namespace refdb::io {

/// @brief Compression methods understood by the reader.
enum class ZipMethod : std::uint16_t {
    kStored = 0,
    kDeflated = 8
};

/// @brief One member of a zip archive.
struct ZipEntry {
    /// @brief Path of the member inside the archive.
    std::string name;

    /// @brief Raw compression method from the central directory.
    std::uint16_t method = 0;

    /// @brief General purpose flags.
    std::uint16_t flags = 0;

    /// @brief CRC-32 of the uncompressed data.
    std::uint32_t crc32 = 0;

    /// @brief Size of the stored (compressed) data.
    std::uint64_t compressedSize = 0;

    /// @brief Size after extraction.
    std::uint64_t uncompressedSize = 0;

    /// @brief Directory entries end with '/'.
    [[nodiscard]] bool isDirectory() const noexcept {
        return !name.empty() && name.back() == '/';
    }

    /// @brief Encrypted members cannot be extracted.
    [[nodiscard]] bool isEncrypted() const noexcept { return (flags & 0x0001U) != 0; }
};

/// @brief Zip archive opened for reading.
class ZipArchive {
public:
    /// @brief Open an archive and read its central directory.
    /// @throws IOError if the file does not exist.
    /// @throws ArchiveError if the archive structure is invalid.
    explicit ZipArchive(const std::filesystem::path& path);

    ~ZipArchive();

    ZipArchive(const ZipArchive&) = delete;
    ZipArchive& operator=(const ZipArchive&) = delete;

    /// @brief Check whether a file is a structurally complete zip archive.
    [[nodiscard]] static bool isReadable(const std::filesystem::path& path) noexcept;

    /// @brief isReadable() plus a full read of every member, CRC-32 included.
    [[nodiscard]] static bool isIntact(const std::filesystem::path& path) noexcept;

    /// @brief Read every file member to the end, discarding the data.
    /// @throws ArchiveError on corrupt data or CRC mismatch.
    void verify();

    /// @brief Central-directory entries in archive order.
    [[nodiscard]] const std::vector<ZipEntry>& entries() const noexcept { return entries_; }

    /// @brief Path the archive was opened from.
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    /// @brief Stream one member's uncompressed bytes to `out`.
    /// @return Number of bytes written.
    /// @throws ArchiveError on corrupt data or CRC mismatch.
    std::uint64_t extract(const ZipEntry& entry, std::ostream& out);

    /// @brief Concatenate every file member whose name ends with `suffix`.
    /// @return Total number of bytes written (0 if nothing matched).
    /// @throws ArchiveError on corrupt data or CRC mismatch.
    std::uint64_t extractMatching(std::string_view suffix, std::ostream& out);

private:
    struct UnzCloser {
        void operator()(std::remove_pointer_t<unzFile>* handle) const noexcept;
    };
    using UnzHandle = std::unique_ptr<std::remove_pointer_t<unzFile>, UnzCloser>;

    void readCentralDirectory();
    std::uint64_t extractCurrent(const ZipEntry& entry, std::ostream& out);

    std::filesystem::path path_;
    UnzHandle handle_;
    std::vector<ZipEntry> entries_;

    /// @brief Directory position of each entry, parallel to entries_.
    std::vector<unz64_file_pos> positions_;
};

}  // namespace refdb::io

#endif  // REFDB_IO_ZIP_ARCHIVE_H
