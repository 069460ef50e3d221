// =============================================================================
// refdb - Zip Archive Reader Implementation
// =============================================================================

#include "refdb/io/zip_archive.h"

#include <streambuf>
#include <system_error>

#include "refdb/common/logger.h"

namespace refdb::io {

namespace {

constexpr std::size_t kExtractChunkSize = 256 * 1024;

/// @brief Throw ArchiveError for a failed minizip call.
void throwIfUnzError(const std::filesystem::path& path, std::string_view what, int err) {
    if (err != UNZ_OK) {
        throw ArchiveError(std::string(what) + " failed (unzip error " + std::to_string(err) + ")",
                           ErrorContext(path.string()));
    }
}

/// @brief Stream buffer that accepts and drops everything.
class DiscardBuffer : public std::streambuf {
protected:
    int_type overflow(int_type ch) override { return traits_type::not_eof(ch); }
    std::streamsize xsputn(const char* /*data*/, std::streamsize count) override {
        return count;
    }
};

}  // namespace

// =============================================================================
// ZipArchive Implementation
// =============================================================================

void ZipArchive::UnzCloser::operator()(std::remove_pointer_t<unzFile>* handle) const noexcept {
    if (handle != nullptr) {
        unzClose(handle);
    }
}

ZipArchive::ZipArchive(const std::filesystem::path& path) : path_(path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw IOError("Failed to open archive", ErrorContext(path.string()));
    }

    handle_.reset(unzOpen64(path.c_str()));
    if (!handle_) {
        throw ArchiveError("No zip central directory found", ErrorContext(path.string()));
    }
    readCentralDirectory();
}

ZipArchive::~ZipArchive() = default;

bool ZipArchive::isReadable(const std::filesystem::path& path) noexcept {
    try {
        ZipArchive archive(path);
        return true;
    } catch (const std::exception& ex) {
        REFDB_LOG_DEBUG("Archive {} is not readable: {}", path.string(), ex.what());
        return false;
    }
}

bool ZipArchive::isIntact(const std::filesystem::path& path) noexcept {
    try {
        ZipArchive archive(path);
        archive.verify();
        return true;
    } catch (const std::exception& ex) {
        REFDB_LOG_DEBUG("Archive {} failed verification: {}", path.string(), ex.what());
        return false;
    }
}

void ZipArchive::verify() {
    DiscardBuffer discard;
    std::ostream sink(&discard);
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        if (entries_[i].isDirectory()) {
            continue;
        }
        throwIfUnzError(path_, "unzGoToFilePos64",
                        unzGoToFilePos64(handle_.get(), &positions_[i]));
        (void)extractCurrent(entries_[i], sink);
    }
}

void ZipArchive::readCentralDirectory() {
    unzFile uf = handle_.get();
    int err = unzGoToFirstFile(uf);
    throwIfUnzError(path_, "unzGoToFirstFile", err);

    do {
        unz_file_info64 info{};
        err = unzGetCurrentFileInfo64(uf, &info, nullptr, 0, nullptr, 0, nullptr, 0);
        throwIfUnzError(path_, "unzGetCurrentFileInfo64", err);

        std::string name(info.size_filename, '\0');
        err = unzGetCurrentFileInfo64(uf, &info, name.data(),
                                      static_cast<uLong>(name.size()), nullptr, 0, nullptr, 0);
        throwIfUnzError(path_, "unzGetCurrentFileInfo64", err);

        unz64_file_pos position{};
        err = unzGetFilePos64(uf, &position);
        throwIfUnzError(path_, "unzGetFilePos64", err);

        ZipEntry entry;
        entry.name = std::move(name);
        entry.method = static_cast<std::uint16_t>(info.compression_method);
        entry.flags = static_cast<std::uint16_t>(info.flag);
        entry.crc32 = static_cast<std::uint32_t>(info.crc);
        entry.compressedSize = info.compressed_size;
        entry.uncompressedSize = info.uncompressed_size;
        entries_.push_back(std::move(entry));
        positions_.push_back(position);

        err = unzGoToNextFile(uf);
    } while (err == UNZ_OK);

    if (err != UNZ_END_OF_LIST_OF_FILE) {
        throwIfUnzError(path_, "unzGoToNextFile", err);
    }
}

std::uint64_t ZipArchive::extract(const ZipEntry& entry, std::ostream& out) {
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        if (entries_[i].name == entry.name) {
            throwIfUnzError(path_, "unzGoToFilePos64",
                            unzGoToFilePos64(handle_.get(), &positions_[i]));
            return extractCurrent(entries_[i], out);
        }
    }
    throw ArchiveError("No member named " + entry.name, ErrorContext(path_.string()));
}

std::uint64_t ZipArchive::extractCurrent(const ZipEntry& entry, std::ostream& out) {
    if (entry.isEncrypted()) {
        throw ArchiveError("Encrypted member not supported: " + entry.name,
                           ErrorContext(path_.string()));
    }

    const auto method = static_cast<ZipMethod>(entry.method);
    if (method != ZipMethod::kStored && method != ZipMethod::kDeflated) {
        throw ArchiveError("Unsupported compression method " + std::to_string(entry.method) +
                               " for " + entry.name,
                           ErrorContext(path_.string()));
    }

    unzFile uf = handle_.get();
    throwIfUnzError(path_, "unzOpenCurrentFile " + entry.name, unzOpenCurrentFile(uf));

    std::vector<char> buffer(kExtractChunkSize);
    std::uint64_t written = 0;
    int got = 0;
    while ((got = unzReadCurrentFile(uf, buffer.data(), static_cast<unsigned>(buffer.size()))) >
           0) {
        out.write(buffer.data(), got);
        if (!out) {
            unzCloseCurrentFile(uf);
            throw IOError("Write failed while extracting " + entry.name);
        }
        written += static_cast<std::uint64_t>(got);
    }
    if (got < 0) {
        unzCloseCurrentFile(uf);
        throw ArchiveError("Reading " + entry.name + " failed (unzip error " +
                               std::to_string(got) + ")",
                           ErrorContext(path_.string()));
    }

    // Reports UNZ_CRCERROR once the whole member has been read
    const int closed = unzCloseCurrentFile(uf);
    if (closed == UNZ_CRCERROR) {
        throw ArchiveError("CRC-32 mismatch for " + entry.name, ErrorContext(path_.string()));
    }
    throwIfUnzError(path_, "unzCloseCurrentFile " + entry.name, closed);
    return written;
}

std::uint64_t ZipArchive::extractMatching(std::string_view suffix, std::ostream& out) {
    std::uint64_t total = 0;
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        const auto& entry = entries_[i];
        if (entry.isDirectory() || !std::string_view(entry.name).ends_with(suffix)) {
            continue;
        }
        REFDB_LOG_DEBUG("Extracting member {} ({} bytes)", entry.name, entry.uncompressedSize);
        throwIfUnzError(path_, "unzGoToFilePos64",
                        unzGoToFilePos64(handle_.get(), &positions_[i]));
        total += extractCurrent(entry, out);
    }
    return total;
}

}  // namespace refdb::io
