// =============================================================================
// refdb - Compressed Stream Support
// =============================================================================
// gzip support for manifests and the final database artifact.
//
// This module provides:
// - CompressedInputStream: Wrapper for transparent gzip decompression
// - Format detection from magic bytes
// - gzipFile(): streaming gzip compression of a whole file
//
// Usage:
//   auto stream = openCompressedFile("/path/to/manifest.tsv.gz");
//   // Use stream like any std::istream
// =============================================================================

#ifndef REFDB_IO_COMPRESSED_STREAM_H
#define REFDB_IO_COMPRESSED_STREAM_H

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <span>
#include <streambuf>
#include <string_view>
#include <vector>

#include "refdb/common/error.h"

namespace refdb::io {

// =============================================================================
// Compression Format Detection
// =============================================================================

/// @brief Recognised input formats.
enum class CompressionFormat : std::uint8_t {
    kNone = 0,  ///< Uncompressed (plain text)
    kGzip = 1,  ///< gzip (.gz)
    kUnknown = 255
};

/// @brief Detect compression format from file magic bytes.
[[nodiscard]] CompressionFormat detectCompressionFormat(std::span<const std::uint8_t> data);

/// @brief Get human-readable name for compression format.
[[nodiscard]] std::string_view compressionFormatName(CompressionFormat format);

/// @brief Default gzip compression level (matches gzip(1)).
inline constexpr int kDefaultGzipLevel = 6;

// =============================================================================
// GzipStreamBuf
// =============================================================================

/// @brief Stream buffer for gzip decompression.
/// @note Uses zlib for streaming decompression.
class GzipStreamBuf : public std::streambuf {
public:
    /// @brief Construct a gzip stream buffer.
    /// @param source Source stream to decompress.
    /// @param bufferSize Internal buffer size.
    explicit GzipStreamBuf(std::istream& source, std::size_t bufferSize = 64 * 1024);

    ~GzipStreamBuf() override;

    // Non-copyable, non-movable
    GzipStreamBuf(const GzipStreamBuf&) = delete;
    GzipStreamBuf& operator=(const GzipStreamBuf&) = delete;
    GzipStreamBuf(GzipStreamBuf&&) = delete;
    GzipStreamBuf& operator=(GzipStreamBuf&&) = delete;

protected:
    /// @brief Underflow handler - refill buffer.
    int_type underflow() override;

private:
    /// @brief Initialize zlib stream.
    void initZlib();

    /// @brief Cleanup zlib stream.
    void cleanupZlib();

    /// @brief Decompress more data into output buffer.
    /// @return Number of bytes decompressed.
    std::size_t decompress();

    /// @brief Source stream.
    std::istream* source_ = nullptr;

    /// @brief Compressed input buffer.
    std::vector<std::uint8_t> inputBuffer_;

    /// @brief Decompressed output buffer.
    std::vector<char> outputBuffer_;

    /// @brief zlib stream state (opaque pointer).
    void* zlibStream_ = nullptr;

    /// @brief Whether stream is initialized.
    bool initialized_ = false;

    /// @brief Whether end of compressed stream reached.
    bool streamEnd_ = false;
};

// =============================================================================
// CompressedInputStream
// =============================================================================

/// @brief Input stream with transparent decompression.
class CompressedInputStream : public std::istream {
public:
    /// @brief Construct from a file path.
    /// @throws IOError if file cannot be opened.
    explicit CompressedInputStream(const std::filesystem::path& path);

    ~CompressedInputStream() override;

    // Non-copyable, non-movable (std::istream is not movable)
    CompressedInputStream(const CompressedInputStream&) = delete;
    CompressedInputStream& operator=(const CompressedInputStream&) = delete;
    CompressedInputStream(CompressedInputStream&&) = delete;
    CompressedInputStream& operator=(CompressedInputStream&&) = delete;

    /// @brief Get the detected compression format.
    [[nodiscard]] CompressionFormat format() const noexcept { return format_; }

    /// @brief Check if the stream is compressed.
    [[nodiscard]] bool isCompressed() const noexcept { return format_ != CompressionFormat::kNone; }

private:
    /// @brief Source file stream.
    std::unique_ptr<std::ifstream> fileStream_;

    /// @brief Decompression stream buffer.
    std::unique_ptr<std::streambuf> decompressBuf_;

    /// @brief Detected compression format.
    CompressionFormat format_ = CompressionFormat::kUnknown;
};

/// @brief Open a file with automatic decompression.
/// @throws IOError if file cannot be opened.
[[nodiscard]] std::unique_ptr<std::istream> openCompressedFile(const std::filesystem::path& path);

// =============================================================================
// Compression
// =============================================================================

/// @brief Statistics from a gzipFile() call.
struct GzipStats {
    /// @brief Uncompressed bytes read.
    std::uint64_t inputBytes = 0;

    /// @brief Compressed bytes written.
    std::uint64_t outputBytes = 0;

    /// @brief Compression ratio (input/output).
    [[nodiscard]] double compressionRatio() const noexcept {
        return outputBytes > 0 ? static_cast<double>(inputBytes) / outputBytes : 0.0;
    }
};

/// @brief Compress `input` into a gzip member at `output`.
/// @param level zlib compression level (1-9).
/// @throws IOError on read/write failure; `output` is left untouched on error.
GzipStats gzipFile(const std::filesystem::path& input, const std::filesystem::path& output,
                   int level = kDefaultGzipLevel);

}  // namespace refdb::io

#endif  // REFDB_IO_COMPRESSED_STREAM_H
