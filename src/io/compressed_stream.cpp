// =============================================================================
// refdb - Compressed Stream Implementation
// =============================================================================
// gzip decompression and compression using zlib.
// =============================================================================

#include "refdb/io/compressed_stream.h"

#include <zlib.h>

#include <cstring>

#include "refdb/common/logger.h"
#include "refdb/io/file_utils.h"

namespace refdb::io {

// =============================================================================
// Magic Bytes for Format Detection
// =============================================================================

namespace {

// Gzip magic: 0x1f 0x8b
constexpr std::uint8_t kGzipMagic[] = {0x1f, 0x8b};

/// @brief Buffer size for file compression.
constexpr std::size_t kGzipChunkSize = 256 * 1024;

/// @brief windowBits selecting the gzip wrapper for deflate/inflate.
constexpr int kGzipWindowBits = 16 + MAX_WBITS;

/// @brief zlib memLevel used by gzip(1).
constexpr int kGzipMemLevel = 8;

}  // namespace

// =============================================================================
// Format Detection
// =============================================================================

CompressionFormat detectCompressionFormat(std::span<const std::uint8_t> data) {
    if (data.size() >= sizeof(kGzipMagic) &&
        std::memcmp(data.data(), kGzipMagic, sizeof(kGzipMagic)) == 0) {
        return CompressionFormat::kGzip;
    }

    // Assume uncompressed
    return CompressionFormat::kNone;
}

std::string_view compressionFormatName(CompressionFormat format) {
    switch (format) {
        case CompressionFormat::kGzip:
            return "gzip";
        case CompressionFormat::kNone:
            return "none";
        case CompressionFormat::kUnknown:
        default:
            return "unknown";
    }
}

// =============================================================================
// GzipStreamBuf Implementation
// =============================================================================

GzipStreamBuf::GzipStreamBuf(std::istream& source, std::size_t bufferSize)
    : source_(&source), inputBuffer_(bufferSize), outputBuffer_(bufferSize) {
    initZlib();
}

GzipStreamBuf::~GzipStreamBuf() { cleanupZlib(); }

void GzipStreamBuf::initZlib() {
    auto* stream = new z_stream;
    std::memset(stream, 0, sizeof(z_stream));

    int ret = inflateInit2(stream, kGzipWindowBits);
    if (ret != Z_OK) {
        delete stream;
        throw ArchiveError("Failed to initialize zlib: " + std::string(zError(ret)));
    }

    zlibStream_ = stream;
    initialized_ = true;
}

void GzipStreamBuf::cleanupZlib() {
    if (zlibStream_) {
        auto* stream = static_cast<z_stream*>(zlibStream_);
        inflateEnd(stream);
        delete stream;
        zlibStream_ = nullptr;
    }
    initialized_ = false;
}

GzipStreamBuf::int_type GzipStreamBuf::underflow() {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }

    if (streamEnd_) {
        return traits_type::eof();
    }

    std::size_t decompressed = decompress();
    if (decompressed == 0) {
        return traits_type::eof();
    }

    setg(outputBuffer_.data(), outputBuffer_.data(), outputBuffer_.data() + decompressed);
    return traits_type::to_int_type(*gptr());
}

std::size_t GzipStreamBuf::decompress() {
    if (!initialized_ || !source_) {
        return 0;
    }

    auto* stream = static_cast<z_stream*>(zlibStream_);
    std::size_t produced = 0;

    // inflate may consume input without producing output; keep feeding it
    while (produced == 0 && !streamEnd_) {
        if (stream->avail_in == 0) {
            source_->read(reinterpret_cast<char*>(inputBuffer_.data()),
                          static_cast<std::streamsize>(inputBuffer_.size()));
            auto bytesRead = static_cast<std::size_t>(source_->gcount());
            if (bytesRead == 0) {
                throw ArchiveError("Truncated gzip stream");
            }
            stream->avail_in = static_cast<uInt>(bytesRead);
            stream->next_in = inputBuffer_.data();
        }

        stream->avail_out = static_cast<uInt>(outputBuffer_.size());
        stream->next_out = reinterpret_cast<Bytef*>(outputBuffer_.data());

        int ret = inflate(stream, Z_NO_FLUSH);
        if (ret == Z_STREAM_END) {
            streamEnd_ = true;
        } else if (ret != Z_OK && ret != Z_BUF_ERROR) {
            throw ArchiveError("Gzip decompression failed: " + std::string(zError(ret)));
        }

        produced = outputBuffer_.size() - stream->avail_out;
    }

    return produced;
}

// =============================================================================
// CompressedInputStream Implementation
// =============================================================================

CompressedInputStream::CompressedInputStream(const std::filesystem::path& path)
    : std::istream(nullptr) {
    fileStream_ = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!fileStream_->is_open()) {
        throw IOError("Failed to open file", ErrorContext(path.string()));
    }

    // Detect format from magic bytes
    std::uint8_t magic[2];
    fileStream_->read(reinterpret_cast<char*>(magic), sizeof(magic));
    auto bytesRead = static_cast<std::size_t>(fileStream_->gcount());

    fileStream_->clear();
    fileStream_->seekg(0, std::ios::beg);

    format_ = detectCompressionFormat({magic, bytesRead});

    if (format_ == CompressionFormat::kGzip) {
        decompressBuf_ = std::make_unique<GzipStreamBuf>(*fileStream_);
        rdbuf(decompressBuf_.get());
        REFDB_LOG_DEBUG("Opened gzip compressed stream {}", path.string());
    } else {
        rdbuf(fileStream_->rdbuf());
    }
}

CompressedInputStream::~CompressedInputStream() = default;

std::unique_ptr<std::istream> openCompressedFile(const std::filesystem::path& path) {
    return std::make_unique<CompressedInputStream>(path);
}

// =============================================================================
// Compression Implementation
// =============================================================================

namespace {

/// @brief RAII owner of a deflate stream.
class DeflateStream {
public:
    explicit DeflateStream(int level) {
        std::memset(&stream_, 0, sizeof(stream_));
        int ret = deflateInit2(&stream_, level, Z_DEFLATED, kGzipWindowBits, kGzipMemLevel,
                               Z_DEFAULT_STRATEGY);
        if (ret != Z_OK) {
            throw IOError("Failed to initialize zlib deflate: " + std::string(zError(ret)));
        }
    }

    ~DeflateStream() { deflateEnd(&stream_); }

    DeflateStream(const DeflateStream&) = delete;
    DeflateStream& operator=(const DeflateStream&) = delete;

    z_stream* get() noexcept { return &stream_; }

private:
    z_stream stream_;
};

}  // namespace

GzipStats gzipFile(const std::filesystem::path& input, const std::filesystem::path& output,
                   int level) {
    if (level < Z_BEST_SPEED || level > Z_BEST_COMPRESSION) {
        throw IOError("Invalid gzip level " + std::to_string(level));
    }

    std::ifstream in(input, std::ios::binary);
    if (!in) {
        throw IOError("Failed to open file for compression", ErrorContext(input.string()));
    }

    const std::filesystem::path partial = partialPath(output);
    GzipStats stats;
    {
        std::ofstream out(partial, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw IOError("Failed to create compressed file", ErrorContext(partial.string()));
        }

        DeflateStream deflater(level);
        z_stream* stream = deflater.get();
        std::vector<char> inBuffer(kGzipChunkSize);
        std::vector<unsigned char> outBuffer(kGzipChunkSize);

        int flush = Z_NO_FLUSH;
        do {
            in.read(inBuffer.data(), static_cast<std::streamsize>(inBuffer.size()));
            const auto bytesRead = static_cast<std::size_t>(in.gcount());
            if (in.bad()) {
                out.close();
                removeQuietly(partial);
                throw IOError("Read failed during compression", ErrorContext(input.string()));
            }
            stats.inputBytes += bytesRead;
            flush = in.eof() ? Z_FINISH : Z_NO_FLUSH;

            stream->next_in = reinterpret_cast<Bytef*>(inBuffer.data());
            stream->avail_in = static_cast<uInt>(bytesRead);

            do {
                stream->next_out = outBuffer.data();
                stream->avail_out = static_cast<uInt>(outBuffer.size());
                int ret = deflate(stream, flush);
                if (ret == Z_STREAM_ERROR) {
                    out.close();
                    removeQuietly(partial);
                    throw IOError("Gzip compression failed", ErrorContext(input.string()));
                }
                const std::size_t have = outBuffer.size() - stream->avail_out;
                out.write(reinterpret_cast<const char*>(outBuffer.data()),
                          static_cast<std::streamsize>(have));
                stats.outputBytes += have;
            } while (stream->avail_out == 0);
        } while (flush != Z_FINISH);

        if (!out.flush()) {
            out.close();
            removeQuietly(partial);
            throw IOError("Write failed during compression", ErrorContext(partial.string()));
        }
    }

    commitPartial(partial, output);
    return stats;
}

}  // namespace refdb::io
