// =============================================================================
// refdb - Test Utilities Implementation
// =============================================================================

#include "test_utils.h"

#include <zlib.h>

#include <atomic>
#include <cstring>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>

#include "refdb/io/file_utils.h"

namespace refdb::test {

namespace fs = std::filesystem;

// =============================================================================
// Filesystem Helpers
// =============================================================================

TempDir::TempDir() {
    static std::atomic<unsigned> counter{0};
    std::random_device rd;
    const std::string name = "refdb_test_" + std::to_string(rd()) + "_" +
                             std::to_string(counter.fetch_add(1));
    path_ = fs::temp_directory_path() / name;
    fs::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

void writeFile(const fs::path& path, const std::string& content) {
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
    if (!out) {
        throw std::runtime_error("cannot write " + path.string());
    }
}

std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

std::vector<std::string> readLinesOf(const fs::path& path) {
    return io::readLines(path);
}

// =============================================================================
// Zip Builder
// =============================================================================

namespace {

void putLe16(std::string& out, std::uint16_t value) {
    out.push_back(static_cast<char>(value & 0xFF));
    out.push_back(static_cast<char>((value >> 8) & 0xFF));
}

void putLe32(std::string& out, std::uint32_t value) {
    putLe16(out, static_cast<std::uint16_t>(value & 0xFFFF));
    putLe16(out, static_cast<std::uint16_t>(value >> 16));
}

std::string rawDeflate(const std::string& data) {
    z_stream stream;
    std::memset(&stream, 0, sizeof(stream));
    if (deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("deflateInit2 failed");
    }

    std::string out(deflateBound(&stream, static_cast<uLong>(data.size())), '\0');
    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    stream.avail_in = static_cast<uInt>(data.size());
    stream.next_out = reinterpret_cast<Bytef*>(out.data());
    stream.avail_out = static_cast<uInt>(out.size());
    const int ret = deflate(&stream, Z_FINISH);
    out.resize(stream.total_out);
    deflateEnd(&stream);
    if (ret != Z_STREAM_END) {
        throw std::runtime_error("deflate failed");
    }
    return out;
}

}  // namespace

void writeZip(const fs::path& path, const std::vector<ZipMember>& members) {
    std::string archive;
    std::string directory;

    for (const auto& member : members) {
        const auto crc = static_cast<std::uint32_t>(
            crc32(crc32(0L, Z_NULL, 0), reinterpret_cast<const Bytef*>(member.content.data()),
                  static_cast<uInt>(member.content.size())));
        const std::string payload = member.deflate ? rawDeflate(member.content) : member.content;
        const std::uint16_t method = member.deflate ? 8 : 0;
        const auto offset = static_cast<std::uint32_t>(archive.size());
        const auto nameLen = static_cast<std::uint16_t>(member.name.size());

        putLe32(archive, 0x04034b50);
        putLe16(archive, 20);
        putLe16(archive, 0);
        putLe16(archive, method);
        putLe16(archive, 0);
        putLe16(archive, 0x21);
        putLe32(archive, crc);
        putLe32(archive, static_cast<std::uint32_t>(payload.size()));
        putLe32(archive, static_cast<std::uint32_t>(member.content.size()));
        putLe16(archive, nameLen);
        putLe16(archive, 0);
        archive += member.name;
        archive += payload;

        putLe32(directory, 0x02014b50);
        putLe16(directory, 20);
        putLe16(directory, 20);
        putLe16(directory, 0);
        putLe16(directory, method);
        putLe16(directory, 0);
        putLe16(directory, 0x21);
        putLe32(directory, crc);
        putLe32(directory, static_cast<std::uint32_t>(payload.size()));
        putLe32(directory, static_cast<std::uint32_t>(member.content.size()));
        putLe16(directory, nameLen);
        putLe16(directory, 0);
        putLe16(directory, 0);
        putLe16(directory, 0);
        putLe16(directory, 0);
        putLe32(directory, 0);
        putLe32(directory, offset);
        directory += member.name;
    }

    const auto directoryOffset = static_cast<std::uint32_t>(archive.size());
    archive += directory;

    putLe32(archive, 0x06054b50);
    putLe16(archive, 0);
    putLe16(archive, 0);
    putLe16(archive, static_cast<std::uint16_t>(members.size()));
    putLe16(archive, static_cast<std::uint16_t>(members.size()));
    putLe32(archive, static_cast<std::uint32_t>(directory.size()));
    putLe32(archive, directoryOffset);
    putLe16(archive, 0);

    writeFile(path, archive);
}

void writeGenomeZip(const fs::path& path, const std::string& accession,
                    const std::string& sequence) {
    const std::string dataDir = "ncbi_dataset/data/" + accession + "/";
    writeZip(path, {
                       {"README.md", "NCBI Datasets download\n", true},
                       {"ncbi_dataset/data/", "", false},
                       {dataDir + accession + "_genomic.fna", sequence, true},
                       {"ncbi_dataset/data/dataset_catalog.json", "{}", true},
                   });
}

// =============================================================================
// Fake Fetcher
// =============================================================================

std::string genomeSequence(const Accession& accession) {
    return ">" + accession + " synthetic assembly\nACGTACGTAC\nGGTTAACC\n";
}

FakeFetcher::Handler FakeFetcher::serveGenomes() {
    return [](const Accession& accession, const fs::path& destination) {
        writeGenomeZip(destination, accession, genomeSequence(accession));
        net::FetchOutcome outcome;
        outcome.transferOk = true;
        outcome.httpStatus = 200;
        return outcome;
    };
}

FakeFetcher::Handler FakeFetcher::failAlways() {
    return [](const Accession& /*accession*/, const fs::path& /*destination*/) {
        net::FetchOutcome outcome;
        outcome.httpStatus = 500;
        outcome.message = "The requested URL returned error: 500";
        return outcome;
    };
}

// =============================================================================
// Stage Fixture
// =============================================================================

StageTest::StageTest() : status(fs::path{}) {
    config.outputDir = tempDir.path();
    config.version = "test";
    status = pipeline::StatusTable(config.statusTablePath());
    fs::create_directories(config.genomesDir());
}

void StageTest::setAccessions(const std::vector<Accession>& accessions) {
    entries.clear();
    for (const auto& accession : accessions) {
        entries.emplace_back(accession);
    }
}

pipeline::Sleeper recordingSleeper(std::vector<std::chrono::seconds>& delays) {
    return [&delays](std::chrono::seconds delay) { delays.push_back(delay); };
}

}  // namespace refdb::test
