// =============================================================================
// refdb - Zip Archive Tests
// =============================================================================

#include "refdb/io/zip_archive.h"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "test_utils.h"

namespace refdb::io {
namespace {

using refdb::test::readFile;
using refdb::test::TempDir;
using refdb::test::writeFile;
using refdb::test::writeZip;

TEST(ZipArchiveTest, ListsEntriesInDirectoryOrder) {
    TempDir dir;
    const auto path = dir.path() / "a.zip";
    writeZip(path, {{"README.md", "hello", true},
                    {"data/", "", false},
                    {"data/x.fna", ">x\nACGT\n", false}});

    ZipArchive zip(path);
    ASSERT_EQ(zip.entries().size(), 3U);
    EXPECT_EQ(zip.entries()[0].name, "README.md");
    EXPECT_EQ(zip.entries()[0].method, static_cast<std::uint16_t>(ZipMethod::kDeflated));
    EXPECT_TRUE(zip.entries()[1].isDirectory());
    EXPECT_EQ(zip.entries()[2].uncompressedSize, 8U);
}

TEST(ZipArchiveTest, ExtractMatchingConcatenatesMembers) {
    TempDir dir;
    const auto path = dir.path() / "multi.zip";
    const std::string chr1 = ">chr1\n" + std::string(5000, 'A') + "\n";
    const std::string plasmid = ">plasmid\nGGCC\n";
    writeZip(path, {{"ncbi_dataset/data/GCF_1.1/chr1.fna", chr1, true},
                    {"ncbi_dataset/data/assembly_data_report.jsonl", "{}", true},
                    {"ncbi_dataset/data/GCF_1.1/plasmid.fna", plasmid, false}});

    ZipArchive zip(path);
    std::ostringstream out;
    const auto bytes = zip.extractMatching(".fna", out);
    EXPECT_EQ(bytes, chr1.size() + plasmid.size());
    EXPECT_EQ(out.str(), chr1 + plasmid);
}

TEST(ZipArchiveTest, ExtractsSingleMemberByEntry) {
    TempDir dir;
    const auto path = dir.path() / "pair.zip";
    writeZip(path, {{"a.fna", ">a\nAAAA\n", true}, {"b.fna", ">b\nCCCC\n", true}});

    ZipArchive zip(path);
    std::ostringstream out;
    EXPECT_EQ(zip.extract(zip.entries()[1], out), 8U);
    EXPECT_EQ(out.str(), ">b\nCCCC\n");
}

TEST(ZipArchiveTest, DeflatedMembersAroundChunkBoundaryAreExact) {
    TempDir dir;
    constexpr std::size_t kChunk = 256 * 1024;
    for (const std::size_t size : {kChunk - 1, kChunk, kChunk + 1, 3 * kChunk + 17}) {
        std::string sequence;
        sequence.reserve(size);
        for (std::size_t i = 0; i < size; ++i) {
            sequence.push_back("ACGT\n"[(i * 7 + i / 13) % 5]);
        }
        const auto path = dir.path() / ("chunk_" + std::to_string(size) + ".zip");
        writeZip(path, {{"g.fna", sequence, true}});

        ZipArchive zip(path);
        std::ostringstream out;
        EXPECT_EQ(zip.extractMatching(".fna", out), size);
        EXPECT_EQ(out.str(), sequence) << size;
    }
}

TEST(ZipArchiveTest, NoMatchingMemberYieldsZeroBytes) {
    TempDir dir;
    const auto path = dir.path() / "empty.zip";
    writeZip(path, {{"README.md", "no genome here", true}});

    ZipArchive zip(path);
    std::ostringstream out;
    EXPECT_EQ(zip.extractMatching(".fna", out), 0U);
    EXPECT_TRUE(out.str().empty());
}

TEST(ZipArchiveTest, TruncatedArchiveIsUnreadable) {
    TempDir dir;
    const auto path = dir.path() / "full.zip";
    refdb::test::writeGenomeZip(path, "GCF_1.1", ">GCF_1.1\nACGT\n");
    EXPECT_TRUE(ZipArchive::isReadable(path));

    const std::string bytes = readFile(path);
    const auto truncated = dir.path() / "truncated.zip";
    writeFile(truncated, bytes.substr(0, bytes.size() / 2));
    EXPECT_FALSE(ZipArchive::isReadable(truncated));
    EXPECT_THROW(ZipArchive{truncated}, ArchiveError);
}

TEST(ZipArchiveTest, NonZipIsUnreadable) {
    TempDir dir;
    const auto path = dir.path() / "error.zip";
    writeFile(path, "{\"error\": \"Not Found\"}");
    EXPECT_FALSE(ZipArchive::isReadable(path));
    EXPECT_FALSE(ZipArchive::isReadable(dir.path() / "missing.zip"));
}

TEST(ZipArchiveTest, CorruptMemberFailsCrcCheck) {
    TempDir dir;
    const auto path = dir.path() / "corrupt.zip";
    writeZip(path, {{"g.fna", ">g\nACGTACGT\n", false}});

    // Flip one byte of the stored payload (local header 30 bytes + name 5 bytes)
    std::string bytes = readFile(path);
    bytes[30 + 5 + 3] = 'T';
    writeFile(path, bytes);

    ZipArchive zip(path);
    std::ostringstream out;
    EXPECT_THROW((void)zip.extractMatching(".fna", out), ArchiveError);
}

}  // namespace
}  // namespace refdb::io
