// =============================================================================
// refdb - Compressed Stream Tests
// =============================================================================

#include "refdb/io/compressed_stream.h"

#include <gtest/gtest.h>

#include <array>
#include <iterator>
#include <string>

#include "test_utils.h"

namespace refdb::io {
namespace {

using refdb::test::readFile;
using refdb::test::TempDir;
using refdb::test::writeFile;

std::string readAll(std::istream& in) {
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

TEST(CompressedStreamTest, DetectsFormatFromMagic) {
    const std::array<std::uint8_t, 4> gzip = {0x1f, 0x8b, 0x08, 0x00};
    const std::array<std::uint8_t, 4> text = {'>', 'c', 'h', 'r'};
    EXPECT_EQ(detectCompressionFormat(gzip), CompressionFormat::kGzip);
    EXPECT_EQ(detectCompressionFormat(text), CompressionFormat::kNone);
    EXPECT_EQ(compressionFormatName(CompressionFormat::kGzip), "gzip");
}

TEST(CompressedStreamTest, GzipFileProducesReadableGzip) {
    TempDir dir;
    const auto input = dir.path() / "refseq_database_v1.fa";
    const auto output = dir.path() / "refseq_database_v1.fa.gz";

    std::string content;
    for (int i = 0; i < 2000; ++i) {
        content += ">seq" + std::to_string(i) + "\nACGTTGCAACGTTGCA\n";
    }
    writeFile(input, content);

    const GzipStats stats = gzipFile(input, output, 9);
    EXPECT_EQ(stats.inputBytes, content.size());
    EXPECT_GT(stats.outputBytes, 0U);
    EXPECT_LT(stats.outputBytes, stats.inputBytes);
    EXPECT_GT(stats.compressionRatio(), 1.0);
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "refseq_database_v1.fa.gz.part"));

    CompressedInputStream in(output);
    EXPECT_TRUE(in.isCompressed());
    EXPECT_EQ(readAll(in), content);
}

TEST(CompressedStreamTest, PlainFilePassesThrough) {
    TempDir dir;
    const auto path = dir.path() / "plain.tsv";
    writeFile(path, "accession\nGCF_1.1\n");

    auto in = openCompressedFile(path);
    EXPECT_EQ(readAll(*in), "accession\nGCF_1.1\n");
}

TEST(CompressedStreamTest, TruncatedGzipIsFormatError) {
    TempDir dir;
    const auto input = dir.path() / "data.txt";
    const auto output = dir.path() / "data.txt.gz";
    writeFile(input, std::string(100000, 'N') + "ACGT");
    (void)gzipFile(input, output);

    const std::string packed = readFile(output);
    const auto truncated = dir.path() / "truncated.gz";
    writeFile(truncated, packed.substr(0, packed.size() - 12));

    CompressedInputStream in(truncated);
    EXPECT_THROW((void)readAll(in), ArchiveError);
}

TEST(CompressedStreamTest, MissingInputIsIOError) {
    TempDir dir;
    EXPECT_THROW((void)gzipFile(dir.path() / "absent.fa", dir.path() / "absent.fa.gz"), IOError);
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "absent.fa.gz"));
}

}  // namespace
}  // namespace refdb::io
