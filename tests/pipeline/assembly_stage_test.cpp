// =============================================================================
// refdb - Assembly Stage Tests
// =============================================================================
// Concatenation exactness and the merged missing-genome report.
// =============================================================================

#include "refdb/pipeline/assembly_stage.h"

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include "refdb/io/file_utils.h"
#include "test_utils.h"

namespace refdb::pipeline::test {

namespace fs = std::filesystem;

using refdb::test::readFile;
using refdb::test::readLinesOf;
using refdb::test::StageTest;
using refdb::test::TempDir;
using refdb::test::writeFile;

using AssemblyStageTest = StageTest;

TEST_F(AssemblyStageTest, ConcatenatesInNameOrder) {
    writeFile(config.sequencePath("GCF_2.1"), ">two\nCCCC\n");
    writeFile(config.sequencePath("GCF_1.1"), ">one\nAAAA\n");
    writeFile(config.sequencePath("GCF_3.1"), ">three\nGGGG");

    AssemblyStage stage;
    auto ctx = context();
    ASSERT_TRUE(stage.run(ctx).has_value());

    EXPECT_EQ(readFile(config.artifactPath()), ">one\nAAAA\n>two\nCCCC\n>three\nGGGG");
    EXPECT_EQ(stage.report().sequenceFiles, 3U);
    EXPECT_EQ(stage.report().bytesWritten, io::fileSizeOrZero(config.artifactPath()));
    EXPECT_FALSE(fs::exists(io::partialPath(config.artifactPath())));
}

TEST_F(AssemblyStageTest, ArtifactNameCarriesVersionVerbatim) {
    config.version = "2024-06_rc1+build.7";
    writeFile(config.sequencePath("GCF_1.1"), ">one\nA\n");

    AssemblyStage stage;
    auto ctx = context();
    ASSERT_TRUE(stage.run(ctx).has_value());
    EXPECT_TRUE(fs::exists(tempDir.path() / "refseq_database_2024-06_rc1+build.7.fa"));
}

TEST_F(AssemblyStageTest, NoSurvivingSequencesIsStageFailure) {
    writeFile(config.sequencePath("GCF_1.1"), "");

    AssemblyStage stage;
    auto ctx = context();
    auto result = stage.run(ctx);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kStageFailure);
    EXPECT_FALSE(fs::exists(config.artifactPath()));
}

TEST_F(AssemblyStageTest, MissingReportMergesAllSources) {
    writeFile(config.sequencePath("OK_1"), ">ok\nA\n");
    writeFile(config.emptyManifestPath(), "E1\nE2\n");
    writeFile(config.alternateEmptyManifestPath(), "E2\nALT_1\n");
    writeFile(config.downloadFailuresPath(), "D1\nD1\nOK_1\n");
    writeFile(config.extractionFailuresPath(), "X1\nE1\n");

    AssemblyStage stage;
    auto ctx = context();
    ASSERT_TRUE(stage.run(ctx).has_value());

    EXPECT_EQ(readLinesOf(config.missingReportPath()),
              (std::vector<std::string>{"E1", "E2", "ALT_1", "D1", "X1"}));
}

TEST(MergeMissingAccessionsTest, SurvivorsAreExcluded) {
    const auto merged = mergeMissingAccessions({{"A", "B"}, {"B", "C"}, {}}, {"C"});
    EXPECT_EQ(merged, (std::vector<Accession>{"A", "B"}));
}

// =============================================================================
// Property Tests
// =============================================================================

RC_GTEST_PROP(AssemblyStageProperty, ArtifactSizeEqualsSumOfInputs, ()) {
    const auto contents = *rc::gen::nonEmpty(rc::gen::container<std::vector<std::string>>(
        rc::gen::container<std::string>(rc::gen::element('A', 'C', 'G', 'T', '\n', '>'))));

    TempDir dir;
    PipelineConfig config;
    config.outputDir = dir.path();
    config.version = "prop";
    io::ensureDirectory(config.genomesDir());

    std::uint64_t expected = 0;
    std::size_t nonEmpty = 0;
    for (std::size_t i = 0; i < contents.size(); ++i) {
        writeFile(config.sequencePath("GCF_" + std::to_string(1000 + i) + ".1"), contents[i]);
        expected += contents[i].size();
        nonEmpty += contents[i].empty() ? 0 : 1;
    }
    RC_PRE(nonEmpty > 0U);

    std::vector<GenomeManifestEntry> entries;
    StatusTable status(config.statusTablePath());
    RunContext ctx{config, entries, status};
    AssemblyStage stage;
    RC_ASSERT(stage.run(ctx).has_value());

    RC_ASSERT(io::fileSizeOrZero(config.artifactPath()) == expected);

    std::string concatenated;
    for (const auto& content : contents) {
        concatenated += content;
    }
    RC_ASSERT(readFile(config.artifactPath()) == concatenated);
}

}  // namespace refdb::pipeline::test
