// =============================================================================
// refdb - Integrity Filter Stage Tests
// =============================================================================

#include "refdb/pipeline/integrity_filter_stage.h"

#include <gtest/gtest.h>

#include "refdb/io/file_utils.h"
#include "refdb/pipeline/assembly_stage.h"
#include "test_utils.h"

namespace refdb::pipeline::test {

namespace fs = std::filesystem;

using refdb::test::readFile;
using refdb::test::readLinesOf;
using refdb::test::StageTest;
using refdb::test::writeFile;

using IntegrityFilterStageTest = StageTest;

TEST_F(IntegrityFilterStageTest, QuarantinesZeroByteSequences) {
    writeFile(config.sequencePath("A1"), "");
    writeFile(config.sequencePath("A2"), ">A2\nACGT\n");
    writeFile(config.sequencePath("A3"), "");
    setAccessions({"A1", "A2", "A3"});

    IntegrityFilterStage stage;
    auto ctx = context();
    ASSERT_TRUE(stage.run(ctx).has_value());

    EXPECT_EQ(readLinesOf(config.emptyManifestPath()), (std::vector<std::string>{"A1", "A3"}));
    EXPECT_FALSE(fs::exists(config.sequencePath("A1")));
    EXPECT_FALSE(fs::exists(config.sequencePath("A3")));
    EXPECT_TRUE(fs::exists(config.sequencePath("A2")));
    EXPECT_EQ(entries[0].sequenceStatus, SequenceStatus::kEmpty);
    EXPECT_EQ(status.find("A3")->sequence, SequenceStatus::kEmpty);

    for (const auto& sequence :
         io::listFilesWithExtension(config.genomesDir(), kSequenceExtension)) {
        EXPECT_GT(io::fileSizeOrZero(sequence), 0U) << sequence;
    }
}

TEST_F(IntegrityFilterStageTest, EmptyManifestIsRewrittenEachRun) {
    writeFile(config.emptyManifestPath(), "STALE_1\nSTALE_2\n");
    writeFile(config.sequencePath("A2"), ">A2\nACGT\n");

    IntegrityFilterStage stage;
    auto ctx = context();
    ASSERT_TRUE(stage.run(ctx).has_value());

    EXPECT_TRUE(fs::exists(config.emptyManifestPath()));
    EXPECT_TRUE(readLinesOf(config.emptyManifestPath()).empty());
    EXPECT_TRUE(stage.quarantined().empty());
}

TEST_F(IntegrityFilterStageTest, QuarantinedGenomeIsAbsentFromArtifact) {
    writeFile(config.sequencePath("A1"), "");
    writeFile(config.sequencePath("A2"), ">A2\nGGGG\n");

    IntegrityFilterStage filter;
    AssemblyStage assembly;
    auto ctx = context();
    ASSERT_TRUE(filter.run(ctx).has_value());
    ASSERT_TRUE(assembly.run(ctx).has_value());

    EXPECT_EQ(readFile(config.artifactPath()), ">A2\nGGGG\n");
    EXPECT_EQ(readLinesOf(config.missingReportPath()), (std::vector<std::string>{"A1"}));
}

}  // namespace refdb::pipeline::test
