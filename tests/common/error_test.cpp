// =============================================================================
// refdb - Error Handling Tests
// =============================================================================
// Unit tests for exit codes, the exception hierarchy and Result helpers.
// =============================================================================

#include "refdb/common/error.h"

#include <gtest/gtest.h>

#include <string>

namespace refdb {
namespace {

TEST(ErrorCodeTest, ExitCodes) {
    EXPECT_EQ(toExitCode(ErrorCode::kSuccess), 0);
    EXPECT_EQ(toExitCode(ErrorCode::kUsageError), 1);
    EXPECT_EQ(toExitCode(ErrorCode::kIOError), 2);
    EXPECT_EQ(toExitCode(ErrorCode::kFormatError), 3);
    EXPECT_EQ(toExitCode(ErrorCode::kStageFailure), 4);
    EXPECT_EQ(toExitCode(ErrorCode::kCancelled), 5);
    EXPECT_TRUE(isSuccess(ErrorCode::kSuccess));
    EXPECT_FALSE(isSuccess(ErrorCode::kStageFailure));
}

TEST(ExceptionTest, ManifestErrorIsConfigurationError) {
    try {
        throw ManifestError("Manifest has no data rows", ErrorContext("genomes.tsv"));
    } catch (const ConfigurationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::kUsageError);
        EXPECT_EQ(e.exitCode(), 1);
        EXPECT_NE(std::string(e.what()).find("genomes.tsv"), std::string::npos);
        return;
    }
    FAIL() << "ManifestError was not caught as ConfigurationError";
}

TEST(ExceptionTest, StageFailureNamesStage) {
    StageFailure failure("extraction", "no archives found");
    EXPECT_EQ(failure.stage(), "extraction");
    EXPECT_EQ(failure.code(), ErrorCode::kStageFailure);
    EXPECT_NE(failure.message().find("extraction"), std::string::npos);
    EXPECT_NE(failure.message().find("no archives found"), std::string::npos);
}

TEST(ExceptionTest, ContextIncludesAccession) {
    ArchiveError error("CRC-32 mismatch",
                       ErrorContext("genomes/GCF_1.1.zip").withAccession("GCF_1.1"));
    const std::string what = error.what();
    EXPECT_NE(what.find("GCF_1.1.zip"), std::string::npos);
    EXPECT_NE(what.find("accession: GCF_1.1"), std::string::npos);
    EXPECT_EQ(error.exitCode(), 3);
}

TEST(ResultTest, TryExecuteMapsExceptions) {
    auto ok = tryExecute([] { return 42; });
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(*ok, 42);

    auto io = tryExecute([] { throw IOError("disk full"); });
    ASSERT_FALSE(io.has_value());
    EXPECT_EQ(io.error().code(), ErrorCode::kIOError);

    auto cancelled = tryExecute([] { throw CancelledError("interrupted"); });
    ASSERT_FALSE(cancelled.has_value());
    EXPECT_EQ(cancelled.error().exitCode(), 5);
}

TEST(ResultTest, ThrowExceptionRestoresCategory) {
    Error error(ErrorCode::kFormatError, "truncated gzip stream");
    EXPECT_THROW(error.throwException(), ArchiveError);

    Error stage(ErrorCode::kStageFailure, "stage 'assembly' failed: size mismatch");
    try {
        stage.throwException();
    } catch (const RefdbException& e) {
        EXPECT_EQ(e.code(), ErrorCode::kStageFailure);
        EXPECT_EQ(e.message(), stage.message());
    }
}

TEST(ResultTest, UnwrapOrThrow) {
    EXPECT_NO_THROW(unwrapOrThrow(makeVoidSuccess()));
    EXPECT_THROW(unwrapOrThrow(makeVoidError(ErrorCode::kUsageError, "--version is required")),
                 ConfigurationError);
}

}  // namespace
}  // namespace refdb
