// =============================================================================
// refdb - Test Utilities
// =============================================================================
// Shared helpers for the refdb test suite:
// - TempDir: scratch directory removed on destruction
// - writeZip: builds small zip archives with zlib
// - FakeFetcher: scripted network collaborator
// - StageTest: fixture holding a config, manifest entries and status table
// =============================================================================

#ifndef REFDB_TESTS_TEST_UTILS_H
#define REFDB_TESTS_TEST_UTILS_H

#include <gtest/gtest.h>

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "refdb/net/archive_fetcher.h"
#include "refdb/pipeline/config.h"
#include "refdb/pipeline/stage.h"
#include "refdb/pipeline/status_table.h"

namespace refdb::test {

// =============================================================================
// Filesystem Helpers
// =============================================================================

/// @brief Unique scratch directory, removed recursively on destruction.
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

/// @brief Write `content` to `path`, creating parent directories.
void writeFile(const std::filesystem::path& path, const std::string& content);

/// @brief Read a whole file as bytes.
[[nodiscard]] std::string readFile(const std::filesystem::path& path);

/// @brief Read the non-blank lines of a text file.
[[nodiscard]] std::vector<std::string> readLinesOf(const std::filesystem::path& path);

// =============================================================================
// Zip Builder
// =============================================================================

/// @brief One member of a generated archive.
struct ZipMember {
    std::string name;
    std::string content;
    bool deflate = true;
};

/// @brief Write a zip archive with the given members.
void writeZip(const std::filesystem::path& path, const std::vector<ZipMember>& members);

/// @brief Write the archive layout NCBI Datasets returns for one genome.
void writeGenomeZip(const std::filesystem::path& path, const std::string& accession,
                    const std::string& sequence);

// =============================================================================
// Fake Fetcher
// =============================================================================

/// @brief Network collaborator driven by a callback; records every call.
class FakeFetcher : public net::ArchiveFetcher {
public:
    using Handler =
        std::function<net::FetchOutcome(const Accession&, const std::filesystem::path&)>;

    explicit FakeFetcher(Handler handler) : handler_(std::move(handler)) {}

    [[nodiscard]] net::FetchOutcome fetch(const Accession& accession,
                                          const std::filesystem::path& destination) override {
        calls.push_back(accession);
        return handler_(accession, destination);
    }

    /// @brief Accessions requested, in call order.
    std::vector<Accession> calls;

    /// @brief Every request succeeds with a one-record genome archive.
    [[nodiscard]] static Handler serveGenomes();

    /// @brief Every request fails with HTTP 500.
    [[nodiscard]] static Handler failAlways();

private:
    Handler handler_;
};

/// @brief FASTA text served for an accession by FakeFetcher::serveGenomes().
[[nodiscard]] std::string genomeSequence(const Accession& accession);

// =============================================================================
// Stage Fixture
// =============================================================================

/// @brief Fixture with an output directory and an empty status table.
class StageTest : public ::testing::Test {
protected:
    StageTest();

    /// @brief Replace the manifest entries.
    void setAccessions(const std::vector<Accession>& accessions);

    /// @brief Context over the fixture state.
    [[nodiscard]] pipeline::RunContext context() {
        return pipeline::RunContext{config, entries, status};
    }

    TempDir tempDir;
    pipeline::PipelineConfig config;
    std::vector<GenomeManifestEntry> entries;
    pipeline::StatusTable status;
};

/// @brief Sleeper that records the requested delays instead of waiting.
[[nodiscard]] pipeline::Sleeper recordingSleeper(std::vector<std::chrono::seconds>& delays);

}  // namespace refdb::test

#endif  // REFDB_TESTS_TEST_UTILS_H
