// =============================================================================
// refdb - Assembly Stage Implementation
// =============================================================================

#include "refdb/pipeline/assembly_stage.h"

#include <format>
#include <fstream>
#include <unordered_set>

#include "refdb/common/cancellation.h"
#include "refdb/common/logger.h"
#include "refdb/io/file_utils.h"

namespace refdb::pipeline {

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kCopyBufferSize = 1024 * 1024;

/// @brief Append the bytes of `input` to `out`.
/// @return Number of bytes copied.
std::uint64_t appendFile(const fs::path& input, std::ofstream& out, std::vector<char>& buffer) {
    std::ifstream in(input, std::ios::binary);
    if (!in) {
        throw IOError("Cannot open for reading", ErrorContext(input.string()));
    }

    std::uint64_t copied = 0;
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto count = in.gcount();
        if (count <= 0) {
            break;
        }
        out.write(buffer.data(), count);
        if (!out) {
            throw IOError("Write failed while appending " + input.string());
        }
        copied += static_cast<std::uint64_t>(count);
    }
    if (in.bad()) {
        throw IOError("Read failed", ErrorContext(input.string()));
    }
    return copied;
}

}  // namespace

std::vector<Accession> mergeMissingAccessions(const std::vector<std::vector<Accession>>& sources,
                                              const std::vector<Accession>& survivors) {
    std::unordered_set<Accession> seen(survivors.begin(), survivors.end());
    std::vector<Accession> merged;
    for (const auto& source : sources) {
        for (const auto& accession : source) {
            if (seen.insert(accession).second) {
                merged.push_back(accession);
            }
        }
    }
    return merged;
}

VoidResult AssemblyStage::run(RunContext& context) {
    return tryExecute([&] { assemble(context.config); });
}

void AssemblyStage::assemble(const PipelineConfig& config) {
    report_ = AssemblyReport{};

    std::vector<fs::path> sequences;
    for (auto& path : io::listFilesWithExtension(config.genomesDir(), kSequenceExtension)) {
        if (io::fileSizeOrZero(path) > 0) {
            sequences.push_back(std::move(path));
        }
    }
    if (sequences.empty()) {
        throw StageFailure(std::string(name()),
                           "no sequence files to assemble in " + config.genomesDir().string());
    }

    writeMissingReport(config, sequences);

    const fs::path artifact = config.artifactPath();
    const fs::path partial = io::partialPath(artifact);
    REFDB_LOG_INFO("Concatenating {} sequence files into {}", sequences.size(),
                   artifact.string());

    std::uint64_t expected = 0;
    std::uint64_t written = 0;
    {
        std::ofstream out(partial, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw IOError("Cannot open for writing", ErrorContext(partial.string()));
        }
        std::vector<char> buffer(kCopyBufferSize);
        for (const auto& sequence : sequences) {
            throwIfCancelled();
            expected += io::fileSizeOrZero(sequence);
            written += appendFile(sequence, out, buffer);
        }
        if (!out.flush()) {
            throw IOError("Write failed", ErrorContext(partial.string()));
        }
    }

    const std::uint64_t actual = io::fileSizeOrZero(partial);
    if (actual != expected || written != expected) {
        io::removeQuietly(partial);
        throw StageFailure(std::string(name()),
                           std::format("artifact size {} does not match input total {}", actual,
                                       expected));
    }

    io::commitPartial(partial, artifact);
    report_.sequenceFiles = sequences.size();
    report_.bytesWritten = actual;
    REFDB_LOG_INFO("Wrote {} ({} bytes from {} files)", artifact.string(), actual,
                   sequences.size());
}

void AssemblyStage::writeMissingReport(const PipelineConfig& config,
                                       const std::vector<fs::path>& sequences) {
    std::vector<Accession> survivors;
    survivors.reserve(sequences.size());
    for (const auto& sequence : sequences) {
        survivors.push_back(bareAccession(sequence.filename().string(), kSequenceExtension));
    }

    const std::vector<std::vector<Accession>> sources = {
        io::readLines(config.emptyManifestPath()),
        io::readLines(config.alternateEmptyManifestPath()),
        io::readLines(config.downloadFailuresPath()),
        io::readLines(config.extractionFailuresPath()),
    };

    report_.missing = mergeMissingAccessions(sources, survivors);
    io::writeLinesAtomic(config.missingReportPath(), report_.missing);
    REFDB_LOG_INFO("Recorded {} missing genomes in {}", report_.missing.size(),
                   config.missingReportPath().string());
}

}  // namespace refdb::pipeline
