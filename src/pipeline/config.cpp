// =============================================================================
// refdb - Pipeline Configuration Implementation
// =============================================================================

#include "refdb/pipeline/config.h"

namespace refdb::pipeline {

namespace fs = std::filesystem;

namespace {

std::string withExtension(const Accession& accession, std::string_view extension) {
    return accession + std::string(extension);
}

}  // namespace

std::string artifactFileName(std::string_view version) {
    return "refseq_database_" + std::string(version) + ".fa";
}

VoidResult PipelineConfig::validate() const {
    if (version.empty()) {
        return makeVoidError(ErrorCode::kUsageError, "--version is required");
    }
    // The tag becomes part of file names and must stay verbatim
    if (version.find('/') != std::string::npos || version == "." || version == "..") {
        return makeVoidError(ErrorCode::kUsageError,
                             "--version must be usable as a file name component: " + version);
    }
    if (progressInterval == 0) {
        return makeVoidError(ErrorCode::kUsageError, "progress interval must be positive");
    }
    return makeVoidSuccess();
}

fs::path PipelineConfig::resolvedManifestPath() const {
    if (!manifestPath.empty()) {
        return manifestPath;
    }
    return outputDir / kDefaultManifestRelativePath;
}

fs::path PipelineConfig::genomesDir() const {
    return outputDir / kGenomesDirName;
}

fs::path PipelineConfig::logsDir() const {
    return outputDir / kLogsDirName;
}

fs::path PipelineConfig::archivePath(const Accession& accession) const {
    return genomesDir() / withExtension(accession, kArchiveExtension);
}

fs::path PipelineConfig::sequencePath(const Accession& accession) const {
    return genomesDir() / withExtension(accession, kSequenceExtension);
}

std::optional<fs::path> PipelineConfig::backupArchivePath(const Accession& accession) const {
    if (!backupDir.has_value()) {
        return std::nullopt;
    }
    return *backupDir / kGenomesDirName / withExtension(accession, kArchiveExtension);
}

std::optional<fs::path> PipelineConfig::backupSequencePath(const Accession& accession) const {
    if (!backupDir.has_value()) {
        return std::nullopt;
    }
    return *backupDir / kGenomesDirName / withExtension(accession, kSequenceExtension);
}

fs::path PipelineConfig::emptyManifestPath() const {
    return genomesDir() / kEmptyManifestName;
}

fs::path PipelineConfig::alternateEmptyManifestPath() const {
    return genomesDir() / kAlternateEmptyManifestName;
}

fs::path PipelineConfig::missingReportPath() const {
    return outputDir / kMissingReportName;
}

fs::path PipelineConfig::statusTablePath() const {
    return genomesDir() / kStatusTableName;
}

fs::path PipelineConfig::downloadFailuresPath() const {
    return logsDir() / kDownloadFailureManifestName;
}

fs::path PipelineConfig::extractionFailuresPath() const {
    return logsDir() / kExtractionFailureManifestName;
}

fs::path PipelineConfig::artifactPath() const {
    return outputDir / artifactFileName(version);
}

fs::path PipelineConfig::compressedArtifactPath() const {
    fs::path path = artifactPath();
    path += ".gz";
    return path;
}

}  // namespace refdb::pipeline
