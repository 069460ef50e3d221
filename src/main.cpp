// =============================================================================
// refdb - Reference Genome Database Builder
// =============================================================================
// Main entry point for the refdb command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: run (the default when none is named), compress
// - Global options: verbose, quiet, program version (-V)
// - Environment fallbacks: REFDB_OUTPUT_DIR, BACKUP_DIR, GENOME_TSV,
//   NCBI_API_KEY
// - SIGINT/SIGTERM handling through the cancellation flag
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "refdb/common/cancellation.h"
#include "refdb/common/error.h"
#include "refdb/common/logger.h"

#include "commands/command_line.h"
#include "commands/compress_command.h"
#include "commands/run_command.h"

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "1.0.0";
constexpr const char* kDescription =
    "refdb: builds a versioned reference-genome database from NCBI Datasets.\n"
    "Downloads each listed assembly (reusing local and backup copies), unpacks it,\n"
    "drops empty results and concatenates the rest into refseq_database_<version>.fa.gz.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    int verbosity = 0;
    bool quiet = false;
};

GlobalOptions gOptions;

// =============================================================================
// Run Command Options
// =============================================================================

struct CliRunOptions {
    std::string version;
    std::string outputDir = ".";
    std::string backupDir;
    std::string manifest;
    std::string apiKey;
    bool skipCompression = false;
};

CliRunOptions gRunOpts;

// =============================================================================
// Compress Command Options
// =============================================================================

struct CliCompressOptions {
    std::string version;
    std::string outputDir = ".";
    int level = refdb::io::kDefaultGzipLevel;
};

CliCompressOptions gCompressOpts;

// =============================================================================
// Command Setup Functions
// =============================================================================

void setupRunCommand(CLI::App& app) {
    auto* run = app.add_subcommand("run", "Build the reference database for a version tag");
    run->fallthrough();

    run->add_option("--version", gRunOpts.version, "Version tag embedded in the artifact name")
        ->required();

    run->add_option("--output-dir", gRunOpts.outputDir, "Working/output directory")
        ->envname("REFDB_OUTPUT_DIR");

    run->add_option("--backup-dir", gRunOpts.backupDir,
                    "Previous output directory consulted before downloading")
        ->envname("BACKUP_DIR");

    run->add_option("--manifest", gRunOpts.manifest,
                    "Accession manifest (default: <output-dir>/data/ftp_reference_genomes.tsv)")
        ->envname("GENOME_TSV");

    run->add_option("--api-key", gRunOpts.apiKey, "NCBI API key")->envname("NCBI_API_KEY");

    run->add_flag("--skip-compression", gRunOpts.skipCompression,
                  "Leave the assembled artifact uncompressed");
}

void setupCompressCommand(CLI::App& app) {
    auto* compress =
        app.add_subcommand("compress", "Compress an assembled artifact to .fa.gz");
    compress->fallthrough();

    compress->add_option("--version", gCompressOpts.version, "Version tag of the artifact")
        ->required();

    compress->add_option("--output-dir", gCompressOpts.outputDir,
                         "Directory holding the artifact")
        ->envname("REFDB_OUTPUT_DIR");

    compress->add_option("-l,--level", gCompressOpts.level, "gzip level (1-9)")
        ->check(CLI::Range(1, 9));
}

int runBuild() {
    refdb::commands::RunOptions opts;
    opts.version = gRunOpts.version;
    opts.outputDir = gRunOpts.outputDir;
    if (!gRunOpts.backupDir.empty()) {
        opts.backupDir = gRunOpts.backupDir;
    }
    opts.manifestPath = gRunOpts.manifest;
    opts.apiKey = gRunOpts.apiKey;
    opts.skipCompression = gRunOpts.skipCompression;

    refdb::commands::RunCommand cmd(std::move(opts));
    return cmd.execute();
}

int runCompress() {
    refdb::commands::CompressOptions opts;
    opts.version = gCompressOpts.version;
    opts.outputDir = gCompressOpts.outputDir;
    opts.level = gCompressOpts.level;

    refdb::commands::CompressCommand cmd(std::move(opts));
    return cmd.execute();
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V", std::string(kVersion));

    app.add_flag("-v,--verbose", gOptions.verbosity, "Increase verbosity (-v for debug)");
    app.add_flag("-q,--quiet", gOptions.quiet, "Suppress non-error output");

    setupRunCommand(app);
    setupCompressCommand(app);
    app.require_subcommand(1);

    // `refdb --version <tag> ...` is shorthand for `refdb run --version <tag> ...`
    std::vector<std::string> args = refdb::commands::withDefaultSubcommand(
        std::vector<std::string>(argv, argv + argc));
    std::vector<char*> argvWithDefault;
    argvWithDefault.reserve(args.size());
    for (auto& arg : args) {
        argvWithDefault.push_back(arg.data());
    }

    try {
        app.parse(static_cast<int>(argvWithDefault.size()), argvWithDefault.data());
    } catch (const CLI::Success& e) {
        return app.exit(e);
    } catch (const CLI::ParseError& e) {
        (void)app.exit(e);
        return refdb::toExitCode(refdb::ErrorCode::kUsageError);
    }

    try {
        auto logLevel = refdb::log::Level::kInfo;
        if (gOptions.quiet) {
            logLevel = refdb::log::Level::kError;
        } else if (gOptions.verbosity >= 1) {
            logLevel = refdb::log::Level::kDebug;
        }
        refdb::log::init("", logLevel);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    refdb::installSignalHandlers();

    int exitCode = EXIT_SUCCESS;
    if (app.got_subcommand("run")) {
        exitCode = runBuild();
    } else if (app.got_subcommand("compress")) {
        exitCode = runCompress();
    }

    refdb::log::shutdown();
    return exitCode;
}
