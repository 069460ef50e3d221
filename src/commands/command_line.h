// =============================================================================
// refdb - Command Line Helpers
// =============================================================================
// Argument preprocessing applied before CLI11 parses the command line.
// =============================================================================

#ifndef REFDB_COMMANDS_COMMAND_LINE_H
#define REFDB_COMMANDS_COMMAND_LINE_H

#include <string>
#include <vector>

namespace refdb::commands {

/// @brief Subcommand assumed when none is named.
inline constexpr const char* kDefaultSubcommand = "run";

/// @brief Insert the default subcommand when the arguments name none.
///
/// `refdb --version v2 --backup-dir old` becomes
/// `refdb run --version v2 --backup-dir old`. Help and program-version
/// requests, and argument lists that already name a subcommand, are
/// returned unchanged.
/// @param args Full argument list, program name first.
[[nodiscard]] std::vector<std::string> withDefaultSubcommand(std::vector<std::string> args);

}  // namespace refdb::commands

#endif  // REFDB_COMMANDS_COMMAND_LINE_H
