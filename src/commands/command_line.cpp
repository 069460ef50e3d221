// =============================================================================
// refdb - Command Line Helpers Implementation
// =============================================================================

#include "commands/command_line.h"

#include <algorithm>
#include <array>
#include <string_view>

namespace refdb::commands {

namespace {

constexpr std::array<std::string_view, 2> kSubcommands = {"run", "compress"};
constexpr std::array<std::string_view, 4> kStandalone = {"-h", "--help", "--help-all", "-V"};

bool isOneOf(std::string_view arg, const auto& names) {
    return std::find(names.begin(), names.end(), arg) != names.end();
}

}  // namespace

std::vector<std::string> withDefaultSubcommand(std::vector<std::string> args) {
    if (args.size() < 2) {
        return args;
    }
    for (std::size_t i = 1; i < args.size(); ++i) {
        if (isOneOf(args[i], kSubcommands) || isOneOf(args[i], kStandalone)) {
            return args;
        }
    }
    args.insert(args.begin() + 1, kDefaultSubcommand);
    return args;
}

}  // namespace refdb::commands
