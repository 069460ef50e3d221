// =============================================================================
// refdb - Command Line Helper Tests
// =============================================================================

#include "commands/command_line.h"

#include <gtest/gtest.h>

namespace refdb::commands {
namespace {

using Args = std::vector<std::string>;

TEST(CommandLineTest, BareInvocationDefaultsToRun) {
    EXPECT_EQ(withDefaultSubcommand({"refdb", "--version", "v2", "--backup-dir", "/old"}),
              (Args{"refdb", "run", "--version", "v2", "--backup-dir", "/old"}));
    EXPECT_EQ(withDefaultSubcommand({"refdb", "-q", "--version", "v2"}),
              (Args{"refdb", "run", "-q", "--version", "v2"}));
}

TEST(CommandLineTest, NamedSubcommandIsKept) {
    const Args compress{"refdb", "compress", "--version", "v2"};
    EXPECT_EQ(withDefaultSubcommand(compress), compress);
    const Args run{"refdb", "-v", "run", "--version", "v2"};
    EXPECT_EQ(withDefaultSubcommand(run), run);
}

TEST(CommandLineTest, HelpAndProgramVersionAreKept) {
    EXPECT_EQ(withDefaultSubcommand({"refdb"}), (Args{"refdb"}));
    EXPECT_EQ(withDefaultSubcommand({"refdb", "--help"}), (Args{"refdb", "--help"}));
    EXPECT_EQ(withDefaultSubcommand({"refdb", "-V"}), (Args{"refdb", "-V"}));
}

}  // namespace
}  // namespace refdb::commands
