// =============================================================================
// refdb - Test Entry Point
// =============================================================================
// Initializes logging before the tests run; the REFDB_LOG_* macros require
// an initialized logger. Console output is limited to errors.
// =============================================================================

#include <gtest/gtest.h>

#include "refdb/common/logger.h"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    refdb::log::Config config;
    config.level = refdb::log::Level::kDebug;
    config.enableConsole = false;
    refdb::log::init(config);

    const int result = RUN_ALL_TESTS();
    refdb::log::shutdown();
    return result;
}
