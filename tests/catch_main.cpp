#include <catch2/catch_session.hpp>
#include "utils/DebugLogger.h"
#include <cstdlib>

int main(int argc, char* argv[]) {
    // Diagnostics go to the log file only unless explicitly requested
    const char* verbose = std::getenv("AUTOSCRUB_TEST_VERBOSE");
    AutoScrub::DebugLogger::getInstance().setVerbose(verbose != nullptr && verbose[0] == '1');

    Catch::Session session;
    int result = session.applyCommandLine(argc, argv);
    if (result != 0) return result;
    return session.run();
}
