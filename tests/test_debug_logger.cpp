#include <catch2/catch_test_macros.hpp>
#include "utils/DebugLogger.h"
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <string>

using namespace AutoScrub;

TEST_CASE("DebugLogger appends messages to its log file", "[logger]") {
    DebugLogger& logger = DebugLogger::getInstance();
    const std::string path = logger.getLogPath();
    REQUIRE_FALSE(path.empty());

    const char* envPath = std::getenv("AUTOSCRUB_LOG_FILE");
    if (envPath != nullptr && envPath[0] != '\0') {
        CHECK(path == envPath);
    }

    const std::string marker =
        "logger-marker-" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
    logger.log(marker);

    std::ifstream in(path);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    CHECK(content.find(marker) != std::string::npos);
}

TEST_CASE("DebugLogger verbose flag toggles", "[logger]") {
    DebugLogger& logger = DebugLogger::getInstance();
    const bool previous = logger.isVerbose();

    logger.setVerbose(true);
    CHECK(logger.isVerbose());
    logger.setVerbose(false);
    CHECK_FALSE(logger.isVerbose());

    logger.setVerbose(previous);
}
