#include <catch2/catch_test_macros.hpp>
#include "utils/ProcessUtils.h"
#include <string>

using namespace AutoScrub;

#ifndef _WIN32

TEST_CASE("runHiddenCommand captures output and exit code", "[process]") {
    std::string output;
    CHECK(runHiddenCommand("echo hello", output) == 0);
    CHECK(output == "hello\n");

    output.clear();
    CHECK(runHiddenCommand("sh -c 'echo oops >&2; exit 3'", output) == 3);
    CHECK(output.find("oops") != std::string::npos);
}

TEST_CASE("runHiddenCommand rejects an empty command", "[process]") {
    std::string output;
    CHECK(runHiddenCommand("", output) == -1);
    CHECK_FALSE(output.empty());
}

TEST_CASE("buildCommandLine keeps arguments intact", "[process]") {
    // printf echoes each argument on its own line
    const std::string cmd = buildCommandLine("printf", {"%s\\n", "it's here", "a b", "$HOME", "[0:v]"});
    std::string output;
    REQUIRE(runHiddenCommand(cmd, output) == 0);
    CHECK(output == "it's here\na b\n$HOME\n[0:v]\n");
}

TEST_CASE("findExecutable locates programs on PATH", "[process]") {
    CHECK_FALSE(findExecutable("sh").empty());
    CHECK(findExecutable("autoscrub-no-such-program").empty());
}

#endif

TEST_CASE("quoteArgument wraps arguments", "[process]") {
    const std::string quoted = quoteArgument("my video.mkv");
    CHECK(quoted.size() > std::string("my video.mkv").size());
    CHECK(quoted.find("my video.mkv") != std::string::npos);
}
