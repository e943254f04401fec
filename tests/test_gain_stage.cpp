#include <catch2/catch_test_macros.hpp>
#include "graph/GainStage.h"
#include <string>

using namespace AutoScrub;

TEST_CASE("computeGain is target minus measured", "[gain]") {
    CHECK(computeGain(-20.0, -18.0) == 2.0);
    CHECK(computeGain(-10.0, -14.0) == -4.0);
    CHECK(computeGain(-18.0, -18.0) == 0.0);
}

TEST_CASE("non-zero gain routes audio through a volume stage", "[gain]") {
    const double gain = computeGain(-20.0, -18.0);
    REQUIRE(needsVolumeStage(gain));
    CHECK(std::string(concatAudioOutputLabel(needsVolumeStage(gain))) == "[an]");
    CHECK(buildVolumeStage(gain) == "\n[an] volume=2.0dB [a];");

    CHECK(buildVolumeStage(-4.5) == "\n[an] volume=-4.5dB [a];");
}

TEST_CASE("zero gain writes [a] directly and no volume stage", "[gain]") {
    const double gain = computeGain(-18.0, -18.0);
    CHECK_FALSE(needsVolumeStage(gain));
    CHECK(std::string(concatAudioOutputLabel(needsVolumeStage(gain))) == "[a]");
    CHECK(buildVolumeStage(gain).empty());
}
