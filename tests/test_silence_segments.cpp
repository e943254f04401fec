#include <catch2/catch_test_macros.hpp>
#include "graph/SilenceSegments.h"
#include <vector>

using namespace AutoScrub;

namespace {

SilenceInterval closed(double start, double end) {
    return SilenceInterval{start, end};
}

SilenceInterval openEnded(double start) {
    return SilenceInterval{start, std::nullopt};
}

} // namespace

TEST_CASE("truncateSilences keeps internal silences", "[segments]") {
    std::vector<SilenceInterval> silences = {closed(5.0, 8.0), closed(12.0, 15.0)};
    CHECK(truncateSilences(silences) == silences);
}

TEST_CASE("truncateSilences drops a silence at the very start", "[segments]") {
    std::vector<SilenceInterval> silences = {closed(0.0, 3.0), closed(12.0, 15.0)};
    CHECK(truncateSilences(silences) == std::vector<SilenceInterval>{closed(12.0, 15.0)});

    // silencedetect can report a slightly negative start
    silences = {closed(-0.0013, 3.0), closed(12.0, 15.0)};
    CHECK(truncateSilences(silences).size() == 1);
}

TEST_CASE("truncateSilences drops an open-ended silence at the end", "[segments]") {
    std::vector<SilenceInterval> silences = {closed(5.0, 8.0), openEnded(20.0)};
    CHECK(truncateSilences(silences) == std::vector<SilenceInterval>{closed(5.0, 8.0)});
}

TEST_CASE("truncateSilences drops a single start-and-end silence once", "[segments]") {
    CHECK(truncateSilences({openEnded(0.0)}).empty());
    CHECK(truncateSilences({closed(0.0, 3.0)}).empty());
    CHECK(truncateSilences({openEnded(4.0)}).empty());
    CHECK(truncateSilences({closed(0.0, 3.0), openEnded(10.0)}).empty());
    CHECK(truncateSilences({}).empty());
}

TEST_CASE("truncateSilences is idempotent", "[segments]") {
    const std::vector<std::vector<SilenceInterval>> inputs = {
        {},
        {openEnded(0.0)},
        {closed(0.0, 3.0), closed(5.0, 8.0), openEnded(20.0)},
        {closed(1.0, 3.0), closed(5.0, 8.0)},
        {closed(0.0, 2.0), closed(4.0, 7.0), closed(9.0, 12.0)},
    };
    for (const auto& input : inputs) {
        const auto once = truncateSilences(input);
        CHECK(truncateSilences(once) == once);
    }
}

TEST_CASE("computeBoundaries applies the margin on both edges", "[segments]") {
    const SegmentBoundaries b = computeBoundaries(4.0, closed(10.0, 15.0), 0.25);
    CHECK(b.before.from == 4.0);
    CHECK(b.before.to == 10.25);
    CHECK(b.during.from == 10.25);
    CHECK(b.during.to == 14.75);
    CHECK(b.nextCursor() == 14.75);
    CHECK(b.during.length() == 4.5);
}

TEST_CASE("computeBoundaries passes a non-positive fast segment through", "[segments]") {
    // Shorter than two margins: engine inconsistency, not an error here
    const SegmentBoundaries b = computeBoundaries(0.0, closed(10.0, 10.4), 0.25);
    CHECK(b.during.from == 10.25);
    CHECK(b.during.to == 10.15);
    CHECK(b.during.length() < 0.0);
}
