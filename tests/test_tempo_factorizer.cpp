#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "core/Errors.h"
#include "graph/TempoFactorizer.h"
#include <vector>

using namespace AutoScrub;
using Catch::Matchers::WithinRel;

TEST_CASE("factorize splits powers of two into 2.0 stages", "[tempo]") {
    CHECK(TempoFactorizer::factorize(8.0) == std::vector<double>{2.0, 2.0, 2.0});
    CHECK(TempoFactorizer::factorize(2.0) == std::vector<double>{2.0});
    CHECK(TempoFactorizer::factorize(1.0).empty());
}

TEST_CASE("factorize appends the remainder for other factors", "[tempo]") {
    CHECK(TempoFactorizer::factorize(3.0) == std::vector<double>{2.0, 1.5});
    CHECK(TempoFactorizer::factorize(1.5) == std::vector<double>{1.5});
    CHECK(TempoFactorizer::factorize(10.0) == std::vector<double>{2.0, 2.0, 2.0, 1.25});
}

TEST_CASE("factorize mirrors the rule below 1.0", "[tempo]") {
    CHECK(TempoFactorizer::factorize(0.5) == std::vector<double>{0.5});
    CHECK(TempoFactorizer::factorize(0.25) == std::vector<double>{0.5, 0.5});
    CHECK(TempoFactorizer::factorize(0.75) == std::vector<double>{0.75});
}

TEST_CASE("factorize stages stay in range and multiply back to the factor", "[tempo]") {
    const std::vector<double> factors = {0.01, 0.3, 0.5, 0.99, 1.0, 1.01, 1.999, 2.0, 2.5,
                                         3.0, 4.0, 7.3, 8.0, 16.0, 33.3, 100.0, 1000.0};
    for (double factor : factors) {
        INFO("factor " << factor);
        const auto ratios = TempoFactorizer::factorize(factor);
        double product = 1.0;
        for (double r : ratios) {
            CHECK(r >= TempoFactorizer::kMinStageRatio);
            CHECK(r <= TempoFactorizer::kMaxStageRatio);
            product *= r;
        }
        CHECK_THAT(product, WithinRel(factor, 1e-12));
    }
}

TEST_CASE("factorize is deterministic", "[tempo]") {
    const auto first = TempoFactorizer::factorize(7.3);
    for (int i = 0; i < 5; ++i) {
        CHECK(TempoFactorizer::factorize(7.3) == first);
    }
}

TEST_CASE("factorize rejects non-positive factors", "[tempo]") {
    CHECK_THROWS_AS(TempoFactorizer::factorize(0.0), ConfigurationError);
    CHECK_THROWS_AS(TempoFactorizer::factorize(-2.0), ConfigurationError);
}

TEST_CASE("buildAtempoChain renders the stages", "[tempo]") {
    CHECK(TempoFactorizer::buildAtempoChain(8.0) == "atempo=2.0,atempo=2.0,atempo=2.0");
    CHECK(TempoFactorizer::buildAtempoChain(3.0) == "atempo=2.0,atempo=1.5");
    CHECK(TempoFactorizer::buildAtempoChain(1.0).empty());
}
