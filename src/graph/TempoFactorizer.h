#pragma once

#include <string>
#include <vector>

namespace AutoScrub {

/**
 * @brief Splits a playback speed factor into atempo-sized stages
 *
 * ffmpeg's atempo filter only accepts ratios in [0.5, 2.0] per instance, so
 * larger speed changes are expressed as a chain. The decomposition is a pure
 * function of the factor: the same factor always yields the same chain.
 */
class TempoFactorizer {
public:
    static constexpr double kMinStageRatio = 0.5;
    static constexpr double kMaxStageRatio = 2.0;

    /**
     * @brief Decompose a speed factor into per-stage ratios
     *
     * For factor >= 1: floor(log2(factor)) stages of 2.0, followed by the
     * remainder factor / 2^n when factor is not an exact power of two.
     * For factor < 1 the same rule is mirrored with 0.5 stages. Slow motion
     * is not a use the tool is tuned for; the mirror only keeps stages legal.
     * A factor of exactly 1.0 yields an empty chain.
     *
     * @param factor Speed factor, must be finite and > 0
     * @return Ordered ratios whose product equals factor
     * @throws ConfigurationError for non-positive or non-finite factors
     */
    static std::vector<double> factorize(double factor);

    // "atempo=2.0,atempo=1.5" for factor 3; empty for factor 1
    static std::string buildAtempoChain(double factor);
};

} // namespace AutoScrub
