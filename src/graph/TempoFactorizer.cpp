#include "TempoFactorizer.h"
#include "core/Errors.h"
#include "core/NumberFormat.h"

#include <cmath>
#include <sstream>

namespace AutoScrub {

std::vector<double> TempoFactorizer::factorize(double factor) {
    if (!std::isfinite(factor) || factor <= 0.0) {
        std::ostringstream msg;
        msg << "speed factor must be a positive number, got " << factor;
        throw ConfigurationError(msg.str());
    }

    std::vector<double> ratios;

    // factor = mantissa * 2^exponent with mantissa in [0.5, 1), exact for doubles
    int exponent = 0;
    const double mantissa = std::frexp(factor, &exponent);

    if (factor >= 1.0) {
        // floor(log2(factor)) == exponent - 1
        ratios.assign(static_cast<size_t>(exponent - 1), kMaxStageRatio);
        const double remainder = mantissa * 2.0;  // factor / 2^n, in [1, 2)
        if (remainder != 1.0) {
            ratios.push_back(remainder);
        }
    } else {
        // exponent <= 0 here; factor * 2^-exponent == mantissa, in [0.5, 1)
        ratios.assign(static_cast<size_t>(-exponent), kMinStageRatio);
        ratios.push_back(mantissa);
    }

    return ratios;
}

std::string TempoFactorizer::buildAtempoChain(double factor) {
    std::ostringstream chain;
    bool first = true;
    for (double ratio : factorize(factor)) {
        if (!first) chain << ",";
        chain << "atempo=" << formatNumber(ratio);
        first = false;
    }
    return chain.str();
}

} // namespace AutoScrub
