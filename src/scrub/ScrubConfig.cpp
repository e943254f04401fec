#include "ScrubConfig.h"
#include "core/Errors.h"

#include <cmath>
#include <sstream>

namespace AutoScrub {

namespace {

void requireFinite(double value, const char* name) {
    if (!std::isfinite(value)) {
        throw ConfigurationError(std::string(name) + " must be a finite number");
    }
}

} // namespace

void ScrubConfig::validate() const {
    requireFinite(margin, "delay");
    requireFinite(minimumSilenceDuration, "silence duration");
    requireFinite(speedupFactor, "speed");
    requireFinite(silenceThresholdDb, "silence threshold");
    requireFinite(targetLoudnessDb, "target loudness");

    std::ostringstream msg;
    if (margin < 0.0) {
        msg << "delay=" << margin << " must not be negative";
        throw ConfigurationError(msg.str());
    }
    if (minimumSilenceDuration <= 0.0) {
        msg << "silence=" << minimumSilenceDuration << " must be greater than 0";
        throw ConfigurationError(msg.str());
    }
    if (speedupFactor <= 0.0) {
        msg << "speed=" << speedupFactor << " must be greater than 0";
        throw ConfigurationError(msg.str());
    }
    if (targetLoudnessDb > 0.0) {
        msg << "loudness=" << targetLoudnessDb << " must not be above 0 dB";
        throw ConfigurationError(msg.str());
    }
    // Both margins must fit inside the shortest silence
    if (margin >= minimumSilenceDuration / 2.0) {
        msg << "delay=" << margin << " must be less than half of silence=" << minimumSilenceDuration;
        throw ConfigurationError(msg.str());
    }
}

std::string ScrubConfig::toString() const {
    std::ostringstream oss;
    oss << "delay=" << margin << "s silence=" << minimumSilenceDuration << "s speed=" << speedupFactor
        << "x threshold=" << silenceThresholdDb << "dB";
    if (normalizeLoudness) {
        oss << " target=" << targetLoudnessDb << "dB";
    } else {
        oss << " (no normalization)";
    }
    return oss.str();
}

} // namespace AutoScrub
