#pragma once

#include <string>

namespace AutoScrub {

/**
 * @brief Tuning parameters for one scrub run
 *
 * By default silences of 2.0+ seconds are fast-forwarded at 8x except for
 * the first and last 0.25 seconds, and audio is normalized to -18 dB.
 */
struct ScrubConfig {
    double margin = 0.25;                  // seconds kept at normal speed at each silence edge (--delay)
    double minimumSilenceDuration = 2.0;   // shortest silence to fast-forward (--silence-duration)
    double speedupFactor = 8.0;            // playback speed of silences (--speed)
    double silenceThresholdDb = -18.0;     // level considered silent, relative to target (--target-threshold)
    double targetLoudnessDb = -18.0;       // integrated loudness to normalize to (--target-lufs)
    bool normalizeLoudness = true;         // measure loudness and append a volume stage

    /**
     * @brief Check every invariant
     * @throws ConfigurationError describing the first violated invariant
     */
    void validate() const;

    std::string toString() const;
};

} // namespace AutoScrub
