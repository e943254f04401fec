#pragma once

#include "graph/SilenceSegments.h"

#include <string>
#include <vector>

namespace AutoScrub {

/**
 * @brief Source of loudness and silence measurements for one input
 *
 * Implementations either succeed with valid data or fail the whole call and
 * report why through getLastError().
 */
class MediaAnalyzer {
public:
    virtual ~MediaAnalyzer() = default;

    /**
     * @brief Measure integrated loudness of the audio track
     * @param integratedLufs Receives the measurement in LUFS (dB)
     * @return true if successful
     */
    virtual bool measureLoudness(double& integratedLufs) = 0;

    /**
     * @brief Detect silences at or below a level lasting at least a duration
     * @param thresholdDb Level in dB considered silent
     * @param minimumDuration Shortest silence reported, in seconds
     * @param silences Receives silences ordered by start time
     * @return true if successful
     */
    virtual bool detectSilences(double thresholdDb,
                                double minimumDuration,
                                std::vector<SilenceInterval>& silences) = 0;

    virtual std::string getLastError() const = 0;
};

} // namespace AutoScrub
