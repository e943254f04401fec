#pragma once

#include "MediaAnalyzer.h"
#include "ScrubConfig.h"
#include "graph/SilenceSegments.h"

#include <string>
#include <vector>

namespace AutoScrub {

/**
 * @brief Turns measurements of one input into a -filter_complex script
 *
 * analyze() measures loudness (unless normalization is off), derives the gain
 * and the absolute silence threshold, then runs silence detection once.
 * buildFilterGraph() is a pure function of those results and the config.
 */
class Scrubber {
public:
    /**
     * @throws ConfigurationError if config violates an invariant
     */
    Scrubber(const ScrubConfig& config, MediaAnalyzer& analyzer);

    /**
     * @brief Run loudness measurement and silence detection
     * @return true if successful; see getLastError() otherwise
     */
    bool analyze();

    /**
     * @brief Complete graph text, including the volume stage when gain != 0
     */
    std::string buildFilterGraph() const;

    /**
     * @brief Write the graph to outputPath, replacing any existing file
     * @return true if successful
     */
    bool writeFilterGraph(const std::string& outputPath);

    // <dir>/<stem>.filter-graph next to the input
    static std::string defaultOutputPath(const std::string& inputFile);

    const ScrubConfig& getConfig() const { return m_config; }
    double getGain() const { return m_gain; }
    double getMeasuredLoudness() const { return m_measuredLoudness; }
    double getSilenceThreshold() const { return m_threshold; }
    const std::vector<SilenceInterval>& getSilences() const { return m_silences; }
    bool isAnalyzed() const { return m_analyzed; }
    std::string getLastError() const { return m_lastError; }

private:
    ScrubConfig m_config;
    MediaAnalyzer& m_analyzer;

    double m_measuredLoudness = 0.0;
    double m_gain = 0.0;
    double m_threshold = 0.0;
    std::vector<SilenceInterval> m_silences;
    bool m_analyzed = false;

    std::string m_lastError;
};

} // namespace AutoScrub
