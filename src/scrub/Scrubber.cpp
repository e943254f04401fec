#include "Scrubber.h"
#include "graph/FilterGraphBuilder.h"
#include "graph/GainStage.h"
#include "tracing/Tracing.h"
#include "utils/DebugLogger.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace AutoScrub {

namespace {

void log(const std::string& msg) {
    DebugLogger::getInstance().log("[AutoScrub] " + msg);
}

} // namespace

Scrubber::Scrubber(const ScrubConfig& config, MediaAnalyzer& analyzer)
    : m_config(config)
    , m_analyzer(analyzer)
{
    m_config.validate();
    m_threshold = m_config.silenceThresholdDb;
}

bool Scrubber::analyze() {
    m_lastError.clear();
    m_analyzed = false;
    m_silences.clear();
    m_gain = 0.0;
    m_threshold = m_config.silenceThresholdDb;

    if (m_config.normalizeLoudness) {
        TRACE_SCOPE("loudness");
        double measured = 0.0;
        if (!m_analyzer.measureLoudness(measured)) {
            m_lastError = "Loudness measurement failed: " + m_analyzer.getLastError();
            return false;
        }
        m_measuredLoudness = measured;
        m_gain = computeGain(measured, m_config.targetLoudnessDb);
        // Judge silence on the level the audio will have after the gain stage
        m_threshold = measured + m_config.silenceThresholdDb - m_config.targetLoudnessDb;

        std::ostringstream msg;
        msg << "measured loudness=" << measured << " dBLUFS; gain=" << m_gain
            << " dB; threshold=" << m_threshold << " dB";
        log(msg.str());
    }

    std::cout << "searching for silence...\n";
    {
        TRACE_SCOPE("silencedetect");
        if (!m_analyzer.detectSilences(m_threshold, m_config.minimumSilenceDuration, m_silences)) {
            m_lastError = "Silence detection failed: " + m_analyzer.getLastError();
            m_silences.clear();
            return false;
        }
    }

    double totalDuration = 0.0;
    size_t closed = 0;
    for (const auto& silence : m_silences) {
        if (!silence.isOpenEnded()) {
            totalDuration += *silence.end - silence.start;
            ++closed;
        }
    }
    std::ostringstream msg;
    msg << "found " << m_silences.size() << " silences with average_duration="
        << (closed > 0 ? totalDuration / closed : 0.0);
    log(msg.str());

    m_analyzed = true;
    return true;
}

std::string Scrubber::buildFilterGraph() const {
    TRACE_SCOPE("filtergraph");
    const std::vector<SilenceInterval> internal = truncateSilences(m_silences);
    if (internal.size() != m_silences.size()) {
        log("skipping " + std::to_string(m_silences.size() - internal.size()) +
            " silence(s) at the start/end of the media");
    }

    const bool gainPending = needsVolumeStage(m_gain);
    return buildSilenceFilterGraph(internal, m_config.margin, m_config.speedupFactor, gainPending) +
           buildVolumeStage(m_gain);
}

bool Scrubber::writeFilterGraph(const std::string& outputPath) {
    m_lastError.clear();
    if (!m_analyzed) {
        m_lastError = "No analysis results; call analyze() first";
        return false;
    }

    const std::string graph = buildFilterGraph();

    std::ofstream out(outputPath, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) {
        m_lastError = "Could not open output file: " + outputPath;
        return false;
    }
    out << graph;
    out.close();
    if (!out) {
        m_lastError = "Could not write output file: " + outputPath;
        return false;
    }

    log("wrote " + std::to_string(graph.size()) + " bytes to " + outputPath);
    return true;
}

std::string Scrubber::defaultOutputPath(const std::string& inputFile) {
    std::filesystem::path p(inputFile);
    p.replace_extension(".filter-graph");
    return p.string();
}

} // namespace AutoScrub
