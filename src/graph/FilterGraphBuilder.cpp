#include "FilterGraphBuilder.h"
#include "GainStage.h"
#include "TempoFactorizer.h"
#include "core/NumberFormat.h"
#include "utils/DebugLogger.h"

#include <sstream>

namespace AutoScrub {

namespace {

const char* const kVideoIn = "[0:v]";
const char* const kAudioIn = "[0:a]";
const char* const kResetPts = "setpts=PTS-STARTPTS";

std::string trimRange(const TimeSpan& span) {
    return "trim=" + formatNumber(span.from) + ":" + formatNumber(span.to);
}

std::string videoLabel(int node) {
    return "[v" + std::to_string(node) + "]";
}

std::string audioLabel(int node) {
    return "[a" + std::to_string(node) + "]";
}

void log(const std::string& msg) {
    DebugLogger::getInstance().log("[AutoScrub] " + msg);
}

} // namespace

FilterGraphBuilder::FilterGraphBuilder(double margin, double speedupFactor)
    : m_margin(margin)
    , m_speedupFactor(speedupFactor)
    , m_audioSpeedup(TempoFactorizer::buildAtempoChain(speedupFactor))
{
    m_videoSpeedup = "setpts=(PTS-STARTPTS)/" + formatNumber(m_speedupFactor);
}

void FilterGraphBuilder::addSilence(const SilenceInterval& silence) {
    const SegmentBoundaries b = computeBoundaries(m_cursor.cursorTime, silence, m_margin);
    m_cursor.cursorTime = b.nextCursor();
    m_lastBoundaries = b;

    ++m_cursor.segmentIndex;  // 1-based
    const int before = 2 * m_cursor.segmentIndex - 1;
    const int during = 2 * m_cursor.segmentIndex;

    if (b.during.length() <= 0.0) {
        std::ostringstream msg;
        msg << "silence at " << silence.start << "s leaves a non-positive fast segment ("
            << b.during.length() << "s); passing it through";
        log(msg.str());
    }

    m_stages.trims.push_back(std::string(kVideoIn) + " " + trimRange(b.before) + ", " + kResetPts +
                             " " + videoLabel(before) + ";");
    m_stages.trims.push_back(std::string(kVideoIn) + " " + trimRange(b.during) + ", " +
                             m_videoSpeedup + " " + videoLabel(during) + ";");

    m_stages.atrims.push_back(std::string(kAudioIn) + " a" + trimRange(b.before) + ", a" +
                              kResetPts + " " + audioLabel(before) + ";");
    std::string audioDuring = std::string(kAudioIn) + " a" + trimRange(b.during) + ", a" + kResetPts;
    if (!m_audioSpeedup.empty()) {
        audioDuring += ", " + m_audioSpeedup;
    }
    m_stages.atrims.push_back(audioDuring + " " + audioLabel(during) + ";");

    m_stages.concat.push_back(videoLabel(before) + " " + audioLabel(before) + " " +
                              videoLabel(during) + " " + audioLabel(during));
}

FilterGraphStages FilterGraphBuilder::finish(bool gainPending) const {
    FilterGraphStages stages = m_stages;

    // Trailing pass-through runs to the end of the media
    const int nodes = m_cursor.segmentIndex * 2 + 1;
    const std::string tillEnd = "trim=start=" + formatNumber(m_cursor.cursorTime);

    stages.trims.push_back(std::string(kVideoIn) + " " + tillEnd + ", " + kResetPts + " " +
                           videoLabel(nodes) + ";");
    stages.atrims.push_back(std::string(kAudioIn) + " a" + tillEnd + ", a" + kResetPts + " " +
                            audioLabel(nodes) + ";");

    const char* audioOut = concatAudioOutputLabel(gainPending);
    stages.concat.push_back(videoLabel(nodes) + " " + audioLabel(nodes) + " concat=n=" +
                            std::to_string(nodes) + ":v=1:a=1 " + kFinalVideoLabel + " " +
                            audioOut + ";");
    stages.nodes = nodes;
    return stages;
}

std::string FilterGraphBuilder::build(bool gainPending) const {
    return join(finish(gainPending));
}

std::string FilterGraphBuilder::join(const FilterGraphStages& stages) {
    auto joinLines = [](const std::vector<std::string>& lines, const char* sep) {
        std::string out;
        for (size_t i = 0; i < lines.size(); ++i) {
            if (i > 0) out += sep;
            out += lines[i];
        }
        return out;
    };

    return joinLines(stages.trims, "\n") + "\n" + joinLines(stages.atrims, "\n") + "\n" +
           joinLines(stages.concat, " ");
}

std::string buildSilenceFilterGraph(const std::vector<SilenceInterval>& internalSilences,
                                    double margin,
                                    double speedupFactor,
                                    bool gainPending) {
    FilterGraphBuilder builder(margin, speedupFactor);
    for (const auto& silence : internalSilences) {
        builder.addSilence(silence);
    }
    return builder.build(gainPending);
}

} // namespace AutoScrub
