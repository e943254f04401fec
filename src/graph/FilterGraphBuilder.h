#pragma once

#include "SilenceSegments.h"

#include <string>
#include <vector>

namespace AutoScrub {

/**
 * @brief Running position while emitting segment pairs
 */
struct BuildCursor {
    int segmentIndex = 0;    // pairs emitted so far; pair k owns nodes 2k-1 and 2k
    double cursorTime = 0.0; // start of the next normal-speed segment
};

/**
 * @brief Filter stages accumulated while walking the silences
 *
 * trims/atrims hold one line per video/audio stage in node order; concat holds
 * one label group per pair ("[v1] [a1] [v2] [a2]") and, after finish, the
 * trailing group carrying the concat filter itself.
 */
struct FilterGraphStages {
    std::vector<std::string> trims;
    std::vector<std::string> atrims;
    std::vector<std::string> concat;
    int nodes = 0;  // concat inputs (segments) once finished
};

/**
 * @brief Builds the -filter_complex text that fast-forwards silences
 *
 * Every internal silence contributes a normal-speed "before" segment and a
 * sped-up "during" segment, for video and audio alike. A trailing
 * normal-speed segment runs from the end of the last silence to the end of
 * the media, and one concat stage stitches everything back together in
 * chronological order.
 *
 * Node labels: pair k writes [v(2k-1)]/[a(2k-1)] and [v2k]/[a2k]; the trailing
 * segment writes [v(2N+1)]/[a(2N+1)].
 */
class FilterGraphBuilder {
public:
    /**
     * @param margin Seconds kept at normal speed on each side of a silence
     * @param speedupFactor Playback speed of the silent part (> 0)
     * @throws ConfigurationError for a non-positive speed factor
     */
    FilterGraphBuilder(double margin, double speedupFactor);

    /**
     * @brief Emit the before/during pair for one internal silence
     * @param silence Closed interval, later than any silence already added
     */
    void addSilence(const SilenceInterval& silence);

    /**
     * @brief Emit the trailing segment and the concat stage
     * @param gainPending true when a volume stage will follow, which makes the
     *        concat stage write [an] instead of [a]
     * @return Stage lists with the trailing segment and concat appended
     */
    FilterGraphStages finish(bool gainPending) const;

    /**
     * @brief Full graph text: video lines, audio lines, then the concat line
     */
    std::string build(bool gainPending) const;

    const BuildCursor& getCursor() const { return m_cursor; }
    const FilterGraphStages& getStages() const { return m_stages; }
    const SegmentBoundaries& getLastBoundaries() const { return m_lastBoundaries; }

    // Render finished stages as text
    static std::string join(const FilterGraphStages& stages);

private:
    double m_margin;
    double m_speedupFactor;
    std::string m_videoSpeedup;  // setpts expression for the fast segment
    std::string m_audioSpeedup;  // atempo chain, empty for factor 1

    BuildCursor m_cursor;
    FilterGraphStages m_stages;
    SegmentBoundaries m_lastBoundaries;
};

/**
 * @brief Graph text for already truncated silences
 * @see truncateSilences
 */
std::string buildSilenceFilterGraph(const std::vector<SilenceInterval>& internalSilences,
                                    double margin,
                                    double speedupFactor,
                                    bool gainPending);

} // namespace AutoScrub
