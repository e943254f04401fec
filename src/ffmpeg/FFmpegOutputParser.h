#pragma once

#include "graph/SilenceSegments.h"

#include <string>
#include <vector>

namespace AutoScrub {

/**
 * @brief Parse the log of an ffmpeg silencedetect run
 *
 * Lines from the filter look like
 *   [silencedetect @ 0x5581] silence_start: 12.34
 *   [silencedetect @ 0x5581] silence_end: 15.6 | silence_duration: 3.26
 * A silence_start left open at the end of the log yields an open-ended
 * interval.
 *
 * @param output Combined stdout/stderr of ffmpeg
 * @param silences Receives the intervals in log order
 * @param totalDuration Receives the sum of reported silence_duration values
 * @param error Set when the log is malformed
 * @return false for a silence_end without an open silence or an unreadable number
 */
bool parseSilenceDetectOutput(const std::string& output,
                              std::vector<SilenceInterval>& silences,
                              double& totalDuration,
                              std::string& error);

/**
 * @brief Integrated loudness from an ebur128 summary
 *
 * Reads the "I:" value following the last "Integrated loudness:" header, so
 * per-frame progress lines earlier in the log are ignored.
 */
bool parseIntegratedLoudness(const std::string& output, double& lufs);

// Version field of `ffmpeg -version` ("n7.1.3-14-ga..."), empty if absent
std::string parseFFmpegVersion(const std::string& versionOutput);

// Leading major number of a version string ("n7.1" -> 7), -1 if absent
int parseMajorVersion(const std::string& version);

} // namespace AutoScrub
