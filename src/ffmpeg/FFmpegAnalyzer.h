#pragma once

#include "MediaProbe.h"
#include "scrub/MediaAnalyzer.h"

#include <string>
#include <vector>

namespace AutoScrub {

/**
 * @brief MediaAnalyzer backed by the ffmpeg command line tool
 *
 * Loudness comes from the ebur128 filter, silences from silencedetect. Each
 * analysis decodes the whole audio track once; nothing is retried.
 */
class FFmpegAnalyzer : public MediaAnalyzer {
public:
    explicit FFmpegAnalyzer(const std::string& inputFile);

    /**
     * @brief Resolve ffmpeg, query its version and probe the input
     * @return true if ffmpeg runs and the input has video and audio
     */
    bool open();

    bool measureLoudness(double& integratedLufs) override;

    bool detectSilences(double thresholdDb,
                        double minimumDuration,
                        std::vector<SilenceInterval>& silences) override;

    std::string getLastError() const override { return m_lastError; }

    const std::string& getInputFile() const { return m_inputFile; }
    const std::string& getFFmpegPath() const { return m_ffmpegPath; }
    const std::string& getVersion() const { return m_version; }
    const MediaInfo& getMediaInfo() const { return m_mediaInfo; }

    /**
     * @brief Get FFmpeg executable path
     * Checks environment variable AUTOSCRUB_FFMPEG_PATH, then PATH, then falls back to default
     */
    static std::string resolveFFmpegPath();

    // Per-analysis ffmpeg options, after the common -hide_banner -nostats -i <input>
    static std::vector<std::string> silenceDetectOptions(double thresholdDb, double minimumDuration);
    static std::vector<std::string> loudnessOptions();

private:
    std::string m_inputFile;
    std::string m_ffmpegPath;
    std::string m_version;
    MediaInfo m_mediaInfo;
    std::string m_lastError;

    // Run ffmpeg on the input with extra options; output gets stdout+stderr
    bool exec(const std::vector<std::string>& options, std::string& output);
};

} // namespace AutoScrub
