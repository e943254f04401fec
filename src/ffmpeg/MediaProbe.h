#pragma once

#include <cstdint>
#include <string>

// Forward declarations
struct AVFormatContext;

namespace AutoScrub {

/**
 * @brief Stream layout of a probed input
 */
struct MediaInfo {
    double duration = 0.0;       // Duration in seconds, 0 if unknown
    int videoStreamIndex = -1;   // First video stream, -1 if none
    int audioStreamIndex = -1;   // First audio stream, -1 if none
    std::string videoCodec;
    std::string audioCodec;
    int sampleRate = 0;
    std::string formatName;

    bool hasVideo() const { return videoStreamIndex >= 0; }
    bool hasAudio() const { return audioStreamIndex >= 0; }
};

/**
 * @brief Reads container metadata with libavformat, without decoding
 *
 * Used to reject inputs the filter graph cannot apply to before any ffmpeg
 * process is launched: the graph reads [0:v] and [0:a].
 */
class MediaProbe {
public:
    MediaProbe();
    ~MediaProbe();

    MediaProbe(const MediaProbe&) = delete;
    MediaProbe& operator=(const MediaProbe&) = delete;

    /**
     * @brief Open a media file and read its stream information
     * @return true if successful, false otherwise
     */
    bool open(const std::string& filePath);

    void close();

    bool isOpen() const { return m_formatCtx != nullptr; }

    MediaInfo getInfo() const { return m_info; }

    std::string getLastError() const { return m_lastError; }

    /**
     * @brief Probe and require one video and one audio stream
     * @return true if the file carries both
     */
    bool requireAudioVideo(const std::string& filePath);

private:
    AVFormatContext* m_formatCtx;
    MediaInfo m_info;
    std::string m_lastError;
};

} // namespace AutoScrub
