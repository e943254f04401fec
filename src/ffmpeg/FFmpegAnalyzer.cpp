#include "FFmpegAnalyzer.h"
#include "FFmpegOutputParser.h"
#include "core/NumberFormat.h"
#include "tracing/Tracing.h"
#include "utils/DebugLogger.h"
#include "utils/ProcessUtils.h"

#include <cstdlib>
#include <sstream>

namespace AutoScrub {

namespace {

void log(const std::string& msg) {
    DebugLogger::getInstance().log("[AutoScrub] " + msg);
}

// Tail of a long ffmpeg log for error messages
std::string tail(const std::string& output, size_t maxChars = 500) {
    return output.size() > maxChars ? output.substr(output.size() - maxChars) : output;
}

} // namespace

FFmpegAnalyzer::FFmpegAnalyzer(const std::string& inputFile)
    : m_inputFile(inputFile)
{
}

std::string FFmpegAnalyzer::resolveFFmpegPath() {
    // 1. Check environment variable first
    const char* envPath = std::getenv("AUTOSCRUB_FFMPEG_PATH");
    if (envPath != nullptr && envPath[0] != '\0') {
        return envPath;
    }

    // 2. Try to find ffmpeg in PATH
#ifdef _WIN32
    std::string found = findExecutable("ffmpeg.exe");
#else
    std::string found = findExecutable("ffmpeg");
#endif
    if (!found.empty()) {
        return found;
    }

    // 3. Fall back to platform-specific default
#ifdef _WIN32
    return "ffmpeg.exe";
#elif defined(__APPLE__)
    return "/opt/homebrew/bin/ffmpeg";
#else
    return "/usr/bin/ffmpeg";
#endif
}

bool FFmpegAnalyzer::open() {
    m_lastError.clear();
    m_ffmpegPath = resolveFFmpegPath();

    std::string versionOutput;
    int rc = runHiddenCommand(buildCommandLine(m_ffmpegPath, {"-hide_banner", "-version"}), versionOutput);
    if (rc != 0) {
        m_lastError = "ffmpeg not usable at " + m_ffmpegPath + " (exit code " + std::to_string(rc) +
                      "); set AUTOSCRUB_FFMPEG_PATH";
        return false;
    }
    m_version = parseFFmpegVersion(versionOutput);
    if (m_version.empty()) {
        m_lastError = "Unrecognized ffmpeg -version output: " + tail(versionOutput, 200);
        return false;
    }
    log("ffmpeg version: " + m_version + " (" + m_ffmpegPath + ")");
    const int major = parseMajorVersion(m_version);
    if (major >= 0 && major < 6) {
        log("warning: ffmpeg " + m_version + " is older than 6; silencedetect/ebur128 output may differ");
    }

    TRACE_SCOPE("probe");
    MediaProbe probe;
    if (!probe.requireAudioVideo(m_inputFile)) {
        m_lastError = probe.getLastError();
        return false;
    }
    m_mediaInfo = probe.getInfo();

    std::ostringstream msg;
    msg << "input " << m_mediaInfo.formatName << " duration=" << m_mediaInfo.duration << "s video="
        << m_mediaInfo.videoCodec << " audio=" << m_mediaInfo.audioCodec << "@" << m_mediaInfo.sampleRate
        << "Hz";
    log(msg.str());
    return true;
}

std::vector<std::string> FFmpegAnalyzer::silenceDetectOptions(double thresholdDb, double minimumDuration) {
    return {
        "-af", "silencedetect=n=" + formatNumber(thresholdDb) + "dB:d=" + formatNumber(minimumDuration),
        "-f", "null",
        "-"
    };
}

std::vector<std::string> FFmpegAnalyzer::loudnessOptions() {
    return {
        "-c:v", "copy",
        "-af", "ebur128",
        "-f", "null",
        "-"
    };
}

bool FFmpegAnalyzer::exec(const std::vector<std::string>& options, std::string& output) {
    if (m_ffmpegPath.empty()) {
        m_ffmpegPath = resolveFFmpegPath();
    }

    std::vector<std::string> args = {"-hide_banner", "-nostats", "-i", m_inputFile};
    args.insert(args.end(), options.begin(), options.end());

    const std::string cmd = buildCommandLine(m_ffmpegPath, args);
    log("running: " + cmd);

    int exitCode = runHiddenCommand(cmd, output);
    if (exitCode != 0) {
        m_lastError = "ffmpeg exited with code " + std::to_string(exitCode) + ": " + tail(output);
        return false;
    }
    return true;
}

bool FFmpegAnalyzer::measureLoudness(double& integratedLufs) {
    m_lastError.clear();
    std::string output;
    if (!exec(loudnessOptions(), output)) {
        return false;
    }
    if (!parseIntegratedLoudness(output, integratedLufs)) {
        m_lastError = "No integrated loudness in ebur128 summary: " + tail(output);
        return false;
    }
    return true;
}

bool FFmpegAnalyzer::detectSilences(double thresholdDb,
                                    double minimumDuration,
                                    std::vector<SilenceInterval>& silences) {
    m_lastError.clear();
    std::string output;
    if (!exec(silenceDetectOptions(thresholdDb, minimumDuration), output)) {
        return false;
    }

    double totalDuration = 0.0;
    std::string error;
    if (!parseSilenceDetectOutput(output, silences, totalDuration, error)) {
        m_lastError = error;
        return false;
    }

    std::ostringstream msg;
    msg << "silencedetect reported " << silences.size() << " silences, " << totalDuration << "s in total";
    log(msg.str());
    return true;
}

} // namespace AutoScrub
