#include "FFmpegOutputParser.h"

#include <cctype>
#include <cstdlib>
#include <sstream>

namespace AutoScrub {

namespace {

// Number following 'label' on the line; false if the label or number is missing
bool readNumberAfter(const std::string& line, const std::string& label, double& value) {
    size_t pos = line.find(label);
    if (pos == std::string::npos) {
        return false;
    }
    const char* begin = line.c_str() + pos + label.size();
    char* end = nullptr;
    value = std::strtod(begin, &end);
    return end != begin;
}

} // namespace

bool parseSilenceDetectOutput(const std::string& output,
                              std::vector<SilenceInterval>& silences,
                              double& totalDuration,
                              std::string& error) {
    silences.clear();
    totalDuration = 0.0;

    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        if (line.find("[silencedetect") == std::string::npos) {
            continue;
        }

        if (line.find("silence_start:") != std::string::npos) {
            SilenceInterval silence;
            if (!readNumberAfter(line, "silence_start:", silence.start)) {
                error = "Unreadable silence_start: " + line;
                return false;
            }
            if (!silences.empty() && silences.back().isOpenEnded()) {
                error = "silence_start before the previous silence ended: " + line;
                return false;
            }
            silences.push_back(silence);
            continue;
        }

        if (line.find("silence_end:") != std::string::npos) {
            double end = 0.0;
            if (!readNumberAfter(line, "silence_end:", end)) {
                error = "Unreadable silence_end: " + line;
                return false;
            }
            if (silences.empty() || !silences.back().isOpenEnded()) {
                error = "silence_end without silence_start: " + line;
                return false;
            }
            silences.back().end = end;

            double duration = 0.0;
            if (readNumberAfter(line, "silence_duration:", duration)) {
                totalDuration += duration;
            }
        }
    }
    return true;
}

bool parseIntegratedLoudness(const std::string& output, double& lufs) {
    const size_t header = output.rfind("Integrated loudness:");
    if (header == std::string::npos) {
        return false;
    }

    std::istringstream in(output.substr(header));
    std::string line;
    std::getline(in, line);  // header itself
    while (std::getline(in, line)) {
        if (line.find("I:") != std::string::npos) {
            return readNumberAfter(line, "I:", lufs);
        }
    }
    return false;
}

std::string parseFFmpegVersion(const std::string& versionOutput) {
    std::istringstream in(versionOutput);
    std::string firstLine;
    std::getline(in, firstLine);

    // "ffmpeg version n7.1.3-14-ga... Copyright (c) ..."
    std::istringstream fields(firstLine);
    std::string program, word, version;
    fields >> program >> word >> version;
    if (program != "ffmpeg" || word != "version") {
        return "";
    }
    return version;
}

int parseMajorVersion(const std::string& version) {
    size_t pos = 0;
    while (pos < version.size() && !std::isdigit(static_cast<unsigned char>(version[pos]))) {
        ++pos;
    }
    if (pos == version.size()) {
        return -1;
    }
    return std::atoi(version.c_str() + pos);
}

} // namespace AutoScrub
