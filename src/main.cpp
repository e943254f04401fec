#include "core/Errors.h"
#include "ffmpeg/FFmpegAnalyzer.h"
#include "scrub/ScrubConfig.h"
#include "scrub/Scrubber.h"
#include "tracing/Tracing.h"
#include "utils/DebugLogger.h"
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;
using namespace AutoScrub;

static const char* const kVersion = "1.0.0";

void printUsage(const char* programName) {
    std::cout << "AutoScrub - fast-forward silences and normalize loudness\n";
    std::cout << "Version " << kVersion << "\n\n";
    std::cout << "Writes an ffmpeg -filter_complex script next to the input file.\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << programName << " [options] <input_media>\n\n";
    std::cout << "Options:\n";
    std::cout << "  -d, --delay <seconds>             Normal-speed margin at each silence edge (default: 0.25)\n";
    std::cout << "  -s, --silence-duration <seconds>  Shortest silence to speed up (default: 2.0)\n";
    std::cout << "  -x, --speed <factor>              Playback speed of silences (default: 8)\n";
    std::cout << "  -t, --target-threshold <dB>       Silence level relative to target loudness (default: -18)\n";
    std::cout << "  -l, --target-lufs <dB>            Integrated loudness to normalize to (default: -18)\n";
    std::cout << "      --no-normalize                Skip loudness measurement and the volume stage\n";
    std::cout << "  -o, --output <file>               Output path (default: <input_dir>/<name>.filter-graph)\n";
    std::cout << "      --trace <file>                Write timing spans to a trace file\n";
    std::cout << "  -v, --verbose                     Echo diagnostics to stderr\n";
    std::cout << "  -h, --help                        Show this help message\n";
    std::cout << "      --version                     Show version\n\n";
    std::cout << "Environment:\n";
    std::cout << "  AUTOSCRUB_FFMPEG_PATH   ffmpeg executable to use\n";
    std::cout << "  AUTOSCRUB_LOG_FILE      diagnostic log file\n";
    std::cout << "  AUTOSCRUB_TRACE_FILE    trace file (same as --trace)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << programName << " lecture.mkv\n";
    std::cout << "  " << programName << " -d 0 -s 0.5 -l -14 lecture.mkv\n";
    std::cout << "  ffmpeg -i lecture.mkv -filter_complex_script lecture.filter-graph -map \"[v]\" -map \"[a]\" out.mkv\n";
}

static double parseNumber(const char* option, const char* text) {
    std::string value = text ? text : "";
    size_t consumed = 0;
    double result = 0.0;
    try {
        result = std::stod(value, &consumed);
    } catch (const std::exception&) {
        throw ConfigurationError(std::string(option) + ": invalid number '" + value + "'");
    }
    if (consumed != value.size()) {
        throw ConfigurationError(std::string(option) + ": invalid number '" + value + "'");
    }
    return result;
}

static bool isOption(const char* arg, const char* shortName, const char* longName) {
    return (shortName && std::strcmp(arg, shortName) == 0) || std::strcmp(arg, longName) == 0;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    ScrubConfig config;
    std::string inputFile;
    std::string outputFile;
    std::string traceFile;
    if (const char* envTrace = std::getenv("AUTOSCRUB_TRACE_FILE")) {
        traceFile = envTrace;
    }

    try {
        for (int i = 1; i < argc; ++i) {
            const char* arg = argv[i];
            auto requireValue = [&]() -> const char* {
                if (i + 1 >= argc) {
                    throw ConfigurationError(std::string(arg) + " requires a value");
                }
                return argv[++i];
            };

            if (isOption(arg, "-h", "--help")) {
                printUsage(argv[0]);
                return 0;
            } else if (isOption(arg, nullptr, "--version")) {
                std::cout << "autoscrub " << kVersion << "\n";
                return 0;
            } else if (isOption(arg, "-d", "--delay")) {
                config.margin = parseNumber(arg, requireValue());
            } else if (isOption(arg, "-s", "--silence-duration")) {
                config.minimumSilenceDuration = parseNumber(arg, requireValue());
            } else if (isOption(arg, "-x", "--speed")) {
                config.speedupFactor = parseNumber(arg, requireValue());
            } else if (isOption(arg, "-t", "--target-threshold")) {
                config.silenceThresholdDb = parseNumber(arg, requireValue());
            } else if (isOption(arg, "-l", "--target-lufs")) {
                config.targetLoudnessDb = parseNumber(arg, requireValue());
            } else if (isOption(arg, nullptr, "--no-normalize")) {
                config.normalizeLoudness = false;
            } else if (isOption(arg, "-o", "--output")) {
                outputFile = requireValue();
            } else if (isOption(arg, nullptr, "--trace")) {
                traceFile = requireValue();
            } else if (isOption(arg, "-v", "--verbose")) {
                DebugLogger::getInstance().setVerbose(true);
            } else if (arg[0] == '-' && arg[1] != '\0') {
                throw ConfigurationError(std::string("Unknown option: ") + arg);
            } else if (inputFile.empty()) {
                inputFile = arg;
            } else {
                throw ConfigurationError("Only one input file is supported");
            }
        }

        if (inputFile.empty()) {
            throw ConfigurationError("Missing input media file");
        }
        config.validate();
    } catch (const ConfigurationError& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        printUsage(argv[0]);
        return 1;
    }

    if (!traceFile.empty()) {
        tracing::InitTracing(traceFile);
    }

    DebugLogger& logger = DebugLogger::getInstance();
    if (logger.isVerbose()) {
        const std::string logPath = logger.getLogPath();
        std::cerr << "debug log: " << (logPath.empty() ? "(unavailable)" : logPath) << "\n";
    }

    std::cout << "processing file: " << fs::path(inputFile).filename().string() << "\n";
    logger.log("[AutoScrub] config: " + config.toString());

    FFmpegAnalyzer analyzer(inputFile);
    if (!analyzer.open()) {
        std::cerr << "Error: " << analyzer.getLastError() << "\n";
        tracing::ShutdownTracing();
        return 1;
    }

    Scrubber scrubber(config, analyzer);
    if (!scrubber.analyze()) {
        std::cerr << "Error: " << scrubber.getLastError() << "\n";
        tracing::ShutdownTracing();
        return 1;
    }

    if (outputFile.empty()) {
        outputFile = Scrubber::defaultOutputPath(inputFile);
    }
    if (!scrubber.writeFilterGraph(outputFile)) {
        std::cerr << "Error: " << scrubber.getLastError() << "\n";
        tracing::ShutdownTracing();
        return 1;
    }

    std::cout << "wrote " << fs::path(outputFile).filename().string() << "\n";
    std::cout << "  ffmpeg -i \"" << inputFile << "\" -filter_complex_script \"" << outputFile
              << "\" -map \"[v]\" -map \"[a]\" <output>\n";

    tracing::ShutdownTracing();
    return 0;
}
