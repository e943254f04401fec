#pragma once

#include <fstream>
#include <memory>
#include <mutex>
#include <string>

namespace AutoScrub {

// Thread-safe diagnostic log. Every message is appended to the log file
// (AUTOSCRUB_LOG_FILE, or autoscrub_debug.log in the temp directory) and
// echoed to stderr while verbose mode is on.
class DebugLogger {
public:
    // Get the singleton instance
    static DebugLogger& getInstance();

    // Log a message (thread-safe)
    void log(const std::string& msg);

    void setVerbose(bool verbose);
    bool isVerbose() const;

    // Path of the log file, empty if it could not be opened
    std::string getLogPath() const;

private:
    DebugLogger();
    ~DebugLogger();

    // Prevent copying
    DebugLogger(const DebugLogger&) = delete;
    DebugLogger& operator=(const DebugLogger&) = delete;

    mutable std::mutex mutex_;
    std::unique_ptr<std::ofstream> logFile_;
    std::string logPath_;
    bool verbose_;
};

} // namespace AutoScrub
