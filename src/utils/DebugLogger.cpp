#include "DebugLogger.h"

#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace AutoScrub {

DebugLogger& DebugLogger::getInstance() {
    static DebugLogger instance;
    return instance;
}

DebugLogger::DebugLogger() : verbose_(false) {
    std::filesystem::path logPath;
    const char* envPath = std::getenv("AUTOSCRUB_LOG_FILE");
    if (envPath != nullptr && envPath[0] != '\0') {
        logPath = envPath;
    } else {
        std::error_code ec;
        std::filesystem::path tempDir = std::filesystem::temp_directory_path(ec);
        logPath = (ec ? std::filesystem::path(".") : tempDir) / "autoscrub_debug.log";
    }

    logFile_ = std::make_unique<std::ofstream>(logPath.string(), std::ios::out | std::ios::app);
    if (logFile_->is_open()) {
        logPath_ = logPath.string();
        *logFile_ << "[AutoScrub] Debug log started at " << logPath_ << std::endl;
    } else {
        logFile_.reset();
    }
}

DebugLogger::~DebugLogger() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logFile_) {
        logFile_->close();
        logFile_.reset();
    }
}

void DebugLogger::log(const std::string& msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (verbose_) {
        std::cerr << msg << std::endl;
    }
    if (logFile_ && logFile_->is_open()) {
        *logFile_ << msg << std::endl;
    }
}

void DebugLogger::setVerbose(bool verbose) {
    std::lock_guard<std::mutex> lock(mutex_);
    verbose_ = verbose;
}

bool DebugLogger::isVerbose() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return verbose_;
}

std::string DebugLogger::getLogPath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return logPath_;
}

} // namespace AutoScrub
