#include "ProcessUtils.h"

#include <cstdio>
#include <cstdlib>

#ifdef _WIN32
#define popen_compat _popen
#define pclose_compat _pclose
#else
#include <sys/wait.h>
#define popen_compat popen
#define pclose_compat pclose
#endif

namespace AutoScrub {

int runHiddenCommand(const std::string& cmdLine, std::string& output) {
    if (cmdLine.empty()) {
        output += "Error: empty command line";
        return -1;
    }

    std::string fullCmd = cmdLine + " 2>&1";
    FILE* pipe = popen_compat(fullCmd.c_str(), "r");
    if (!pipe) {
        output += "Error: could not start: " + cmdLine.substr(0, 200);
        return -1;
    }

    char buffer[4096];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        output += buffer;
    }

    int status = pclose_compat(pipe);
#ifdef _WIN32
    return status;
#else
    if (status == -1) {
        return -1;
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    // Killed by a signal
    return 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
#endif
}

std::string quoteArgument(const std::string& arg) {
#ifdef _WIN32
    std::string out = "\"";
    for (char c : arg) {
        if (c == '"') out += '\\';
        out += c;
    }
    out += "\"";
    return out;
#else
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
#endif
}

std::string buildCommandLine(const std::string& program, const std::vector<std::string>& args) {
    std::string cmd = quoteArgument(program);
    for (const auto& arg : args) {
        cmd += " ";
        cmd += quoteArgument(arg);
    }
    return cmd;
}

std::string findExecutable(const std::string& name) {
    std::string result;
#ifdef _WIN32
    int rc = runHiddenCommand("where " + name, result);
#else
    int rc = runHiddenCommand("command -v " + quoteArgument(name), result);
#endif
    if (rc != 0 || result.empty()) {
        return "";
    }

    // First line is the first match
    size_t newline = result.find('\n');
    if (newline != std::string::npos) {
        result = result.substr(0, newline);
    }
    while (!result.empty() && (result.back() == '\r' || result.back() == ' ')) {
        result.pop_back();
    }
    return result;
}

} // namespace AutoScrub
