#pragma once

#include <string>
#include <vector>

namespace AutoScrub {

// Run a command through the shell and capture stdout+stderr.
// Returns the process exit code, or -1 if it could not be started;
// output is appended to 'output'.
int runHiddenCommand(const std::string& cmdLine, std::string& output);

// Quote one argument for the platform shell
std::string quoteArgument(const std::string& arg);

// Program followed by its quoted arguments, ready for runHiddenCommand
std::string buildCommandLine(const std::string& program, const std::vector<std::string>& args);

// First match of 'name' on PATH, or an empty string
std::string findExecutable(const std::string& name);

} // namespace AutoScrub
