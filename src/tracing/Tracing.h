#pragma once

#include <chrono>
#include <map>
#include <string>

namespace AutoScrub {
namespace tracing {

// Open (or switch to) the trace file. An empty path picks
// autoscrub-trace.log in the temp directory.
void InitTracing(const std::string& outfile);

// Flush and close the trace file; spans become no-ops afterwards
void ShutdownTracing();

bool IsTracingEnabled();

// Writes a START record on construction and an END record with the elapsed
// time on End() or destruction, whichever comes first.
class Span {
public:
    explicit Span(const char* name);
    ~Span();

    Span(const Span&) = delete;
    Span& operator=(const Span&) = delete;

    // Attributes are written on the END record as key=value
    void addAttribute(const std::string& key, const std::string& value);
    void End();

private:
    std::string m_name;
    std::chrono::steady_clock::time_point m_start;
    std::map<std::string, std::string> m_attrs;
    bool m_ended = false;
};

} // namespace tracing
} // namespace AutoScrub

#define AUTOSCRUB_TRACE_CONCAT_INNER(a, b) a##b
#define AUTOSCRUB_TRACE_CONCAT(a, b) AUTOSCRUB_TRACE_CONCAT_INNER(a, b)
#define TRACE_SCOPE(name) \
    ::AutoScrub::tracing::Span AUTOSCRUB_TRACE_CONCAT(trace_span_, __LINE__)(name)
