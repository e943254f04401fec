#include "tracing/Tracing.h"

#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <thread>

namespace AutoScrub {
namespace tracing {

namespace {

struct TraceSink {
    std::mutex mutex;
    std::unique_ptr<std::ofstream> stream;
    std::string path;
};

TraceSink& sink() {
    static TraceSink instance;
    return instance;
}

std::string wallClock() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t seconds = system_clock::to_time_t(now);
    const auto millis = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::tm local{};
#if defined(_WIN32)
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif
    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
        << millis.count();
    return out.str();
}

std::filesystem::path defaultTracePath() {
    std::error_code ec;
    std::filesystem::path dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        dir = ".";
    }
    return dir / "autoscrub-trace.log";
}

// Caller holds the sink mutex
void writeRecord(TraceSink& s, const char* kind, const std::string& name, const std::string& tail) {
    if (!s.stream) return;
    (*s.stream) << wallClock() << ' ' << kind << ' ' << name << " thread=" << std::this_thread::get_id()
                << tail << '\n';
}

} // namespace

void InitTracing(const std::string& outfile) {
    TraceSink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);

    const std::string target = outfile.empty() ? defaultTracePath().string() : outfile;
    if (s.stream && s.path == target) {
        return;
    }
    s.stream.reset();
    s.path.clear();

    auto stream = std::make_unique<std::ofstream>(target, std::ios::app);
    if (!stream->is_open()) {
        std::cerr << "Warning: could not open trace file: " << target << "\n";
        return;
    }
    s.stream = std::move(stream);
    s.path = target;
}

void ShutdownTracing() {
    TraceSink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.stream) {
        s.stream->flush();
    }
    s.stream.reset();
    s.path.clear();
}

bool IsTracingEnabled() {
    TraceSink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.stream != nullptr;
}

Span::Span(const char* name)
    : m_name(name ? name : "")
    , m_start(std::chrono::steady_clock::now())
{
    TraceSink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    writeRecord(s, "START", m_name, "");
}

Span::~Span() {
    End();
}

void Span::addAttribute(const std::string& key, const std::string& value) {
    m_attrs[key] = value;
}

void Span::End() {
    if (m_ended) return;
    m_ended = true;

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - m_start);
    std::ostringstream tail;
    tail << " duration=" << elapsed.count() << "ms";
    for (const auto& attr : m_attrs) {
        tail << ' ' << attr.first << '=' << attr.second;
    }

    TraceSink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    writeRecord(s, "END  ", m_name, tail.str());
}

} // namespace tracing
} // namespace AutoScrub
