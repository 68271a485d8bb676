#include <acoustics/core/log.hpp>
#include <algorithm>
#include <atomic>
#include <cstdio>
#include <mutex>
#include <vector>

namespace acoustics::core {

static std::atomic<LogLevel> s_log_level{LogLevel::Info};
static std::vector<ILogSink*> s_log_sinks;
static std::mutex s_sink_mutex;

// "[Category] text" -> "Category"
static std::string extract_category(const std::string& message) {
    if (message.size() < 3 || message.front() != '[') return {};
    auto close = message.find(']');
    if (close == std::string::npos || close == 1) return {};
    return message.substr(1, close - 1);
}

void log(LogLevel level, const char* message) {
    log(level, std::string(message ? message : ""));
}

void log(LogLevel level, const std::string& message) {
    if (level < s_log_level.load(std::memory_order_relaxed)) return;

    std::FILE* stream = level >= LogLevel::Warn ? stderr : stdout;
    std::fprintf(stream, "[%s] %s\n", to_string(level), message.c_str());

    std::string category = extract_category(message);

    std::lock_guard<std::mutex> lock(s_sink_mutex);
    for (auto* sink : s_log_sinks) {
        sink->log(level, category, message);
    }
}

void set_log_level(LogLevel level) {
    s_log_level.store(level, std::memory_order_relaxed);
}

LogLevel get_log_level() {
    return s_log_level.load(std::memory_order_relaxed);
}

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Fatal: return "fatal";
    }
    return "unknown";
}

void add_log_sink(ILogSink* sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(s_sink_mutex);
    if (std::find(s_log_sinks.begin(), s_log_sinks.end(), sink) == s_log_sinks.end()) {
        s_log_sinks.push_back(sink);
    }
}

void remove_log_sink(ILogSink* sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(s_sink_mutex);
    s_log_sinks.erase(
        std::remove(s_log_sinks.begin(), s_log_sinks.end(), sink),
        s_log_sinks.end()
    );
}

} // namespace acoustics::core
