#pragma once

#include <string>

namespace acoustics::core {

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

// Log sink interface for custom log handlers.
// The category is the bracketed component prefix of the message ("[Baker] ..." -> "Baker"),
// or empty when the message has none.
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void log(LogLevel level, const std::string& category, const std::string& message) = 0;
};

void log(LogLevel level, const char* message);
void log(LogLevel level, const std::string& message);

void set_log_level(LogLevel level);
LogLevel get_log_level();

const char* to_string(LogLevel level);

// Register/unregister custom log sinks
void add_log_sink(ILogSink* sink);
void remove_log_sink(ILogSink* sink);

} // namespace acoustics::core
