#pragma once

#include <string>
#include <string_view>

namespace asterism::core {

enum class LogLevel {
  Trace = 0,
  Debug = 1,
  Info  = 2,
  Warn  = 3,
  Error = 4,
  Off   = 5
};

// Process-wide threshold (default Info). Off silences everything.
void setLogLevel(LogLevel level);
LogLevel getLogLevel();

// Check before building an expensive message on a hot path.
bool logEnabled(LogLevel level);

// Five-character tag: "TRACE", "INFO ", "WARN ", ...
std::string_view toString(LogLevel level);

// "trace|debug|info|warn|error|off", case and surrounding blanks ignored.
bool parseLogLevel(std::string_view text, LogLevel& out);

// "[timestamp][LEVEL] message", no trailing newline.
std::string formatLogLine(LogLevel level, std::string_view timestamp, std::string_view message);

// Lines are echoed to stderr unless this is switched off; sinks are unaffected.
void setLogToStderr(bool enabled);

// Receives every message that passes the level filter. Views die with the call.
struct LogSink {
  using Fn = void (*)(LogLevel level, std::string_view timestamp, std::string_view message, void* user);
  Fn fn{nullptr};
  void* user{nullptr};
};

// A sink registered twice is called twice.
void addLogSink(LogSink sink);
void removeLogSink(LogSink sink);

// Keeps a sink registered for its own lifetime.
class ScopedLogSink {
public:
  explicit ScopedLogSink(LogSink sink) : sink_(sink) { addLogSink(sink_); }
  ~ScopedLogSink() { removeLogSink(sink_); }

  ScopedLogSink(const ScopedLogSink&) = delete;
  ScopedLogSink& operator=(const ScopedLogSink&) = delete;

private:
  LogSink sink_;
};

void log(LogLevel level, std::string_view message);

} // namespace asterism::core

#define ASTERISM_LOG_TRACE(msg) ::asterism::core::log(::asterism::core::LogLevel::Trace, (msg))
#define ASTERISM_LOG_DEBUG(msg) ::asterism::core::log(::asterism::core::LogLevel::Debug, (msg))
#define ASTERISM_LOG_INFO(msg)  ::asterism::core::log(::asterism::core::LogLevel::Info,  (msg))
#define ASTERISM_LOG_WARN(msg)  ::asterism::core::log(::asterism::core::LogLevel::Warn,  (msg))
#define ASTERISM_LOG_ERROR(msg) ::asterism::core::log(::asterism::core::LogLevel::Error, (msg))
