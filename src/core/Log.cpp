#include "asterism/core/Log.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>
#include <utility>
#include <vector>

namespace asterism::core {
namespace {

struct LogState {
  std::atomic<LogLevel> level{LogLevel::Info};
  std::atomic<bool> toStderr{true};
  std::mutex mutex;
  std::vector<LogSink> sinks;
};

LogState& state() {
  static LogState s;
  return s;
}

// Local wall-clock time as HH:MM:SS.mmm.
std::string wallClock() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t secs = std::chrono::system_clock::to_time_t(now);
  const auto millis =
    std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

  std::tm local{};
#if defined(_WIN32)
  localtime_s(&local, &secs);
#else
  localtime_r(&secs, &local);
#endif

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d.%03d",
                local.tm_hour, local.tm_min, local.tm_sec, static_cast<int>(millis));
  return buf;
}

} // namespace

void setLogLevel(LogLevel level) { state().level.store(level, std::memory_order_relaxed); }

LogLevel getLogLevel() { return state().level.load(std::memory_order_relaxed); }

bool logEnabled(LogLevel level) {
  const LogLevel threshold = getLogLevel();
  if (level == LogLevel::Off || threshold == LogLevel::Off) return false;
  return static_cast<int>(level) >= static_cast<int>(threshold);
}

std::string_view toString(LogLevel level) {
  static constexpr std::array<std::string_view, 6> kTags = {"TRACE", "DEBUG", "INFO ", "WARN ", "ERROR", "OFF  "};
  const auto i = static_cast<std::size_t>(level);
  return i < kTags.size() ? kTags[i] : std::string_view("?????");
}

bool parseLogLevel(std::string_view text, LogLevel& out) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);

  static constexpr std::array<std::pair<std::string_view, LogLevel>, 6> kNames = {{
    {"trace", LogLevel::Trace}, {"debug", LogLevel::Debug}, {"info", LogLevel::Info},
    {"warn", LogLevel::Warn},   {"error", LogLevel::Error}, {"off", LogLevel::Off},
  }};
  for (const auto& [name, level] : kNames) {
    if (name.size() != text.size()) continue;
    const bool same = std::equal(name.begin(), name.end(), text.begin(), [](char a, char b) {
      return a == std::tolower(static_cast<unsigned char>(b));
    });
    if (same) {
      out = level;
      return true;
    }
  }
  return false;
}

std::string formatLogLine(LogLevel level, std::string_view timestamp, std::string_view message) {
  std::string line;
  line.reserve(timestamp.size() + message.size() + 10);
  line += '[';
  line += timestamp;
  line += "][";
  line += toString(level);
  line += "] ";
  line += message;
  return line;
}

void setLogToStderr(bool enabled) { state().toStderr.store(enabled, std::memory_order_relaxed); }

void addLogSink(LogSink sink) {
  if (!sink.fn) return;
  LogState& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  s.sinks.push_back(sink);
}

void removeLogSink(LogSink sink) {
  LogState& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  auto& v = s.sinks;
  v.erase(std::remove_if(v.begin(), v.end(),
                         [&](const LogSink& x) { return x.fn == sink.fn && x.user == sink.user; }),
          v.end());
}

void log(LogLevel level, std::string_view message) {
  if (!logEnabled(level)) return;

  LogState& s = state();
  const std::string stamp = wallClock();

  std::vector<LogSink> targets;
  {
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.toStderr.load(std::memory_order_relaxed)) {
      std::cerr << formatLogLine(level, stamp, message) << '\n';
    }
    targets = s.sinks;
  }

  // Unlocked, so a sink may itself log.
  for (const LogSink& sink : targets) sink.fn(level, stamp, message, sink.user);
}

} // namespace asterism::core
