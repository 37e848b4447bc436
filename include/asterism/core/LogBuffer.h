#pragma once

#include "asterism/core/Log.h"

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace asterism::core {

struct LogEntry {
  std::uint64_t seq{0};
  LogLevel level{LogLevel::Info};
  std::string timestamp;
  std::string message;
};

// In-memory history of the most recent log lines, oldest dropped first.
// Register sink() (ScopedLogSink is convenient) and unregister it before the
// buffer goes away. All members are thread-safe.
class LogBuffer {
public:
  static constexpr std::size_t kDefaultCapacity = 20000;

  explicit LogBuffer(std::size_t capacity = kDefaultCapacity);

  std::size_t capacity() const;
  // Keeps the newest entries that still fit. 0 is treated as 1.
  void setCapacity(std::size_t capacity);

  std::size_t size() const;
  void clear();

  // Entries pushed out by newer ones since construction or clear().
  std::uint64_t dropped() const;

  void push(LogLevel level, std::string_view timestamp, std::string_view message);

  std::vector<LogEntry> snapshot() const;
  std::size_t countAtLeast(LogLevel level) const;

  // formatLogLine() per entry, one per line.
  void writeTo(std::ostream& out) const;

  LogSink sink() { return LogSink{&LogBuffer::receive, this}; }

private:
  static void receive(LogLevel level, std::string_view timestamp, std::string_view message, void* user);

  // Index of the i-th oldest entry in ring_.
  std::size_t slot(std::size_t i) const { return (head_ + i) % ring_.size(); }

  mutable std::mutex mutex_;
  std::vector<LogEntry> ring_;
  std::size_t head_{0};
  std::size_t count_{0};
  std::uint64_t nextSeq_{1};
  std::uint64_t dropped_{0};
};

} // namespace asterism::core
