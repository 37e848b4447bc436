#include "asterism/core/LogBuffer.h"

#include <algorithm>
#include <ostream>
#include <utility>

namespace asterism::core {

LogBuffer::LogBuffer(std::size_t capacity)
: ring_(std::max<std::size_t>(capacity, 1)) {}

std::size_t LogBuffer::capacity() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ring_.size();
}

void LogBuffer::setCapacity(std::size_t capacity) {
  capacity = std::max<std::size_t>(capacity, 1);

  std::lock_guard<std::mutex> lock(mutex_);
  if (capacity == ring_.size()) return;

  const std::size_t keep = std::min(count_, capacity);
  std::vector<LogEntry> next(capacity);
  for (std::size_t i = 0; i < keep; ++i) {
    next[i] = std::move(ring_[slot(count_ - keep + i)]);
  }
  dropped_ += count_ - keep;

  ring_ = std::move(next);
  head_ = 0;
  count_ = keep;
}

std::size_t LogBuffer::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return count_;
}

void LogBuffer::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& e : ring_) e = LogEntry{};
  head_ = 0;
  count_ = 0;
  dropped_ = 0;
}

std::uint64_t LogBuffer::dropped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

void LogBuffer::push(LogLevel level, std::string_view timestamp, std::string_view message) {
  std::lock_guard<std::mutex> lock(mutex_);

  LogEntry* e = nullptr;
  if (count_ < ring_.size()) {
    e = &ring_[slot(count_)];
    ++count_;
  } else {
    e = &ring_[head_];
    head_ = (head_ + 1) % ring_.size();
    ++dropped_;
  }

  e->seq = nextSeq_++;
  e->level = level;
  e->timestamp.assign(timestamp);
  e->message.assign(message);
}

std::vector<LogEntry> LogBuffer::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<LogEntry> out;
  out.reserve(count_);
  for (std::size_t i = 0; i < count_; ++i) out.push_back(ring_[slot(i)]);
  return out;
}

std::size_t LogBuffer::countAtLeast(LogLevel level) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t n = 0;
  for (std::size_t i = 0; i < count_; ++i) {
    if (static_cast<int>(ring_[slot(i)].level) >= static_cast<int>(level)) ++n;
  }
  return n;
}

void LogBuffer::writeTo(std::ostream& out) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (std::size_t i = 0; i < count_; ++i) {
    const LogEntry& e = ring_[slot(i)];
    out << formatLogLine(e.level, e.timestamp, e.message) << '\n';
  }
}

void LogBuffer::receive(LogLevel level, std::string_view timestamp, std::string_view message, void* user) {
  if (auto* buffer = static_cast<LogBuffer*>(user)) buffer->push(level, timestamp, message);
}

} // namespace asterism::core
