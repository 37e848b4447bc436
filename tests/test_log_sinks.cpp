#include "asterism/core/Log.h"
#include "tests/test_harness.h"

#include <atomic>
#include <string>

using namespace asterism;

static void countingSink(core::LogLevel /*level*/, std::string_view /*ts*/, std::string_view /*msg*/, void* user) {
  auto* count = static_cast<std::atomic<int>*>(user);
  if (count) count->fetch_add(1, std::memory_order_relaxed);
}

int test_log_sinks() {
  int failures = 0;

  const core::LogLevel prev = core::getLogLevel();
  core::setLogLevel(core::LogLevel::Trace);

  std::atomic<int> count{0};
  const core::LogSink sink{&countingSink, &count};

  core::addLogSink(sink);
  ASTERISM_LOG_DEBUG("hello");
  CHECK(count.load() == 1);

  core::removeLogSink(sink);
  ASTERISM_LOG_INFO("world");
  CHECK(count.load() == 1);

  // Sinks obey the level filter.
  core::addLogSink(sink);
  core::setLogLevel(core::LogLevel::Warn);
  ASTERISM_LOG_INFO("filtered");
  CHECK(count.load() == 1);
  ASTERISM_LOG_WARN("passes");
  CHECK(count.load() == 2);

  core::setLogLevel(core::LogLevel::Off);
  ASTERISM_LOG_ERROR("off");
  CHECK(count.load() == 2);
  CHECK(!core::logEnabled(core::LogLevel::Error));

  core::removeLogSink(sink);

  // Muting stderr leaves sinks alone.
  core::setLogLevel(core::LogLevel::Info);
  core::setLogToStderr(false);
  {
    core::ScopedLogSink scoped(sink);
    ASTERISM_LOG_INFO("quiet");
  }
  core::setLogToStderr(true);
  CHECK(count.load() == 3);

  CHECK(core::formatLogLine(core::LogLevel::Info, "12:00:00.000", "hi") == "[12:00:00.000][INFO ] hi");
  CHECK(core::toString(core::LogLevel::Error) == "ERROR");

  core::LogLevel parsed = core::LogLevel::Info;
  CHECK(core::parseLogLevel(" DEBUG ", parsed));
  CHECK(parsed == core::LogLevel::Debug);
  CHECK(!core::parseLogLevel("verbose", parsed));
  CHECK(parsed == core::LogLevel::Debug);

  core::setLogLevel(prev);
  return failures;
}
