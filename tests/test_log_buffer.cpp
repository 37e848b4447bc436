#include "asterism/core/LogBuffer.h"
#include "tests/test_harness.h"

#include <sstream>
#include <vector>

using namespace asterism;

int test_log_buffer() {
  int failures = 0;

  CHECK(core::LogBuffer{}.capacity() == 20000);

  core::LogBuffer buf(2);
  buf.push(core::LogLevel::Info, "t1", "a");
  buf.push(core::LogLevel::Warn, "t2", "b");
  CHECK(buf.size() == 2);
  CHECK(buf.dropped() == 0);

  // Full: the oldest line makes room.
  buf.push(core::LogLevel::Error, "t3", "c");
  CHECK(buf.size() == 2);
  CHECK(buf.dropped() == 1);

  const std::vector<core::LogEntry> all = buf.snapshot();
  CHECK(all.size() == 2);
  CHECK(all.size() == 2 && all[0].seq == 2 && all[0].message == "b");
  CHECK(all.size() == 2 && all[1].seq == 3 && all[1].message == "c");

  CHECK(buf.countAtLeast(core::LogLevel::Warn) == 2);
  CHECK(buf.countAtLeast(core::LogLevel::Error) == 1);

  std::ostringstream oss;
  buf.writeTo(oss);
  CHECK(oss.str() == "[t2][WARN ] b\n[t3][ERROR] c\n");

  // Growing keeps everything; shrinking keeps the newest.
  buf.setCapacity(4);
  buf.push(core::LogLevel::Info, "t4", "d");
  CHECK(buf.size() == 3);
  CHECK(buf.snapshot().front().message == "b");
  buf.setCapacity(1);
  CHECK(buf.size() == 1);
  CHECK(buf.snapshot().front().message == "d");
  CHECK(buf.dropped() == 3);

  buf.clear();
  CHECK(buf.size() == 0);
  CHECK(buf.dropped() == 0);
  CHECK(buf.snapshot().empty());

  // Attached as a sink it captures live log lines that pass the filter.
  {
    const core::LogLevel prev = core::getLogLevel();
    core::setLogLevel(core::LogLevel::Info);

    core::LogBuffer live;
    {
      core::ScopedLogSink capture(live.sink());
      ASTERISM_LOG_WARN("captured");
      ASTERISM_LOG_DEBUG("below level");
    }
    ASTERISM_LOG_WARN("after detach");

    const std::vector<core::LogEntry> got = live.snapshot();
    CHECK(got.size() == 1);
    CHECK(!got.empty() && got[0].message == "captured");
    CHECK(!got.empty() && got[0].level == core::LogLevel::Warn);
    CHECK(!got.empty() && got[0].timestamp.size() == 12);

    core::setLogLevel(prev);
  }

  return failures;
}
