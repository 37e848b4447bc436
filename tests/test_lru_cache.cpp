#include "asterism/core/LruCache.h"
#include "tests/test_harness.h"

#include <string>

using namespace asterism;

int test_lru_cache() {
  int failures = 0;

  core::LruCache<int, std::string> c(2);
  c.put(1, "one");
  c.put(2, "two");
  CHECK(c.size() == 2);

  // Touch 1 so 2 becomes the eviction candidate.
  CHECK(c.get(1) != nullptr);
  c.put(3, "three");
  CHECK(c.size() == 2);
  CHECK(c.contains(1));
  CHECK(!c.contains(2));
  CHECK(c.contains(3));

  // peek() does not refresh recency.
  CHECK(c.peek(1) != nullptr);
  CHECK(c.get(3) != nullptr);
  c.put(4, "four");
  CHECK(!c.contains(1));
  CHECK(c.contains(3));

  // Overwrite keeps size.
  c.put(3, "THREE");
  CHECK(c.size() == 2);
  CHECK(*c.get(3) == "THREE");

  const auto st = c.stats();
  CHECK(st.capacity == 2);
  CHECK(st.evictions == 2);
  CHECK(st.puts == 5);
  CHECK(st.hits == 3);
  CHECK(st.misses == 0);

  CHECK(c.get(99) == nullptr);
  CHECK(c.stats().misses == 1);

  c.setCapacity(1);
  CHECK(c.size() == 1);

  c.setCapacity(0);
  CHECK(c.capacity() == 1);

  c.clear();
  CHECK(c.empty());

  c.resetStats();
  CHECK(c.stats().hits == 0);
  CHECK(c.stats().puts == 0);
  CHECK(c.stats().capacity == 1);

  return failures;
}
