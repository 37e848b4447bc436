#include "asterism/core/Random.h"
#include "tests/test_harness.h"

#include <array>
#include <cmath>
#include <vector>

using namespace asterism;

static bool same(double a, double b) { return std::abs(a - b) <= 1e-15; }

int test_prng() {
  int failures = 0;

  // Reference values of the string-seeded Mulberry32 stream.
  CHECK(core::Prng::hashSeed("") == 9u);
  CHECK(core::Prng::hashSeed("alpha") == 2714713212u);
  CHECK(core::Prng::hashSeed("haunting beauty") == 3566781172u);

  {
    core::Prng p("alpha");
    CHECK(p.initialSeed() == "alpha");
    CHECK(p.state() == 1759169304u);
    CHECK(same(p.next(), 0.7468682189937681));
    CHECK(same(p.next(), 0.23834065604023635));
    CHECK(same(p.next(), 0.22583178896456957));
  }

  // seedNew: "<signed state>:<suffix>", parent untouched.
  {
    core::Prng p("alpha");
    const core::u32 before = p.state();
    core::Prng child = p.seedNew("x");
    CHECK(p.state() == before);
    CHECK(child.initialSeed() == "1759169304:x");
    CHECK(same(child.next(), 0.4955341743770987));

    core::Prng again = p.seedNew("x");
    CHECK(same(again.next(), 0.4955341743770987));

    core::Prng other = p.seedNew("y");
    core::Prng child2 = p.seedNew("x");
    CHECK(other.next() != child2.next());
  }

  // Ranges.
  {
    core::Prng p("ranges");
    bool ok = true;
    bool sawMin = false;
    bool sawMax = false;
    for (int i = 0; i < 20000; ++i) {
      const double u = p.random();
      if (!(u >= 0.0 && u < 1.0)) ok = false;

      const double r = p.random(-3.0, 5.0);
      if (!(r >= -3.0 && r < 5.0)) ok = false;

      const core::i64 k = p.randomInt(2, 6);
      if (k < 2 || k > 6) ok = false;
      if (k == 2) sawMin = true;
      if (k == 6) sawMax = true;
    }
    CHECK(ok);
    CHECK(sawMin);
    CHECK(sawMax);
  }

  // choice(): nullptr and no draw on empty input.
  {
    core::Prng p("choice");
    const std::vector<int> empty;
    const core::u32 before = p.state();
    CHECK(p.choice(empty) == nullptr);
    CHECK(p.state() == before);

    const std::array<int, 3> items = {10, 20, 30};
    const int* pick = p.choice(items);
    CHECK(pick != nullptr);
    CHECK(*pick == 10 || *pick == 20 || *pick == 30);
  }

  // chooseWeighted() matches choice() over the expanded table.
  {
    const std::vector<core::Weighted<char>> table = {{'a', 3}, {'b', 1}, {'c', 2}};
    const std::vector<char> expanded = {'a', 'a', 'a', 'b', 'c', 'c'};

    core::Prng p1("weighted");
    core::Prng p2("weighted");
    bool match = true;
    for (int i = 0; i < 500; ++i) {
      const char* w = p1.chooseWeighted(table);
      const char* c = p2.choice(expanded);
      if (!w || !c || *w != *c) match = false;
    }
    CHECK(match);

    const std::vector<core::Weighted<char>> zero = {{'z', 0}};
    core::Prng p3("weighted");
    CHECK(p3.chooseWeighted(zero) == nullptr);
  }

  // Rough frequency check.
  {
    const std::vector<core::Weighted<int>> table = {{0, 8}, {1, 2}};
    core::Prng p("freq");
    int zeros = 0;
    const int n = 20000;
    for (int i = 0; i < n; ++i) {
      if (*p.chooseWeighted(table) == 0) ++zeros;
    }
    const double f = double(zeros) / double(n);
    CHECK(f > 0.77 && f < 0.83);
  }

  return failures;
}
