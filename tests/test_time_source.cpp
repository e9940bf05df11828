#include "time_source.hpp"
#include <cassert>
#include <chrono>

using namespace std::chrono_literals;

int main() {
  SystemTimeSource t;

  auto start = t.monotonic();
  auto deadline = start + 30ms;
  t.sleep_until(deadline);
  assert(t.monotonic() >= deadline);

  // a deadline already behind returns at once
  auto before = t.monotonic();
  t.sleep_until(before - 1s);
  assert(t.monotonic() - before < 50ms);

  before = t.monotonic();
  t.sleep_for(10ms);
  assert(t.monotonic() - before >= 10ms);

  auto wall = t.now();
  t.sleep_for(5ms);
  assert(t.now() >= wall);
  return 0;
}
