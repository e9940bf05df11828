#include "time_source.hpp"
#include <ctime>

void SystemTimeSource::sleep_until(MonoPoint deadline) {
  if (deadline <= std::chrono::steady_clock::now()) return;
  // steady_clock is CLOCK_MONOTONIC, so the deadline is usable as an absolute timeout
  auto since_epoch = deadline.time_since_epoch();
  auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - secs);
  struct timespec ts{};
  ts.tv_sec = static_cast<time_t>(secs.count());
  ts.tv_nsec = static_cast<long>(nanos.count());
  // EINTR returns early; the caller checks the interrupt flag next
  (void)::clock_nanosleep(CLOCK_MONOTONIC, TIMER_ABSTIME, &ts, nullptr);
}
