#include "clock_engine.hpp"
#include "time_format.hpp"

TickResult ClockEngine::tick(std::optional<char>, Timestamp now) {
  last_ = now;
  TickResult r;
  r.text = format_wall_clock(now);
  return r;
}

std::string ClockEngine::label() const { return format_date(last_); }
