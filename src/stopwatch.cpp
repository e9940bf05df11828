#include "stopwatch.hpp"
#include "time_format.hpp"
#include <spdlog/spdlog.h>

Stopwatch::Stopwatch(Timestamp start) : reference_start_(start) {}

void Stopwatch::toggle_pause(Timestamp now) {
  paused_ = !paused_;
  if (paused_) {
    pause_anchor_ = now;
  } else {
    if (pause_anchor_) reference_start_ += now - *pause_anchor_;
    pause_anchor_.reset();
  }
  spdlog::debug("stopwatch {} at {}s", paused_ ? "paused" : "resumed", elapsed_);
}

void Stopwatch::reset(Timestamp now) {
  reference_start_ = now;
  pause_anchor_.reset();
  paused_ = false;
  elapsed_ = 0;
  spdlog::debug("stopwatch reset");
}

TickResult Stopwatch::tick(std::optional<char> key, Timestamp now) {
  if (key == kKeyPause) toggle_pause(now);
  else if (key == kKeyReset) reset(now);
  if (!paused_) {
    auto secs = std::chrono::floor<std::chrono::seconds>(now - reference_start_).count();
    elapsed_ = secs > 0 ? static_cast<int>(secs) : 0;
  }
  TickResult r;
  r.text = format_duration(elapsed_);
  return r;
}

std::string Stopwatch::label() const {
  return paused_ ? "⏸ Paused (q: resume, r: reset)" : "▶ Running (q: pause, r: reset)";
}

std::string Stopwatch::focus_status() const {
  return paused_ ? kPausedStatus : std::string();
}
