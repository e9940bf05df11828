#include "countdown.hpp"
#include "time_format.hpp"
#include <algorithm>
#include <utility>
#include <spdlog/spdlog.h>

// durations are validated by the CLI; clamp anyway so remaining never starts negative
Countdown::Countdown(int total_seconds, std::string name, Color color)
  : total_(std::max(0, total_seconds)), remaining_(total_), shown_(total_),
    name_(std::move(name)), color_(color) {}

TickResult Countdown::tick(std::optional<char> key, Timestamp) {
  TickResult r;
  if (finished()) {
    r.text = format_duration(shown_);
    r.done = true;
    return r;
  }
  if (key == kKeyPause) {
    paused_ = !paused_;
    spdlog::debug("{} {} at {}s", name_, paused_ ? "paused" : "resumed", remaining_);
  }
  shown_ = remaining_;
  if (!paused_) remaining_--;
  r.text = format_duration(shown_);
  r.done = finished();
  return r;
}

std::string Countdown::label() const {
  return paused_ ? "⏸ Paused - " + name_ : "▶ " + name_;
}

std::string Countdown::focus_status() const {
  return paused_ ? kPausedStatus : std::string();
}

std::optional<double> Countdown::progress() const {
  if (total_ == 0) return 1.0;
  return static_cast<double>(total_ - shown_) / static_cast<double>(total_);
}
