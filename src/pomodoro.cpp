#include "pomodoro.hpp"
#include "config.hpp"
#include <string>
#include <spdlog/spdlog.h>

Pomodoro::Pomodoro(int work_seconds, int break_seconds)
  : work_seconds_(work_seconds), break_seconds_(break_seconds), current_(make_phase()) {}

Countdown Pomodoro::make_phase() const {
  std::string name = "Session " + std::to_string(session_);
  if (phase_ == Phase::Work) return Countdown(work_seconds_, name + " - Work", Color::Red);
  return Countdown(break_seconds_, name + " - Break", Color::Green);
}

void Pomodoro::advance() {
  if (phase_ == Phase::Work) {
    phase_ = Phase::Break;
  } else {
    phase_ = Phase::Work;
    session_++;
  }
  current_ = make_phase();
  spdlog::debug("pomodoro session {} {}", session_, phase_ == Phase::Work ? "work" : "break");
}

TickResult Pomodoro::tick(std::optional<char> key, Timestamp now) {
  if (advance_pending_) {
    advance_pending_ = false;
    advance();
  }
  TickResult r = current_.tick(key, now);
  if (r.done) {
    r.done = false;
    r.phase_complete = true;
    r.hold = std::chrono::milliseconds(TCLOCK_PHASE_HOLD_MS);
    advance_pending_ = true;
  }
  return r;
}
