#pragma once
/*
 * Stopwatch
 *
 * Purpose: count up from the reference start, excluding paused time.
 * Keys: 'q' pause/resume, 'r' reset to zero (also resumes).
 * Invariant: while running, elapsed = floor(now - reference_start);
 *            while paused, elapsed stays at the value it had when the pause began.
 */
#include "timer_engine.hpp"

class Stopwatch : public ITimerEngine {
public:
  explicit Stopwatch(Timestamp start);

  TickResult tick(std::optional<char> key, Timestamp now) override;
  std::string label() const override;
  std::string focus_status() const override;
  bool paused() const override { return paused_; }
  Color color() const override { return Color::Blue; }
  Layout layout(bool) const override { return Layout::WithLabel; }
  std::chrono::milliseconds cadence() const override { return std::chrono::milliseconds(100); }

  int elapsed() const { return elapsed_; }

private:
  void toggle_pause(Timestamp now);
  void reset(Timestamp now);

  Timestamp reference_start_;
  std::optional<Timestamp> pause_anchor_;
  bool paused_ = false;
  int elapsed_ = 0;
};
