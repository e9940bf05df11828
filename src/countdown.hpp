#pragma once
/*
 * Countdown
 *
 * Purpose: count down from total to 0 inclusive, one step per tick, 'q' pauses.
 * Note: decrements per tick, not per wall-clock second; resuming after a pause
 *       continues from the frozen value without catching up.
 */
#include "timer_engine.hpp"

class Countdown : public ITimerEngine {
public:
  Countdown(int total_seconds, std::string name, Color color);

  TickResult tick(std::optional<char> key, Timestamp now) override;
  std::string label() const override;
  std::string focus_status() const override;
  bool paused() const override { return paused_; }
  std::optional<double> progress() const override;
  Color color() const override { return color_; }
  Layout layout(bool focus) const override { return focus ? Layout::FocusWithBar : Layout::WithBar; }

  int total() const { return total_; }
  int shown() const { return shown_; }
  bool finished() const { return remaining_ < 0; }

private:
  int total_;
  int remaining_;
  int shown_;
  bool paused_ = false;
  std::string name_;
  Color color_;
};
