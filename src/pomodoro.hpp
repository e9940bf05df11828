#pragma once
/*
 * Pomodoro
 *
 * Purpose: alternate Work and Break countdowns, counting sessions.
 * Flow: a finished phase is reported once as phase_complete (with a hold time for the
 *       bell pause); the next phase starts on the following tick. A finished Break
 *       increments the session before Work restarts.
 */
#include "countdown.hpp"

class Pomodoro : public ITimerEngine {
public:
  enum class Phase { Work, Break };

  Pomodoro(int work_seconds, int break_seconds);

  TickResult tick(std::optional<char> key, Timestamp now) override;
  std::string label() const override { return current_.label(); }
  std::string focus_status() const override { return current_.focus_status(); }
  bool paused() const override { return current_.paused(); }
  std::optional<double> progress() const override { return current_.progress(); }
  Color color() const override { return current_.color(); }
  Layout layout(bool focus) const override { return current_.layout(focus); }

  int session() const { return session_; }
  Phase phase() const { return phase_; }
  const Countdown& current() const { return current_; }

private:
  Countdown make_phase() const;
  void advance();

  int work_seconds_;
  int break_seconds_;
  int session_ = 1;
  Phase phase_ = Phase::Work;
  bool advance_pending_ = false;
  Countdown current_;
};
