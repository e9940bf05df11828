#pragma once
/*
 * ClockEngine
 *
 * Purpose: show the local wall-clock time; ignores keys and never finishes.
 */
#include "timer_engine.hpp"

class ClockEngine : public ITimerEngine {
public:
  TickResult tick(std::optional<char> key, Timestamp now) override;
  std::string label() const override;
  Color color() const override { return Color::Cyan; }
  Layout layout(bool focus) const override { return focus ? Layout::TimeOnly : Layout::WithLabel; }
private:
  Timestamp last_{};
};
