#pragma once
/*
 * ITimerEngine
 *
 * Purpose: one time-tracking state machine per mode (clock/stopwatch/countdown/pomodoro).
 * Contract: tick() applies the key first, then produces the value to show this frame.
 * Goal: engines know nothing about terminals; Session feeds them keys and timestamps.
 */
#include <chrono>
#include <optional>
#include <string>
#include "types.hpp"

class ITimerEngine {
public:
  virtual ~ITimerEngine() = default;
  virtual TickResult tick(std::optional<char> key, Timestamp now) = 0;
  // Label line in full mode.
  virtual std::string label() const = 0;
  // Status line in focus mode; empty when there is nothing to say.
  virtual std::string focus_status() const { return std::string(); }
  virtual bool paused() const { return false; }
  virtual std::optional<double> progress() const { return std::nullopt; }
  virtual Color color() const = 0;
  virtual Layout layout(bool focus) const = 0;
  virtual std::chrono::milliseconds cadence() const { return std::chrono::seconds(1); }
};

inline constexpr char kKeyPause = 'q';
inline constexpr char kKeyReset = 'r';
inline constexpr const char* kPausedStatus = "⏸ Paused";
