#pragma once
/*
 * TimeSource
 *
 * Purpose: wall-clock reads, monotonic deadlines and sleeping behind one interface.
 * Goal: the session loop runs against a manual clock in tests.
 */
#include <chrono>
#include "types.hpp"

class ITimeSource {
public:
  using MonoPoint = std::chrono::steady_clock::time_point;
  virtual ~ITimeSource() = default;
  virtual Timestamp now() const = 0;
  virtual MonoPoint monotonic() const = 0;
  // May return early when a signal arrives.
  virtual void sleep_until(MonoPoint deadline) = 0;
  void sleep_for(std::chrono::milliseconds d) { sleep_until(monotonic() + d); }
};

class SystemTimeSource : public ITimeSource {
public:
  Timestamp now() const override { return std::chrono::system_clock::now(); }
  MonoPoint monotonic() const override { return std::chrono::steady_clock::now(); }
  void sleep_until(MonoPoint deadline) override;
};
