#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Color/Layout/TickResult).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <chrono>
#include <string>

using Timestamp = std::chrono::system_clock::time_point;

enum class Color { Cyan, Blue, Yellow, Red, Green, Magenta, Gray, White, Black };

// Fixed frame shapes; the value is the number of terminal lines a frame takes.
enum class Layout { TimeOnly = 5, WithLabel = 7, FocusWithBar = 8, WithBar = 9 };

inline int frame_lines(Layout l) { return static_cast<int>(l); }

struct TickResult {
  std::string text;
  bool done = false;
  bool phase_complete = false;
  std::chrono::milliseconds hold{0};
};
