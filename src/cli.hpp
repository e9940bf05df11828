#pragma once
/*
 * Cli
 *
 * Purpose: parse argv into Options and validate every value before any mode runs.
 * Usage: parse_args(argc, argv, opts, msg); returns false with a one-line msg on failure.
 */
#include <string>
#include "config.hpp"

enum class Mode { Clock, Stopwatch, Countdown, Pomodoro };

struct Options {
  DisplayConfig display;
  Mode mode = Mode::Clock;
  int timer_seconds = 0;
  int work_minutes = 0;
  int break_minutes = 0;
  bool verbose = false;
  bool show_help = false;
};

bool parse_args(int argc, char** argv, Options& out, std::string& msg);

// "W,B" with two positive integer minute counts.
bool parse_pomodoro(const std::string& text, int& work_minutes, int& break_minutes, std::string& msg);

std::string usage_text(const std::string& prog);
