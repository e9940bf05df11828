#pragma once
/*
 * HeadlessSurface
 *
 * Purpose: in-memory ISurface used by tests; emulates a scrolling screen so
 *          in-place redraws can be asserted (rows overwritten, not appended).
 * Note: width is fixed per instance and can be changed between frames.
 */
#include "isurface.hpp"
#include <string>
#include <vector>

class HeadlessSurface : public ISurface {
public:
  explicit HeadlessSurface(int width = 80) : width_(width) {}

  int current_width() const override { width_queries++; return width_; }
  void clear_display() override { screen.clear(); row = 0; clears++; }
  void move_cursor_up(int n) override { row = std::max(0, row - n); moves.push_back(n); }
  void write_line(const std::string& text) override {
    if (row >= static_cast<int>(screen.size())) screen.resize(row + 1);
    screen[row++] = text;
    pending_lines++;
  }
  void flush_frame() override {
    if (pending_lines > 0) frames.push_back(pending_lines);
    pending_lines = 0;
  }
  void ring_bell() override { bells++; events.push_back("bell"); }
  void set_cursor_visible(bool visible) override { cursor_visible = visible; }

  void set_width(int w) { width_ = w; }

  std::vector<std::string> screen;
  int row = 0;
  int clears = 0;
  int bells = 0;
  bool cursor_visible = true;
  mutable int width_queries = 0;
  std::vector<int> moves;
  std::vector<int> frames; // line count of each flushed frame
  std::vector<std::string> events;

private:
  int width_;
  int pending_lines = 0;
};
