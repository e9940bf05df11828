#pragma once
/*
 * ISurface
 *
 * Purpose: abstract line-oriented terminal output (width, clear, cursor up, lines, bell).
 * Goal: decouple the frame renderer from the concrete backend (terminfo/headless), enable testing.
 * Constraint: lines are buffered until flush_frame() so a frame is written in one go.
 */
#include <algorithm>
#include <string>

class ISurface {
public:
  virtual ~ISurface() = default;
  // Re-queried on every call; the terminal may be resized mid-run.
  virtual int current_width() const = 0;
  virtual void clear_display() = 0;
  virtual void move_cursor_up(int n) = 0;
  // Appends text, erases the rest of the row, then moves to the next row.
  virtual void write_line(const std::string& text) = 0;
  virtual void flush_frame() = 0;
  virtual void ring_bell() = 0;
  virtual void set_cursor_visible(bool visible) = 0;

  int center_pad(int length) const { return std::max(0, (current_width() - length) / 2); }
};

/*hides the cursor for the lifetime of a session*/
class CursorGuard {
public:
  explicit CursorGuard(ISurface& s) : s_(s) { s_.set_cursor_visible(false); s_.flush_frame(); }
  ~CursorGuard() { s_.set_cursor_visible(true); s_.flush_frame(); }
  CursorGuard(const CursorGuard&) = delete;
  CursorGuard& operator=(const CursorGuard&) = delete;
private:
  ISurface& s_;
};
