#pragma once
/*
 * TerminfoSurface
 *
 * Purpose: ISurface implementation on stdout using the ncurses terminfo database.
 * Note: only the terminfo layer is used (no initscr); output scrolls like a normal
 *       program and frames are redrawn in place by moving the cursor up.
 * Fallback: plain ANSI/VT100 sequences when no terminfo entry is available.
 */
#include "isurface.hpp"
#include <string>

class TerminfoSurface : public ISurface {
public:
  TerminfoSurface();
  ~TerminfoSurface() override;
  TerminfoSurface(const TerminfoSurface&) = delete;
  TerminfoSurface& operator=(const TerminfoSurface&) = delete;

  int current_width() const override;
  void clear_display() override;
  void move_cursor_up(int n) override;
  void write_line(const std::string& text) override;
  void flush_frame() override;
  void ring_bell() override;
  void set_cursor_visible(bool visible) override;

private:
  bool terminfo_ = false;
  std::string clear_seq_;
  std::string eol_seq_;
  std::string bell_seq_;
  std::string hide_seq_;
  std::string show_seq_;
  std::string pending_;
};
