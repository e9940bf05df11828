#include "terminfo_surface.hpp"
#include "config.hpp"
#include <cstdio>
#include <sys/ioctl.h>
#include <unistd.h>
#include <spdlog/spdlog.h>
// term.h defines a macro per capability name (lines, columns, bell...), keep it last
#include <term.h>

static std::string capability(const char* name, const char* fallback) {
  const char* s = tigetstr(name);
  if (s == nullptr || s == reinterpret_cast<const char*>(-1)) return fallback;
  return s;
}

TerminfoSurface::TerminfoSurface() {
  int err = 0;
  if (setupterm(nullptr, STDOUT_FILENO, &err) == 0) {
    terminfo_ = true;
  } else {
    spdlog::debug("terminfo unavailable (setupterm err={}), using ANSI sequences", err);
  }
  if (terminfo_) {
    clear_seq_ = capability("clear", "\033[H\033[2J");
    eol_seq_ = capability("el", "\033[K");
    bell_seq_ = capability("bel", "\a");
    hide_seq_ = capability("civis", "\033[?25l");
    show_seq_ = capability("cnorm", "\033[?25h");
  } else {
    clear_seq_ = "\033[H\033[2J";
    eol_seq_ = "\033[K";
    bell_seq_ = "\a";
    hide_seq_ = "\033[?25l";
    show_seq_ = "\033[?25h";
  }
}

TerminfoSurface::~TerminfoSurface() {
  flush_frame();
  if (terminfo_) del_curterm(cur_term);
}

int TerminfoSurface::current_width() const {
  struct winsize ws{};
  if (::ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) return ws.ws_col;
  if (terminfo_) {
    int c = tigetnum("cols");
    if (c > 0) return c;
  }
  return TCLOCK_FALLBACK_COLS;
}

void TerminfoSurface::clear_display() {
  pending_ += clear_seq_;
  flush_frame();
}

void TerminfoSurface::move_cursor_up(int n) {
  if (n <= 0) return;
  if (terminfo_) {
    const char* cuu = tigetstr("cuu");
    if (cuu != nullptr && cuu != reinterpret_cast<const char*>(-1)) {
      if (const char* seq = tiparm(cuu, n)) { pending_ += seq; return; }
    }
  }
  pending_ += "\033[" + std::to_string(n) + "A";
}

void TerminfoSurface::write_line(const std::string& text) {
  pending_ += '\r';
  pending_ += text;
  pending_ += eol_seq_;
  pending_ += '\n';
}

void TerminfoSurface::flush_frame() {
  if (pending_.empty()) return;
  std::fwrite(pending_.data(), 1, pending_.size(), stdout);
  std::fflush(stdout);
  pending_.clear();
}

void TerminfoSurface::ring_bell() {
  pending_ += bell_seq_;
  flush_frame();
}

void TerminfoSurface::set_cursor_visible(bool visible) {
  pending_ += visible ? show_seq_ : hide_seq_;
}
