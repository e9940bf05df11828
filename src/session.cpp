#include "session.hpp"
#include "interrupt.hpp"
#include <spdlog/spdlog.h>

Session::Session(ISurface& surface, IKeySource& keys, ITimeSource& time, const DisplayConfig& cfg)
  : surface_(surface), keys_(keys), time_(time), cfg_(cfg) {}

FrameInfo Session::snapshot(const ITimerEngine& engine, const TickResult& r) const {
  FrameInfo f;
  f.time_text = r.text;
  f.time_color = engine.color();
  f.layout = engine.layout(cfg_.focus);
  if (cfg_.focus) {
    f.caption = engine.focus_status();
    f.caption_color = Color::Gray;
    f.bar_color = Color::Gray;
  } else {
    f.caption = engine.label();
    f.caption_color = Color::Magenta;
    f.bar_color = engine.color();
  }
  f.progress = engine.progress();
  return f;
}

SessionEnd Session::interrupted() {
  surface_.write_line(std::string());
  surface_.flush_frame();
  spdlog::debug("session interrupted");
  return SessionEnd::Interrupted;
}

SessionEnd Session::run(ITimerEngine& engine) {
  CursorGuard cursor(surface_);
  surface_.clear_display();
  bool first = true;
  int prev_lines = 0;
  auto next = time_.monotonic();
  while (!Interrupt::requested()) {
    std::optional<char> key = keys_.poll_key();
    TickResult r = engine.tick(key, time_.now());
    if (!first) surface_.move_cursor_up(prev_lines);
    prev_lines = renderer_.render(surface_, snapshot(engine, r), cfg_);
    surface_.flush_frame();
    first = false;

    if (r.done) {
      if (cfg_.bell_enabled) surface_.ring_bell();
      spdlog::debug("session completed");
      return SessionEnd::Completed;
    }
    if (r.phase_complete) {
      if (cfg_.bell_enabled) surface_.ring_bell();
      time_.sleep_for(r.hold);
      if (Interrupt::requested()) break;
      surface_.clear_display();
      first = true;
      next = time_.monotonic();
      continue;
    }

    next += engine.cadence();
    auto now = time_.monotonic();
    // resync after a stall (suspend, slow terminal) instead of bursting ticks
    if (next + engine.cadence() < now) next = now;
    time_.sleep_until(next);
  }
  return interrupted();
}
