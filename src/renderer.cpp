#include "renderer.hpp"
#include "glyphs.hpp"
#include "palette.hpp"
#include <algorithm>
#include <cstdio>

static std::string colored(const std::string& text, int pad, const char* color) {
  std::string out(static_cast<size_t>(std::max(0, pad)), ' ');
  out += color;
  out += text;
  out += kColorReset;
  return out;
}

std::string Renderer::progress_bar(double progress, int width, const char* color) {
  progress = std::clamp(progress, 0.0, 1.0);
  int bar_len = std::max(TCLOCK_BAR_MIN, std::min(TCLOCK_BAR_MAX, width - TCLOCK_BAR_MARGIN));
  int pad = std::max(0, (width - bar_len - 10) / 2);
  int filled = static_cast<int>(bar_len * progress);
  std::string bar;
  for (int i = 0; i < bar_len; ++i) bar += (i < filled) ? "█" : "░";
  char pct[16];
  std::snprintf(pct, sizeof(pct), "%.1f%%", progress * 100.0);
  return std::string(static_cast<size_t>(pad), ' ') + "[" + color + bar + kColorReset + "] " + pct;
}

int Renderer::render(ISurface& surface, const FrameInfo& frame, const DisplayConfig& cfg) const {
  int written = 0;
  // a wrapped row would take two screen lines and break the in-place redraw
  const int width = surface.current_width();
  auto put = [&](const std::string& line) {
    surface.write_line(clip_to_width(line, width));
    written++;
  };
  GlyphBlock block = render_glyphs(frame.time_text, cfg.bold);
  const char* time_color = sgr(resolve_color(cfg, frame.time_color));
  int pad = surface.center_pad(block.width);
  for (const auto& row : block.rows) put(colored(row, pad, time_color));
  put(std::string());

  if (frame.layout == Layout::TimeOnly) return written;

  const char* caption_color = sgr(resolve_color(cfg, frame.caption_color));
  if (frame.caption.empty()) {
    put(std::string());
  } else {
    int cpad = surface.center_pad(display_width(frame.caption));
    put(colored(frame.caption, cpad, caption_color));
  }
  // focus+bar keeps the status line tight against the bar
  if (frame.layout != Layout::FocusWithBar) put(std::string());

  if (frame.layout == Layout::FocusWithBar || frame.layout == Layout::WithBar) {
    const char* bar_color = sgr(resolve_color(cfg, frame.bar_color));
    put(progress_bar(frame.progress.value_or(0.0), width, bar_color));
    put(std::string());
  }
  return written;
}
