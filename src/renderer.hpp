#pragma once
/*
 * Renderer
 *
 * Purpose: draw one frame (glyph block, caption line, progress bar) onto an ISurface.
 * Dependency: draws via ISurface to allow backend replacement.
 * Constraint: stateless; receives a snapshot from Session and returns the line count
 *             it wrote, which always equals frame_lines(layout).
 */
#include <optional>
#include <string>
#include "config.hpp"
#include "isurface.hpp"
#include "types.hpp"

struct FrameInfo {
  std::string time_text;
  Color time_color = Color::Cyan;
  Layout layout = Layout::TimeOnly;
  std::string caption; // label (full mode) or status (focus mode)
  Color caption_color = Color::Magenta;
  std::optional<double> progress;
  Color bar_color = Color::Gray;
};

class Renderer {
public:
  int render(ISurface& surface, const FrameInfo& frame, const DisplayConfig& cfg) const;

  // "[████░░░░] 40.0%" centred for the given width, colour codes included.
  static std::string progress_bar(double progress, int width, const char* color);
};
