#include "palette.hpp"
#include <array>
#include <cstddef>

const char* const kColorReset = "\033[0m";

namespace {
struct PaletteEntry { Color color; const char* code; };

constexpr std::array<PaletteEntry, 9> kPalette = {{
  {Color::Cyan,    "\033[96m"},
  {Color::Blue,    "\033[94m"},
  {Color::Yellow,  "\033[93m"},
  {Color::Red,     "\033[91m"},
  {Color::Green,   "\033[92m"},
  {Color::Magenta, "\033[95m"},
  {Color::Gray,    "\033[90m"},
  {Color::White,   "\033[97m"},
  {Color::Black,   "\033[30m"},
}};
}

const char* sgr(Color c) {
  for (const auto& e : kPalette) if (e.color == c) return e.code;
  return kColorReset;
}

Color resolve_color(const DisplayConfig& cfg, Color fallback) {
  switch (cfg.color_override) {
    case ColorOverride::White: return Color::White;
    case ColorOverride::Black: return Color::Black;
    case ColorOverride::None: break;
  }
  return fallback;
}
