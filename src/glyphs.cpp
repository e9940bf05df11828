#include "glyphs.hpp"
#include "palette.hpp"
#include <wchar.h>

namespace {
struct Glyph {
  char ch;
  int width;
  std::array<const char*, kGlyphRows> rows;
};

constexpr std::array<Glyph, 12> kNormal = {{
  {'0', 5, {"┌───┐", "│   │", "│   │", "└───┘"}},
  {'1', 5, {"    ┐", "    │", "    │", "    ┴"}},
  {'2', 5, {"┌───┐", "    │", "┌───┘", "└───┘"}},
  {'3', 5, {"┌───┐", "    │", "  ──┤", "└───┘"}},
  {'4', 5, {"┐   ┐", "└───┤", "    │", "    ┘"}},
  {'5', 5, {"┌───┐", "└───┐", "┌   │", "└───┘"}},
  {'6', 5, {"┌───┐", "├───┐", "│   │", "└───┘"}},
  {'7', 5, {"┌───┐", "    │", "    │", "    ┘"}},
  {'8', 5, {"┌───┐", "├───┤", "│   │", "└───┘"}},
  {'9', 5, {"┌───┐", "└───┤", "    │", "    ┘"}},
  {':', 1, {" ", "●", "●", " "}},
  {' ', 5, {"     ", "     ", "     ", "     "}},
}};

constexpr std::array<Glyph, 12> kBold = {{
  {'0', 7, {"╔═════╗", "║     ║", "║     ║", "╚═════╝"}},
  {'1', 7, {"      ║", "      ║", "      ║", "      ║"}},
  {'2', 7, {"╔═════╗", "      ║", "╔═════╝", "╚═════╝"}},
  {'3', 7, {"╔═════╗", "      ║", " ═════╣", "╚═════╝"}},
  {'4', 7, {"╗     ║", "║     ║", "╚═════╣", "      ║"}},
  {'5', 7, {"╔═════╗", "║      ", "╚═════╗", "╚═════╝"}},
  {'6', 7, {"╔═════╗", "║      ", "╠═════╗", "╚═════╝"}},
  {'7', 7, {"╔═════╗", "      ║", "      ║", "      ║"}},
  {'8', 7, {"╔═════╗", "║     ║", "╠═════╣", "╚═════╝"}},
  {'9', 7, {"╔═════╗", "║     ║", "╚═════╣", "╚═════╝"}},
  {':', 1, {" ", "●", "●", " "}},
  {' ', 7, {"       ", "       ", "       ", "       "}},
}};

// Decodes the code point starting at s[i] and advances i past it.
char32_t next_code_point(std::string_view s, size_t& i) {
  unsigned char c = static_cast<unsigned char>(s[i++]);
  int extra = 0;
  char32_t cp = c;
  if (c >= 0xF0) { extra = 3; cp = c & 0x07; }
  else if (c >= 0xE0) { extra = 2; cp = c & 0x0F; }
  else if (c >= 0xC0) { extra = 1; cp = c & 0x1F; }
  while (extra-- > 0 && i < s.size() && (static_cast<unsigned char>(s[i]) & 0xC0) == 0x80) {
    cp = (cp << 6) | (static_cast<unsigned char>(s[i++]) & 0x3F);
  }
  return cp;
}

int columns(char32_t cp) {
  int w = ::wcwidth(static_cast<wchar_t>(cp));
  return w < 0 ? 1 : w;
}

const Glyph* find_glyph(char c, bool bold) {
  const auto& table = bold ? kBold : kNormal;
  for (const auto& g : table) if (g.ch == c) return &g;
  return nullptr;
}
}

GlyphBlock render_glyphs(std::string_view text, bool bold) {
  GlyphBlock out;
  bool first = true;
  for (char c : text) {
    const Glyph* g = find_glyph(c, bold);
    if (!g) continue;
    for (int r = 0; r < kGlyphRows; ++r) {
      if (!first) out.rows[r] += ' ';
      out.rows[r] += g->rows[r];
    }
    out.width += g->width + (first ? 0 : 1);
    first = false;
  }
  return out;
}

int display_width(std::string_view s) {
  int n = 0;
  for (size_t i = 0; i < s.size();) n += columns(next_code_point(s, i));
  return n;
}

std::string clip_to_width(std::string_view s, int max_cols) {
  std::string out;
  int used = 0;
  bool styled = false;
  for (size_t i = 0; i < s.size();) {
    if (s[i] == '\033' && i + 1 < s.size() && s[i + 1] == '[') {
      size_t end = s.find('m', i);
      if (end == std::string_view::npos) end = s.size() - 1;
      out.append(s.substr(i, end - i + 1));
      styled = true;
      i = end + 1;
      continue;
    }
    size_t start = i;
    int w = columns(next_code_point(s, i));
    if (used + w > max_cols) {
      if (styled) out += kColorReset;
      return out;
    }
    out.append(s.substr(start, i - start));
    used += w;
  }
  return out;
}
