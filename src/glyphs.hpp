#pragma once
/*
 * Glyphs
 *
 * Purpose: turn a time string into a 4-row block of box-drawing digits.
 * Constraint: only 0-9, ':' and ' ' have glyphs; anything else is skipped.
 * Note: centering is left to the caller (see ISurface::center_pad).
 */
#include <array>
#include <string>
#include <string_view>

inline constexpr int kGlyphRows = 4;

struct GlyphBlock {
  std::array<std::string, kGlyphRows> rows;
  int width = 0; // columns, identical for every row
};

GlyphBlock render_glyphs(std::string_view text, bool bold);

// Terminal columns of a UTF-8 string (wcwidth per code point, 1 where the locale can't tell).
int display_width(std::string_view s);

// Longest prefix of s that fits in max_cols columns. SGR escapes are copied
// through without counting; a cut line gets a trailing colour reset.
std::string clip_to_width(std::string_view s, int max_cols);
