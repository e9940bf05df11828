#pragma once
/*
 * Palette
 *
 * Purpose: read-only ANSI SGR table and colour override resolution.
 */
#include "config.hpp"
#include "types.hpp"

extern const char* const kColorReset;

const char* sgr(Color c);
Color resolve_color(const DisplayConfig& cfg, Color fallback);
