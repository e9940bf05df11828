#pragma once
/*
 * TimeFormat
 *
 * Purpose: convert between seconds and the MM:SS / HH:MM:SS display forms.
 * Usage: parse_duration(str, out_seconds, msg); returns false with msg on failure.
 */
#include <string>
#include "types.hpp"

// MM:SS below one hour, HH:MM:SS from one hour on.
std::string format_duration(int seconds);

// Local wall-clock time, always HH:MM:SS.
std::string format_wall_clock(Timestamp t);

// Local date, e.g. "Monday, October 19, 2026".
std::string format_date(Timestamp t);

// Accepts "S", "M:S" and "H:M:S" with non-negative integer parts.
bool parse_duration(const std::string& text, int& out_seconds, std::string& msg);
