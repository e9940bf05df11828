#include "time_format.hpp"
#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdio>
#include <ctime>
#include <stdexcept>
#include <vector>

static std::vector<std::string> split_on(const std::string& s, char sep) {
  std::vector<std::string> parts;
  size_t st = 0;
  while (true) {
    size_t pos = s.find(sep, st);
    if (pos == std::string::npos) { parts.emplace_back(s.substr(st)); break; }
    parts.emplace_back(s.substr(st, pos - st));
    st = pos + 1;
  }
  return parts;
}

static bool local_time(Timestamp t, std::tm& out) {
  std::time_t tt = std::chrono::system_clock::to_time_t(t);
  return ::localtime_r(&tt, &out) != nullptr;
}

std::string format_duration(int seconds) {
  if (seconds < 0) seconds = 0;
  int h = seconds / 3600;
  int m = (seconds % 3600) / 60;
  int s = seconds % 60;
  char out[32];
  if (h > 0) std::snprintf(out, sizeof(out), "%02d:%02d:%02d", h, m, s);
  else std::snprintf(out, sizeof(out), "%02d:%02d", m, s);
  return out;
}

std::string format_wall_clock(Timestamp t) {
  std::tm tm{};
  if (!local_time(t, tm)) return "00:00:00";
  char out[16];
  std::strftime(out, sizeof(out), "%H:%M:%S", &tm);
  return out;
}

std::string format_date(Timestamp t) {
  std::tm tm{};
  if (!local_time(t, tm)) return std::string();
  char out[64];
  size_t n = std::strftime(out, sizeof(out), "%A, %B %d, %Y", &tm);
  return std::string(out, n);
}

bool parse_duration(const std::string& text, int& out_seconds, std::string& msg) {
  static const char* kFormatMsg = "Duration must be in format: MM:SS, HH:MM:SS, or seconds";
  std::vector<std::string> parts = split_on(text, ':');
  if (parts.empty() || parts.size() > 3) { msg = kFormatMsg; return false; }
  static const long long kScale[3] = {1, 60, 3600};
  long long total = 0;
  // rightmost part is seconds, then minutes, then hours
  for (size_t i = 0; i < parts.size(); ++i) {
    const std::string& p = parts[parts.size() - 1 - i];
    if (p.empty()) { msg = kFormatMsg; return false; }
    bool digits = std::all_of(p.begin(), p.end(), [](unsigned char c){ return std::isdigit(c) != 0; });
    if (!digits) { msg = kFormatMsg; return false; }
    long long v = 0;
    try { v = std::stoll(p); } catch (const std::out_of_range&) { msg = "Duration is too large"; return false; }
    if (v > INT_MAX) { msg = "Duration is too large"; return false; }
    total += v * kScale[i];
    if (total > INT_MAX) { msg = "Duration is too large"; return false; }
  }
  out_seconds = static_cast<int>(total);
  return true;
}
