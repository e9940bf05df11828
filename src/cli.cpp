#include "cli.hpp"
#include "time_format.hpp"
#include <algorithm>
#include <cctype>
#include <climits>
#include <getopt.h>
#include <optional>
#include <stdexcept>

static constexpr int OPT_WHITE = 1000;
static constexpr int OPT_BLACK = 1001;
static constexpr int OPT_NO_BELL = 1002;

static const char* kPomodoroFormatMsg = "Pomodoro format is W,B (e.g., 25,5)";

static std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  return s.substr(i, j - i);
}

static bool parse_minutes(const std::string& raw, int& out) {
  std::string s = trim(raw);
  if (s.empty()) return false;
  bool ok = std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; });
  if (!ok) return false;
  try { out = std::stoi(s); } catch (const std::out_of_range&) { return false; }
  return out > 0 && out <= INT_MAX / 60;
}

bool parse_pomodoro(const std::string& text, int& work_minutes, int& break_minutes, std::string& msg) {
  size_t comma = text.find(',');
  if (comma == std::string::npos || text.find(',', comma + 1) != std::string::npos) {
    msg = kPomodoroFormatMsg; return false;
  }
  int w = 0, b = 0;
  if (!parse_minutes(text.substr(0, comma), w) || !parse_minutes(text.substr(comma + 1), b)) {
    msg = kPomodoroFormatMsg; return false;
  }
  work_minutes = w;
  break_minutes = b;
  return true;
}

bool parse_args(int argc, char** argv, Options& out, std::string& msg) {
  static const struct option long_opts[] = {
    {"focus",     no_argument,       nullptr, 'f'},
    {"bold",      no_argument,       nullptr, 'b'},
    {"white",     no_argument,       nullptr, OPT_WHITE},
    {"black",     no_argument,       nullptr, OPT_BLACK},
    {"no-bell",   no_argument,       nullptr, OPT_NO_BELL},
    {"stopwatch", no_argument,       nullptr, 's'},
    {"timer",     required_argument, nullptr, 't'},
    {"pomodoro",  required_argument, nullptr, 'p'},
    {"verbose",   no_argument,       nullptr, 'v'},
    {"help",      no_argument,       nullptr, 'h'},
    {nullptr, 0, nullptr, 0}
  };
  Options o;
  bool white = false, black = false, stopwatch = false;
  std::optional<std::string> timer_arg;
  std::optional<std::string> pomodoro_arg;

  optind = 0; // full rescan, parse_args may run more than once per process
  opterr = 0;
  int c;
  while ((c = getopt_long(argc, argv, ":fbst:p:vh", long_opts, nullptr)) != -1) {
    switch (c) {
      case 'f': o.display.focus = true; break;
      case 'b': o.display.bold = true; break;
      case 's': stopwatch = true; break;
      case 't': timer_arg = optarg; break;
      case 'p': pomodoro_arg = optarg; break;
      case 'v': o.verbose = true; break;
      case 'h': o.show_help = true; break;
      case OPT_WHITE: white = true; break;
      case OPT_BLACK: black = true; break;
      case OPT_NO_BELL: o.display.bell_enabled = false; break;
      case ':':
        msg = std::string("option requires a value: ") + argv[optind - 1];
        return false;
      default:
        if (optopt != 0) msg = std::string("unknown option: -") + static_cast<char>(optopt);
        else msg = std::string("unknown option: ") + argv[optind - 1];
        return false;
    }
  }
  if (optind < argc) { msg = std::string("unexpected argument: ") + argv[optind]; return false; }
  if (o.show_help) { out = o; return true; }

  if (white && black) { msg = "--white and --black are mutually exclusive"; return false; }
  if (white) o.display.color_override = ColorOverride::White;
  if (black) o.display.color_override = ColorOverride::Black;

  if (timer_arg) {
    if (!parse_duration(*timer_arg, o.timer_seconds, msg)) return false;
    if (o.timer_seconds <= 0) { msg = "Duration must be positive"; return false; }
  }
  if (pomodoro_arg && !parse_pomodoro(*pomodoro_arg, o.work_minutes, o.break_minutes, msg)) return false;

  if (pomodoro_arg) o.mode = Mode::Pomodoro;
  else if (stopwatch) o.mode = Mode::Stopwatch;
  else if (timer_arg) o.mode = Mode::Countdown;
  else o.mode = Mode::Clock;
  out = o;
  return true;
}

std::string usage_text(const std::string& prog) {
  return
    "usage: " + prog + " [-f] [-b] [--white | --black] [--no-bell] [-v]\n"
    "       " + std::string(prog.size(), ' ') + " [-s | -t TIME | -p W,B]\n"
    "\n"
    "Terminal digital clock with stopwatch, countdown and Pomodoro modes.\n"
    "\n"
    "options:\n"
    "  -f, --focus         minimal display without labels\n"
    "  -b, --bold          use bold/thick number style\n"
    "  --white             override colors to white\n"
    "  --black             override colors to black\n"
    "  --no-bell           disable completion bell sound\n"
    "  -s, --stopwatch     count-up timer mode\n"
    "  -t, --timer TIME    countdown timer (MM:SS, HH:MM:SS, or seconds)\n"
    "  -p, --pomodoro W,B  work,break minutes (e.g., 25,5)\n"
    "  -v, --verbose       debug diagnostics on stderr\n"
    "  -h, --help          show this help and exit\n"
    "\n"
    "timer formats:\n"
    "  90        90 seconds\n"
    "  10:30     10 minutes 30 seconds\n"
    "  1:30:00   1 hour 30 minutes\n"
    "\n"
    "controls:\n"
    "  q         pause/resume\n"
    "  r         reset (stopwatch only)\n"
    "  Ctrl+C    exit\n"
    "\n"
    "examples:\n"
    "  " + prog + " -fb -s          focus + bold stopwatch\n"
    "  " + prog + " -t 10:30        10 minute 30 second timer\n"
    "  " + prog + " -p 25,5         Pomodoro (25min work, 5min break)\n"
    "  " + prog + " --white -t 5:00 white text 5 minute timer\n";
}
