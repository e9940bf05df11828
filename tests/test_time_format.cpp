#include "time_format.hpp"
#include <cassert>
#include <string>

static int parse_ok(const std::string& s) {
  int out = -1; std::string msg;
  bool ok = parse_duration(s, out, msg);
  assert(ok);
  assert(msg.empty());
  return out;
}

static bool parse_fails(const std::string& s) {
  int out = -1; std::string msg;
  bool ok = parse_duration(s, out, msg);
  return !ok && !msg.empty() && out == -1;
}

int main() {
  assert(parse_ok("90") == 90);
  assert(parse_ok("0") == 0);
  assert(parse_ok("10:30") == 630);
  assert(parse_ok("1:30:00") == 5400);
  assert(parse_ok("2:03:04") == 2 * 3600 + 3 * 60 + 4);
  assert(parse_ok("0:75") == 75);
  assert(parse_ok("007") == 7);

  assert(parse_fails(""));
  assert(parse_fails("abc"));
  assert(parse_fails("1:2:3:4"));
  assert(parse_fails("1:"));
  assert(parse_fails(":30"));
  assert(parse_fails("1::3"));
  assert(parse_fails("5m"));
  assert(parse_fails("-5"));
  assert(parse_fails("1.5"));
  assert(parse_fails("99999999999999999999"));
  assert(parse_fails("999999:00:00"));

  assert(format_duration(0) == "00:00");
  assert(format_duration(5) == "00:05");
  assert(format_duration(630) == "10:30");
  assert(format_duration(3599) == "59:59");
  assert(format_duration(3600) == "01:00:00");
  assert(format_duration(5400) == "01:30:00");
  assert(format_duration(-3) == "00:00");

  // format(parse(x)) keeps the hour boundary
  assert(format_duration(parse_ok("59:59")) == "59:59");
  assert(format_duration(parse_ok("60:00")) == "01:00:00");

  std::string clock = format_wall_clock(std::chrono::system_clock::now());
  assert(clock.size() == 8);
  assert(clock[2] == ':' && clock[5] == ':');
  assert(!format_date(std::chrono::system_clock::now()).empty());
  return 0;
}
