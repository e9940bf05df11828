#include "clock_engine.hpp"
#include "countdown.hpp"
#include "stopwatch.hpp"
#include "time_format.hpp"
#include <cassert>
#include <cmath>
#include <vector>

using namespace std::chrono;

static bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

static void test_stopwatch_pause_excludes_paused_time() {
  Timestamp t0 = system_clock::now();
  Stopwatch sw(t0);
  assert(sw.tick(std::nullopt, t0).text == "00:00");
  assert(sw.tick(std::nullopt, t0 + seconds(2)).text == "00:02");
  sw.tick('q', t0 + seconds(2));
  assert(sw.paused());
  assert(sw.tick(std::nullopt, t0 + seconds(5)).text == "00:02");
  sw.tick('q', t0 + seconds(5));
  assert(!sw.paused());
  assert(sw.tick(std::nullopt, t0 + seconds(6)).text == "00:03");
  assert(sw.elapsed() == 3);
  // sub-second remainder is floored
  assert(sw.tick(std::nullopt, t0 + milliseconds(6900)).text == "00:03");
}

static void test_stopwatch_reset() {
  Timestamp t0 = system_clock::now();
  Stopwatch sw(t0);
  sw.tick(std::nullopt, t0 + seconds(10));
  sw.tick('q', t0 + seconds(10));
  assert(sw.paused());
  assert(sw.tick('r', t0 + seconds(12)).text == "00:00");
  assert(!sw.paused());
  assert(sw.tick(std::nullopt, t0 + seconds(15)).text == "00:03");
  assert(sw.tick(std::nullopt, t0 + seconds(3600 + 12)).text == "01:00:00");
  assert(sw.label() == "▶ Running (q: pause, r: reset)");
  assert(sw.focus_status().empty());
  sw.tick('q', t0 + seconds(3600 + 12));
  assert(sw.label() == "⏸ Paused (q: resume, r: reset)");
  assert(sw.focus_status() == "⏸ Paused");
  // other keys are ignored
  assert(sw.tick('x', t0 + seconds(4000)).text == "01:00:00");
  assert(sw.paused());
}

static void test_countdown_sequence() {
  Countdown cd(5, "Countdown Timer", Color::Yellow);
  Timestamp t = system_clock::now();
  assert(near(*cd.progress(), 0.0));
  std::vector<std::string> shown;
  std::vector<double> progress;
  bool done = false;
  for (int i = 0; i < 6; ++i) {
    assert(!done);
    TickResult r = cd.tick(std::nullopt, t);
    shown.push_back(r.text);
    progress.push_back(*cd.progress());
    done = r.done;
  }
  assert(done);
  assert((shown == std::vector<std::string>{"00:05", "00:04", "00:03", "00:02", "00:01", "00:00"}));
  const double expect[] = {0.0, 0.2, 0.4, 0.6, 0.8, 1.0};
  for (int i = 0; i < 6; ++i) assert(near(progress[i], expect[i]));
  assert(cd.label() == "▶ Countdown Timer");
}

static void test_countdown_zero() {
  Countdown cd(0, "Countdown Timer", Color::Yellow);
  assert(near(*cd.progress(), 1.0));
  TickResult r = cd.tick(std::nullopt, system_clock::now());
  assert(r.done);
  assert(r.text == "00:00");
  assert(near(*cd.progress(), 1.0));
}

static void test_countdown_pause_holds_value() {
  Countdown cd(3, "Countdown Timer", Color::Yellow);
  Timestamp t = system_clock::now();
  assert(cd.tick(std::nullopt, t).text == "00:03");
  assert(cd.tick('q', t).text == "00:02");
  assert(cd.paused());
  assert(cd.label() == "⏸ Paused - Countdown Timer");
  assert(cd.focus_status() == "⏸ Paused");
  // frozen, however much wall time passes
  assert(cd.tick(std::nullopt, t + seconds(30)).text == "00:02");
  assert(cd.tick(std::nullopt, t + seconds(60)).text == "00:02");
  // resuming shows the frozen value again, then keeps stepping once per tick
  TickResult r = cd.tick('q', t + seconds(61));
  assert(r.text == "00:02" && !r.done);
  assert(cd.tick(std::nullopt, t + seconds(62)).text == "00:01");
  r = cd.tick(std::nullopt, t + seconds(63));
  assert(r.text == "00:00" && r.done);
  // pausing at zero keeps the countdown alive
  Countdown hold(1, "x", Color::Yellow);
  hold.tick(std::nullopt, t);
  r = hold.tick('q', t);
  assert(r.text == "00:00" && !r.done);
}

static void test_clock() {
  ClockEngine clock;
  Timestamp t = system_clock::now();
  TickResult r = clock.tick('q', t);
  assert(!r.done);
  assert(r.text == format_wall_clock(t));
  assert(r.text.size() == 8);
  assert(clock.label() == format_date(t));
  assert(!clock.progress());
  assert(clock.layout(true) == Layout::TimeOnly);
  assert(clock.layout(false) == Layout::WithLabel);
  assert(clock.cadence() == seconds(1));
}

int main() {
  test_stopwatch_pause_excludes_paused_time();
  test_stopwatch_reset();
  test_countdown_sequence();
  test_countdown_zero();
  test_countdown_pause_holds_value();
  test_clock();
  return 0;
}
