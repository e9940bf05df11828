#include "app.hpp"
#include "clock_engine.hpp"
#include "countdown.hpp"
#include "key_reader.hpp"
#include "pomodoro.hpp"
#include "stopwatch.hpp"
#include <memory>
#include <spdlog/spdlog.h>

SessionEnd run_mode(const Options& opts, ISurface& surface, ITimeSource& time) {
  if (opts.mode == Mode::Clock) {
    spdlog::debug("clock mode");
    NullKeySource keys;
    ClockEngine engine;
    return Session(surface, keys, time, opts.display).run(engine);
  }

  std::unique_ptr<ITimerEngine> engine;
  switch (opts.mode) {
    case Mode::Stopwatch:
      spdlog::debug("stopwatch mode");
      engine = std::make_unique<Stopwatch>(time.now());
      break;
    case Mode::Countdown:
      spdlog::debug("countdown mode, {}s", opts.timer_seconds);
      engine = std::make_unique<Countdown>(opts.timer_seconds, "Countdown Timer", Color::Yellow);
      break;
    case Mode::Pomodoro:
      spdlog::debug("pomodoro mode, work {}min break {}min", opts.work_minutes, opts.break_minutes);
      engine = std::make_unique<Pomodoro>(opts.work_minutes * 60, opts.break_minutes * 60);
      break;
    case Mode::Clock:
      break;
  }
  RawKeyReader keys;
  return Session(surface, keys, time, opts.display).run(*engine);
}
