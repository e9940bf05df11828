#pragma once
/*
 * Session
 *
 * Purpose: the tick loop. Per tick: poll one key, tick the engine, move the cursor
 *          up over the previous frame, redraw, sleep to the next deadline.
 * Stop: engine done (completed) or interrupt flag set (interrupted, not an error).
 * Note: the only suspension point is the cadence sleep; key polling never blocks.
 */
#include "config.hpp"
#include "isurface.hpp"
#include "key_reader.hpp"
#include "renderer.hpp"
#include "time_source.hpp"
#include "timer_engine.hpp"

enum class SessionEnd { Completed, Interrupted };

class Session {
public:
  Session(ISurface& surface, IKeySource& keys, ITimeSource& time, const DisplayConfig& cfg);
  SessionEnd run(ITimerEngine& engine);

private:
  FrameInfo snapshot(const ITimerEngine& engine, const TickResult& r) const;
  SessionEnd interrupted();

  ISurface& surface_;
  IKeySource& keys_;
  ITimeSource& time_;
  const DisplayConfig& cfg_;
  Renderer renderer_;
};
