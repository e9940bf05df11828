#pragma once
/*
 * Config
 *
 * Purpose: compile-time defaults and the per-run DisplayConfig.
 * Note: override any TCLOCK_* knob with -D at build time.
 */

#ifndef TCLOCK_FALLBACK_COLS
#define TCLOCK_FALLBACK_COLS 80
#endif

/*pause between pomodoro phases, milliseconds*/
#ifndef TCLOCK_PHASE_HOLD_MS
#define TCLOCK_PHASE_HOLD_MS 2000
#endif

/*progress bar geometry*/
#ifndef TCLOCK_BAR_MIN
#define TCLOCK_BAR_MIN 20
#endif
#ifndef TCLOCK_BAR_MAX
#define TCLOCK_BAR_MAX 100
#endif
#ifndef TCLOCK_BAR_MARGIN
#define TCLOCK_BAR_MARGIN 20
#endif

enum class ColorOverride { None, White, Black };

struct DisplayConfig {
  bool focus = false;
  bool bold = false;
  ColorOverride color_override = ColorOverride::None;
  bool bell_enabled = true;
};
