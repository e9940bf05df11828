#pragma once
/*
 * App
 *
 * Purpose: build the engine and key source for the selected mode and run one Session.
 * Note: options arrive validated; an interrupted session still counts as success.
 */
#include "cli.hpp"
#include "isurface.hpp"
#include "session.hpp"
#include "time_source.hpp"

SessionEnd run_mode(const Options& opts, ISurface& surface, ITimeSource& time);
