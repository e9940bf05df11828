#pragma once
/*
 * Logging
 *
 * Purpose: set up the process-wide spdlog logger ("tclock", stderr, colour).
 * Note: warn by default so frames on stdout stay clean; --verbose enables debug.
 */

void init_logging();
void set_verbose(bool verbose);
