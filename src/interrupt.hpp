#pragma once
/*
 * Interrupt
 *
 * Purpose: translate SIGINT/SIGTERM into a flag the tick loop checks at its boundary.
 * Note: handlers are installed without SA_RESTART so a pending sleep wakes up early.
 */

namespace Interrupt {
  // Installs SIGINT and SIGTERM handlers; returns false if sigaction fails.
  bool install();
  bool requested();
  // Signal-safe; also used by tests to simulate Ctrl+C.
  void request();
  void clear();
}
