#include "interrupt.hpp"
#include <csignal>
#include <signal.h>

static volatile std::sig_atomic_t g_interrupted = 0;

static void on_signal(int) { g_interrupted = 1; }

namespace Interrupt {

bool install() {
  struct sigaction sa{};
  sa.sa_handler = on_signal;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;
  if (sigaction(SIGINT, &sa, nullptr) != 0) return false;
  if (sigaction(SIGTERM, &sa, nullptr) != 0) return false;
  return true;
}

bool requested() { return g_interrupted != 0; }

void request() { g_interrupted = 1; }

void clear() { g_interrupted = 0; }

}
