#include "app.hpp"
#include "cli.hpp"
#include "interrupt.hpp"
#include "logging.hpp"
#include "terminfo_surface.hpp"
#include <clocale>
#include <cstdio>
#include <exception>
#include <string>
#include <spdlog/spdlog.h>

int main(int argc, char** argv) {
  // character widths (wcwidth) follow the user's locale
  std::setlocale(LC_CTYPE, "");
  init_logging();
  Options opts;
  std::string msg;
  if (!parse_args(argc, argv, opts, msg)) {
    spdlog::error(msg);
    std::fprintf(stderr, "Try '%s --help' for usage.\n", argv[0]);
    return 1;
  }
  if (opts.show_help) {
    std::fputs(usage_text(argv[0]).c_str(), stdout);
    return 0;
  }
  set_verbose(opts.verbose);
  if (!Interrupt::install()) spdlog::warn("can not install interrupt handler");
  try {
    TerminfoSurface surface;
    SystemTimeSource time;
    if (run_mode(opts, surface, time) == SessionEnd::Interrupted) spdlog::debug("exit on interrupt");
  } catch (const std::exception& e) {
    spdlog::error("Unexpected error: {}", e.what());
    return 1;
  }
  return 0;
}
