#include "key_reader.hpp"
#include "posix_fd.hpp"
#include <cassert>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <optional>
#include <stdexcept>
#include <termios.h>
#include <unistd.h>

struct Pty {
  UniqueFd master;
  UniqueFd slave;
};

static bool open_pty(Pty& p) {
  p.master.reset(::posix_openpt(O_RDWR | O_NOCTTY));
  if (!p.master.valid()) return false;
  if (::grantpt(p.master.get()) != 0 || ::unlockpt(p.master.get()) != 0) return false;
  const char* name = ::ptsname(p.master.get());
  if (name == nullptr) return false;
  p.slave.reset(::open(name, O_RDWR | O_NOCTTY));
  return p.slave.valid();
}

static struct termios mode_of(int fd) {
  struct termios t{};
  int rc = ::tcgetattr(fd, &t);
  assert(rc == 0);
  return t;
}

static bool same_mode(const struct termios& a, const struct termios& b) {
  return a.c_iflag == b.c_iflag && a.c_oflag == b.c_oflag && a.c_cflag == b.c_cflag &&
         a.c_lflag == b.c_lflag && std::memcmp(a.c_cc, b.c_cc, sizeof(a.c_cc)) == 0;
}

static std::optional<char> wait_key(RawKeyReader& r) {
  for (int i = 0; i < 500; ++i) {
    if (auto k = r.poll_key()) return k;
    ::usleep(1000);
  }
  return std::nullopt;
}

static void test_raw_mode_and_poll(const Pty& p) {
  struct termios before = mode_of(p.slave.get());
  assert(before.c_lflag & ICANON);
  assert(before.c_lflag & ECHO);
  {
    RawKeyReader r(p.slave.get());
    struct termios during = mode_of(p.slave.get());
    assert(!(during.c_lflag & ICANON));
    assert(!(during.c_lflag & ECHO));
    assert(during.c_lflag & ISIG); // Ctrl+C still reaches the process
    assert(during.c_cc[VMIN] == 0 && during.c_cc[VTIME] == 0);

    auto t0 = std::chrono::steady_clock::now();
    assert(!r.poll_key());
    assert(std::chrono::steady_clock::now() - t0 < std::chrono::milliseconds(100));

    char q = 'q';
    ssize_t n = ::write(p.master.get(), &q, 1);
    assert(n == 1);
    std::optional<char> got = wait_key(r);
    assert(got && *got == 'q');
    assert(!r.poll_key());
  }
  assert(same_mode(before, mode_of(p.slave.get())));
}

static void test_restores_exact_prior_mode(const Pty& p) {
  struct termios custom = mode_of(p.slave.get());
  struct termios original = custom;
  custom.c_lflag &= ~ECHO;
  custom.c_cc[VMIN] = 1;
  custom.c_cc[VTIME] = 5;
  int rc = ::tcsetattr(p.slave.get(), TCSANOW, &custom);
  assert(rc == 0);
  struct termios before = mode_of(p.slave.get());
  {
    RawKeyReader r(p.slave.get());
    assert(!(mode_of(p.slave.get()).c_lflag & ICANON));
  }
  assert(same_mode(before, mode_of(p.slave.get())));
  rc = ::tcsetattr(p.slave.get(), TCSANOW, &original);
  assert(rc == 0);
}

static void test_restores_when_unwinding(const Pty& p) {
  struct termios before = mode_of(p.slave.get());
  bool caught = false;
  try {
    RawKeyReader r(p.slave.get());
    throw std::runtime_error("session failed");
  } catch (const std::runtime_error&) {
    caught = true;
  }
  assert(caught);
  assert(same_mode(before, mode_of(p.slave.get())));
}

static void test_rejects_non_terminal() {
  int fds[2];
  int rc = ::pipe(fds);
  assert(rc == 0);
  UniqueFd rd(fds[0]), wr(fds[1]);
  bool threw = false;
  try {
    RawKeyReader r(rd.get());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

int main() {
  test_rejects_non_terminal();
  Pty p;
  if (!open_pty(p)) {
    std::fprintf(stderr, "no pseudo-terminal available, skipping terminal mode checks\n");
    return 0;
  }
  test_raw_mode_and_poll(p);
  test_restores_exact_prior_mode(p);
  test_restores_when_unwinding(p);
  return 0;
}
