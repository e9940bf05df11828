#include "key_reader.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <string>
#include <sys/select.h>
#include <unistd.h>
#include <spdlog/spdlog.h>

RawKeyReader::RawKeyReader() {
  if (::isatty(STDIN_FILENO) == 1) {
    fd_ = STDIN_FILENO;
  } else {
    tty_.reset(::open("/dev/tty", O_RDONLY | O_CLOEXEC));
    if (!tty_.valid()) throw std::runtime_error("keyboard input needs an interactive terminal");
    spdlog::debug("stdin is not a terminal, reading keys from /dev/tty");
    fd_ = tty_.get();
  }
  enter_raw_mode();
}

RawKeyReader::RawKeyReader(int fd) : fd_(fd) {
  enter_raw_mode();
}

void RawKeyReader::enter_raw_mode() {
  if (::tcgetattr(fd_, &saved_) != 0) {
    throw std::runtime_error(std::string("can not read terminal mode: ") + std::strerror(errno));
  }
  struct termios raw = saved_;
  raw.c_lflag &= ~(ICANON | ECHO);
  raw.c_cc[VMIN] = 0;
  raw.c_cc[VTIME] = 0;
  if (::tcsetattr(fd_, TCSADRAIN, &raw) != 0) {
    throw std::runtime_error(std::string("can not switch terminal to raw input: ") + std::strerror(errno));
  }
}

RawKeyReader::~RawKeyReader() {
  if (::tcsetattr(fd_, TCSADRAIN, &saved_) != 0) {
    spdlog::warn("can not restore terminal mode: {}", std::strerror(errno));
  }
}

std::optional<char> RawKeyReader::poll_key() {
  fd_set fds;
  FD_ZERO(&fds);
  FD_SET(fd_, &fds);
  struct timeval tv{0, 0};
  if (::select(fd_ + 1, &fds, nullptr, nullptr, &tv) <= 0) return std::nullopt;
  char c = 0;
  if (::read(fd_, &c, 1) != 1) return std::nullopt;
  return c;
}
