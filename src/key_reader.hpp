#pragma once
/*
 * KeyReader
 *
 * Purpose: RAII wrapper around termios cbreak/noecho mode plus a non-blocking key poll.
 * Usage: construct before the tick loop; destructor restores the saved terminal mode
 *        on every exit path (return, exception, interrupt).
 * Note: ISIG stays enabled so Ctrl+C still raises SIGINT.
 */
#include <optional>
#include <termios.h>
#include "posix_fd.hpp"

class IKeySource {
public:
  virtual ~IKeySource() = default;
  // Returns immediately; a key only if one is already buffered.
  virtual std::optional<char> poll_key() = 0;
};

/*for modes that take no keyboard input*/
class NullKeySource : public IKeySource {
public:
  std::optional<char> poll_key() override { return std::nullopt; }
};

class RawKeyReader : public IKeySource {
public:
  RawKeyReader();
  // Reads from an already open terminal; the caller keeps ownership of fd.
  explicit RawKeyReader(int fd);
  ~RawKeyReader() override;
  RawKeyReader(const RawKeyReader&) = delete;
  RawKeyReader& operator=(const RawKeyReader&) = delete;

  std::optional<char> poll_key() override;

private:
  void enter_raw_mode();

  UniqueFd tty_; // only set when stdin is not a terminal
  int fd_ = -1;
  struct termios saved_{};
};
