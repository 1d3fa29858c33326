#pragma once
/*
 * RawMode
 *
 * Purpose: RAII guard putting a tty into non-canonical, no-echo mode.
 * Usage: held by the terminal backend for the lifetime of one prompt.
 * Note: ISIG is off so Ctrl-C arrives as a key; OPOST stays on so "\n" still returns the carriage.
 */
#include <termios.h>

class RawMode {
public:
  /* throws TerminalError when fd is not a terminal */
  explicit RawMode(int fd);
  ~RawMode();
  RawMode(const RawMode&) = delete;
  RawMode& operator=(const RawMode&) = delete;
private:
  int fd_;
  struct termios saved_;
};
