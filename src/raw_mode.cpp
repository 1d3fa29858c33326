#include "raw_mode.hpp"
#include "iterminal.hpp"
#include <cerrno>
#include <cstring>

RawMode::RawMode(int fd) : fd_(fd) {
  if (tcgetattr(fd_, &saved_) != 0)
    throw TerminalError(std::string("tcgetattr: ") + std::strerror(errno));
  struct termios raw = saved_;
  raw.c_iflag &= ~(IXON | ICRNL | INLCR | IGNCR);
  raw.c_lflag &= ~(ICANON | ECHO | ISIG | IEXTEN);
  raw.c_cc[VMIN] = 1;
  raw.c_cc[VTIME] = 0;
  if (tcsetattr(fd_, TCSAFLUSH, &raw) != 0)
    throw TerminalError(std::string("tcsetattr: ") + std::strerror(errno));
}

RawMode::~RawMode() {
  tcsetattr(fd_, TCSAFLUSH, &saved_);
}
