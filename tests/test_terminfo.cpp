#include "terminfo.hpp"
#include <cassert>
#include <cstdlib>
#include <string>

int main() {
  assert(terminfo_param("", 3).empty());
  assert(terminfo_param("\x1b[3%p1%dm", 4) == "\x1b[34m");

  // unknown terminal type keeps the ANSI fallbacks
  setenv("TERM", "mprompt-no-such-terminal", 1);
  TerminfoCaps caps;
  std::string msg;
  assert(!load_terminfo(1, caps, msg));
  assert(!msg.empty());
  assert(caps.cuu1 == "\x1b[A");
  assert(caps.el == "\x1b[K");
  assert(caps.civis == "\x1b[?25l");
  assert(caps.setaf.empty());
  assert(caps.keys.empty());
  // nothing loaded, nothing to free
  release_terminfo();

  // a loaded entry can be freed and loaded again
  setenv("TERM", "xterm", 1);
  TerminfoCaps xterm;
  if (load_terminfo(1, xterm, msg)) {
    release_terminfo();
    release_terminfo();
    TerminfoCaps again;
    assert(load_terminfo(1, again, msg));
    assert(again.cuu1 == xterm.cuu1);
    release_terminfo();
  }
  return 0;
}
