#pragma once
/*
 * Terminfo
 *
 * Purpose: capability strings for the inline prompt, looked up through ncurses terminfo.
 * Note: fields are named after terminfo capnames; defaults are ANSI/xterm sequences,
 *       kept when setupterm() finds no usable entry.
 * Constraint: only terminfo.cpp includes <term.h> (its cap macros clash with common names).
 */
#include <string>
#include <utility>
#include <vector>
#include "types.hpp"

struct TerminfoCaps {
  std::string cuu1 = "\x1b[A";
  std::string cr = "\r";
  std::string el = "\x1b[K";
  std::string civis = "\x1b[?25l";
  std::string cnorm = "\x1b[?25h";
  std::string bold = "\x1b[1m";
  std::string sitm = "\x1b[3m";
  std::string smul = "\x1b[4m";
  std::string rev = "\x1b[7m";
  std::string sgr0 = "\x1b[0m";
  std::string smkx;
  std::string rmkx;
  std::string setaf;    // parameterized; empty → ANSI SGR
  std::string setab;
  int colors = 8;
  int cols = 80;
  std::vector<std::pair<std::string, Key>> keys;  // key sequence → key
};

/* setupterm() on fd; false (msg set) keeps the ANSI defaults */
bool load_terminfo(int fd, TerminfoCaps& caps, std::string& msg);

/* free the entry set up by a successful load_terminfo(); no-op otherwise */
void release_terminfo();

/* expand a one-parameter capability (setaf/setab) */
std::string terminfo_param(const std::string& cap, int value);
