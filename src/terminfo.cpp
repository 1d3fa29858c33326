#include "terminfo.hpp"
#define NCURSES_NOMACROS
#include <curses.h>
#include <term.h>

static std::string string_cap(const char* name) {
  const char* s = tigetstr(name);
  if (s == nullptr || s == reinterpret_cast<const char*>(-1)) return std::string();
  return std::string(s);
}

static void override_cap(std::string& field, const char* name) {
  std::string s = string_cap(name);
  if (!s.empty()) field = s;
}

bool load_terminfo(int fd, TerminfoCaps& caps, std::string& msg) {
  int err = 0;
  if (setupterm(nullptr, fd, &err) != OK) {
    msg = err == 0 ? "terminfo: terminal type not found, using ANSI sequences"
                   : "terminfo: database unavailable, using ANSI sequences";
    return false;
  }
  override_cap(caps.cuu1, "cuu1");
  override_cap(caps.cr, "cr");
  override_cap(caps.el, "el");
  override_cap(caps.civis, "civis");
  override_cap(caps.cnorm, "cnorm");
  override_cap(caps.bold, "bold");
  override_cap(caps.sitm, "sitm");
  override_cap(caps.smul, "smul");
  override_cap(caps.rev, "rev");
  override_cap(caps.sgr0, "sgr0");
  caps.smkx = string_cap("smkx");
  caps.rmkx = string_cap("rmkx");
  caps.setaf = string_cap("setaf");
  caps.setab = string_cap("setab");
  int n = tigetnum("colors");
  if (n > 0) caps.colors = n;
  int c = tigetnum("cols");
  if (c > 0) caps.cols = c;

  static const std::pair<const char*, Key> key_caps[] = {
    {"kcuu1", Key::of(KeyCode::Up)}, {"kcud1", Key::of(KeyCode::Down)},
    {"kcub1", Key::of(KeyCode::Left)}, {"kcuf1", Key::of(KeyCode::Right)},
    {"khome", Key::of(KeyCode::Home)}, {"kend", Key::of(KeyCode::End)},
    {"kpp", Key::of(KeyCode::PageUp)}, {"knp", Key::of(KeyCode::PageDown)},
    {"kdch1", Key::of(KeyCode::Delete)}, {"kcbt", Key::of(KeyCode::BackTab)},
    {"kLFT5", Key::of(KeyCode::Left, MOD_CONTROL)}, {"kRIT5", Key::of(KeyCode::Right, MOD_CONTROL)},
    {"kDC5", Key::of(KeyCode::Delete, MOD_CONTROL)},
  };
  caps.keys.clear();
  for (const auto& [name, key] : key_caps) {
    std::string seq = string_cap(name);
    if (!seq.empty()) caps.keys.emplace_back(seq, key);
  }
  msg = std::string("terminfo: loaded ") + (termname() ? termname() : "?");
  return true;
}

void release_terminfo() {
  if (cur_term != nullptr) del_curterm(cur_term);
}

std::string terminfo_param(const std::string& cap, int value) {
  if (cap.empty()) return std::string();
  const char* s = tiparm(cap.c_str(), value);
  return s ? std::string(s) : std::string();
}
