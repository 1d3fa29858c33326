#include "terminfo_terminal.hpp"
#include "config.hpp"
#include "debug_log.hpp"
#include "utf8.hpp"
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

TerminfoTerminal::TerminfoTerminal() {
  tty_ = UniqueFd::open_path("/dev/tty", O_RDWR | O_NOCTTY);
  if (tty_.valid()) {
    in_fd_ = out_fd_ = tty_.get();
  } else {
    in_fd_ = STDIN_FILENO;
    out_fd_ = STDOUT_FILENO;
    if (!isatty(in_fd_)) throw TerminalError("no controlling terminal and stdin is not a tty");
  }
  raw_ = std::make_unique<RawMode>(in_fd_);
  std::string msg;
  terminfo_loaded_ = load_terminfo(out_fd_, caps_, msg);
  debug_log(msg);
  if (!caps_.smkx.empty()) {
    out_ += caps_.smkx;
    flush();
  }
}

TerminfoTerminal::~TerminfoTerminal() {
  std::string tail = caps_.rmkx + caps_.sgr0;
  out_ += tail;
  try {
    flush();
  } catch (const TerminalError& e) {
    debug_log(std::string("terminal: restore failed: ") + e.what());
  }
  if (terminfo_loaded_) release_terminfo();
}

int TerminfoTerminal::read_byte(int timeout_ms) {
  if (timeout_ms >= 0) {
    struct pollfd p{in_fd_, POLLIN, 0};
    int r;
    do { r = ::poll(&p, 1, timeout_ms); } while (r < 0 && errno == EINTR);
    if (r < 0) throw TerminalError(std::string("poll: ") + std::strerror(errno));
    if (r == 0) return kTimeout;
  }
  unsigned char b = 0;
  ssize_t n;
  do { n = ::read(in_fd_, &b, 1); } while (n < 0 && errno == EINTR);
  if (n < 0) throw TerminalError(std::string("read: ") + std::strerror(errno));
  if (n == 0) return kEof;
  return b;
}

Key TerminfoTerminal::decode_utf8(unsigned char lead, std::uint8_t mods) {
  int len = utf8_sequence_length(lead);
  std::string bytes(1, static_cast<char>(lead));
  for (int i = 1; i < len; ++i) {
    int b = read_byte(MP_ESC_DELAY_MS);
    if (b < 0) break;
    bytes.push_back(static_cast<char>(b));
  }
  std::u32string cps = utf8_decode(bytes);
  return Key::character(cps.empty() ? U'\uFFFD' : cps[0], mods);
}

static std::uint8_t xterm_modifiers(int param) {
  // xterm encodes 1 + (shift | alt<<1 | ctrl<<2)
  if (param < 2) return MOD_NONE;
  int bits = param - 1;
  std::uint8_t m = MOD_NONE;
  if (bits & 1) m = static_cast<std::uint8_t>(m | MOD_SHIFT);
  if (bits & 2) m = static_cast<std::uint8_t>(m | MOD_ALT);
  if (bits & 4) m = static_cast<std::uint8_t>(m | MOD_CONTROL);
  return m;
}

std::optional<Key> TerminfoTerminal::decode_sequence(const std::string& seq) const {
  for (const auto& [s, k] : caps_.keys) {
    if (s == seq) return k;
  }
  if (seq.size() < 3) return std::nullopt;
  char intro = seq[1];
  char last = seq.back();
  if (intro == 'O') {
    switch (last) {
      case 'A': return Key::of(KeyCode::Up);
      case 'B': return Key::of(KeyCode::Down);
      case 'C': return Key::of(KeyCode::Right);
      case 'D': return Key::of(KeyCode::Left);
      case 'H': return Key::of(KeyCode::Home);
      case 'F': return Key::of(KeyCode::End);
      default: return std::nullopt;
    }
  }
  // CSI: ESC [ p1 ; p2 final
  int params[2] = {0, 0};
  int count = 0;
  for (size_t i = 2; i + 1 < seq.size(); ++i) {
    char c = seq[i];
    if (c >= '0' && c <= '9') {
      if (count == 0) count = 1;
      params[count - 1] = params[count - 1] * 10 + (c - '0');
    } else if (c == ';') {
      if (count == 0) count = 1;
      if (count == 2) return std::nullopt;
      ++count;
    } else {
      return std::nullopt;
    }
  }
  std::uint8_t mods = xterm_modifiers(count == 2 ? params[1] : 0);
  switch (last) {
    case 'A': return Key::of(KeyCode::Up, mods);
    case 'B': return Key::of(KeyCode::Down, mods);
    case 'C': return Key::of(KeyCode::Right, mods);
    case 'D': return Key::of(KeyCode::Left, mods);
    case 'H': return Key::of(KeyCode::Home, mods);
    case 'F': return Key::of(KeyCode::End, mods);
    case 'Z': return Key::of(KeyCode::BackTab);
    case '~':
      switch (params[0]) {
        case 1: case 7: return Key::of(KeyCode::Home, mods);
        case 3: return Key::of(KeyCode::Delete, mods);
        case 4: case 8: return Key::of(KeyCode::End, mods);
        case 5: return Key::of(KeyCode::PageUp, mods);
        case 6: return Key::of(KeyCode::PageDown, mods);
        default: return std::nullopt;
      }
    default: return std::nullopt;
  }
}

std::optional<Key> TerminfoTerminal::decode_escape() {
  int b = read_byte(MP_ESC_DELAY_MS);
  if (b < 0) return Key::of(KeyCode::Escape);
  if (b == '[' || b == 'O') {
    std::string seq = "\x1b";
    seq.push_back(static_cast<char>(b));
    while (seq.size() < 16) {
      int c = read_byte(MP_ESC_DELAY_MS);
      if (c < 0) break;
      seq.push_back(static_cast<char>(c));
      if (c >= 0x40 && c <= 0x7e) break;
    }
    std::optional<Key> k = decode_sequence(seq);
    if (!k) debug_log("terminal: unrecognized escape sequence");
    return k;
  }
  if (b == 0x1b) return Key::of(KeyCode::Escape);
  if (b == 0x7f || b == 0x08) return Key::of(KeyCode::Backspace, MOD_ALT);
  if (b == '\r' || b == '\n') return Key::of(KeyCode::Enter, MOD_ALT);
  if (b >= 0x01 && b <= 0x1a && b != '\t') return Key::character(U'a' + (b - 1), static_cast<std::uint8_t>(MOD_ALT | MOD_CONTROL));
  if (b < 0x80) return Key::character(static_cast<char32_t>(b), MOD_ALT);
  return decode_utf8(static_cast<unsigned char>(b), MOD_ALT);
}

std::optional<Key> TerminfoTerminal::read_key() {
  while (true) {
    int b = read_byte(-1);
    if (b == kEof) return std::nullopt;
    if (b == 0x1b) {
      if (std::optional<Key> k = decode_escape()) return k;
      continue;
    }
    if (b == '\r' || b == '\n') return Key::of(KeyCode::Enter);
    if (b == '\t') return Key::of(KeyCode::Tab);
    if (b == 0x7f || b == 0x08) return Key::of(KeyCode::Backspace);
    if (b == 0) continue;
    if (b < 0x20) {
      if (b <= 0x1a) return Key::character(U'a' + (b - 1), MOD_CONTROL);
      continue;
    }
    if (b < 0x80) return Key::character(static_cast<char32_t>(b));
    if (utf8_sequence_length(static_cast<unsigned char>(b)) == 0) continue;
    return decode_utf8(static_cast<unsigned char>(b), MOD_NONE);
  }
}

void TerminfoTerminal::write(const std::string& text) { out_ += text; }

std::string TerminfoTerminal::color_sequence(Color c, bool foreground) const {
  if (c == Color::Reset) return foreground ? "\x1b[39m" : "\x1b[49m";
  int idx = static_cast<int>(c) - static_cast<int>(Color::Black);
  if (idx >= 8 && caps_.colors < 16) idx -= 8;
  const std::string& cap = foreground ? caps_.setaf : caps_.setab;
  std::string seq = terminfo_param(cap, idx);
  if (!seq.empty()) return seq;
  int base = foreground ? (idx < 8 ? 30 : 90) : (idx < 8 ? 40 : 100);
  return "\x1b[" + std::to_string(base + idx % 8) + "m";
}

void TerminfoTerminal::set_fg(Color c) { out_ += color_sequence(c, true); }
void TerminfoTerminal::set_bg(Color c) { out_ += color_sequence(c, false); }

void TerminfoTerminal::set_attr(Attr a) {
  switch (a) {
    case Attr::Bold: out_ += caps_.bold; break;
    case Attr::Italic: out_ += caps_.sitm; break;
    case Attr::Underline: out_ += caps_.smul; break;
    case Attr::Reverse: out_ += caps_.rev; break;
  }
}

void TerminfoTerminal::reset_attrs() { out_ += caps_.sgr0; }
void TerminfoTerminal::cursor_up() { out_ += caps_.cuu1; }
void TerminfoTerminal::cursor_horizontal_reset() { out_ += caps_.cr; }
void TerminfoTerminal::clear_current_line() { out_ += caps_.el; }
void TerminfoTerminal::cursor_hide() { out_ += caps_.civis; }

void TerminfoTerminal::cursor_show() noexcept {
  out_ += caps_.cnorm;
  const char* p = out_.data();
  size_t left = out_.size();
  while (left > 0) {
    ssize_t n = ::write(out_fd_, p, left);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) break;
    p += n;
    left -= static_cast<size_t>(n);
  }
  out_.clear();
}

void TerminfoTerminal::write_all(const std::string& bytes) {
  const char* p = bytes.data();
  size_t left = bytes.size();
  while (left > 0) {
    ssize_t n = ::write(out_fd_, p, left);
    if (n < 0 && errno == EINTR) continue;
    if (n < 0) throw TerminalError(std::string("write: ") + std::strerror(errno));
    p += n;
    left -= static_cast<size_t>(n);
  }
}

void TerminfoTerminal::flush() {
  if (out_.empty()) return;
  std::string pending;
  pending.swap(out_);
  write_all(pending);
}

int TerminfoTerminal::width() const {
  struct winsize ws{};
  if (ioctl(out_fd_, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) return ws.ws_col;
  return caps_.cols;
}
