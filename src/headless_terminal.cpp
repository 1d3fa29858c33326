#include "headless_terminal.hpp"
#include "utf8.hpp"
#include <algorithm>

void HeadlessTerminal::push_text(const std::string& utf8) {
  for (char32_t c : utf8_decode(utf8)) keys_.push_back(Key::character(c));
}

void HeadlessTerminal::push_backspaces(size_t n) {
  for (size_t i = 0; i < n; ++i) keys_.push_back(Key::of(KeyCode::Backspace));
}

std::optional<Key> HeadlessTerminal::read_key() {
  if (keys_.empty()) return std::nullopt;
  Key k = keys_.front();
  keys_.pop_front();
  return k;
}

void HeadlessTerminal::write(const std::string& text) {
  if (fail_writes_) throw TerminalError("headless: write failed");
  transcript_ += text;
  for (char c : text) {
    if (c == '\n') {
      ++row_;
      col_ = 0;
      if (row_ == lines_.size()) lines_.emplace_back();
      continue;
    }
    std::string& line = lines_[row_];
    if (col_ < line.size()) line[col_] = c;
    else line.push_back(c);
    ++col_;
  }
}

void HeadlessTerminal::cursor_up() {
  if (row_ > 0) --row_;
}

void HeadlessTerminal::clear_current_line() {
  lines_[row_].erase(std::min(col_, lines_[row_].size()));
}

std::vector<std::string> HeadlessTerminal::screen() const {
  std::vector<std::string> out = lines_;
  while (!out.empty() && out.back().empty()) out.pop_back();
  return out;
}
