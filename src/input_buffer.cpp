#include "input_buffer.hpp"
#include "utf8.hpp"

static bool is_space(char32_t c) {
  if (c == U' ' || (c >= U'\t' && c <= U'\r')) return true;
  if (c < 0x80) return false;
  return c == 0xA0 || c == 0x1680 || (c >= 0x2000 && c <= 0x200A) ||
         c == 0x2028 || c == 0x2029 || c == 0x202F || c == 0x205F || c == 0x3000;
}

InputBuffer::InputBuffer(std::string_view seed) : text_(utf8_decode(seed)), cursor_(text_.size()) {}

void InputBuffer::set_content(std::string_view s) {
  text_ = utf8_decode(s);
  cursor_ = text_.size();
}

bool InputBuffer::apply(const InputAction& a) {
  switch (a.kind) {
    case InputActionKind::Insert: insert(a.ch); return true;
    case InputActionKind::DeleteLeft: return delete_left();
    case InputActionKind::DeleteRight: return delete_right();
    case InputActionKind::DeleteWordLeft: return delete_word_left();
    case InputActionKind::DeleteWordRight: return delete_word_right();
    case InputActionKind::MoveLeft: move_left(); return false;
    case InputActionKind::MoveRight: move_right(); return false;
    case InputActionKind::MoveWordLeft: move_word_left(); return false;
    case InputActionKind::MoveWordRight: move_word_right(); return false;
    case InputActionKind::MoveToStart: move_to_start(); return false;
    case InputActionKind::MoveToEnd: move_to_end(); return false;
  }
  return false;
}

void InputBuffer::insert(char32_t ch) {
  text_.insert(text_.begin() + static_cast<std::ptrdiff_t>(cursor_), ch);
  cursor_++;
}

bool InputBuffer::delete_left() {
  if (cursor_ == 0) return false;
  text_.erase(cursor_ - 1, 1);
  cursor_--;
  return true;
}

bool InputBuffer::delete_right() {
  if (cursor_ >= text_.size()) return false;
  text_.erase(cursor_, 1);
  return true;
}

size_t InputBuffer::word_left_pos() const {
  size_t p = cursor_;
  while (p > 0 && is_space(text_[p - 1])) p--;
  while (p > 0 && !is_space(text_[p - 1])) p--;
  return p;
}

size_t InputBuffer::word_right_pos() const {
  size_t p = cursor_, n = text_.size();
  while (p < n && !is_space(text_[p])) p++;
  while (p < n && is_space(text_[p])) p++;
  return p;
}

bool InputBuffer::delete_word_left() {
  size_t p = word_left_pos();
  if (p == cursor_) return false;
  text_.erase(p, cursor_ - p);
  cursor_ = p;
  return true;
}

bool InputBuffer::delete_word_right() {
  size_t p = word_right_pos();
  if (p == cursor_) return false;
  text_.erase(cursor_, p - cursor_);
  return true;
}

void InputBuffer::move_left() { if (cursor_ > 0) cursor_--; }
void InputBuffer::move_right() { if (cursor_ < text_.size()) cursor_++; }
void InputBuffer::move_word_left() { cursor_ = word_left_pos(); }
void InputBuffer::move_word_right() { cursor_ = word_right_pos(); }

InputSplit InputBuffer::split() const {
  InputSplit s;
  std::u32string_view v(text_);
  s.before = utf8_encode(v.substr(0, cursor_));
  if (cursor_ < text_.size()) {
    s.at = utf8_encode(v.substr(cursor_, 1));
    s.after = utf8_encode(v.substr(cursor_ + 1));
  } else {
    s.at = " ";
  }
  return s;
}

InputBuffer InputBuffer::masked(char32_t mask) const {
  InputBuffer b;
  b.text_.assign(text_.size(), mask);
  b.cursor_ = cursor_;
  return b;
}

std::string InputBuffer::content() const { return utf8_encode(text_); }
