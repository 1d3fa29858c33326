#pragma once
/*
 * InputBuffer
 *
 * Purpose: single-line editable text with a cursor, for every prompt's input field.
 * Invariant: content is Unicode scalars; 0 <= cursor <= length() after every call.
 * Note: edge conditions (delete at bounds, moving past an end) are no-ops.
 */
#include <string>
#include <string_view>
#include "input.hpp"

struct InputSplit {
  std::string before;
  std::string at;     // single scalar under the cursor, " " at end of content
  std::string after;
};

class InputBuffer {
public:
  InputBuffer() = default;
  explicit InputBuffer(std::string_view seed);

  /* returns true when content changed (cursor-only moves return false) */
  bool apply(const InputAction& a);

  void insert(char32_t ch);
  bool delete_left();
  bool delete_right();
  bool delete_word_left();
  bool delete_word_right();
  void move_left();
  void move_right();
  void move_word_left();
  void move_word_right();
  void move_to_start() { cursor_ = 0; }
  void move_to_end() { cursor_ = text_.size(); }

  InputSplit split() const;
  InputBuffer masked(char32_t mask) const;

  std::string content() const;
  size_t length() const { return text_.size(); }
  size_t cursor() const { return cursor_; }
  bool is_empty() const { return text_.empty(); }
  void clear() { text_.clear(); cursor_ = 0; }
  void set_content(std::string_view s);

private:
  size_t word_left_pos() const;
  size_t word_right_pos() const;

  std::u32string text_;
  size_t cursor_ = 0;
};
