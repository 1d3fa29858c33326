#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Key/Color/Attr).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <cstdint>

enum class KeyCode {
  Char, Enter, Escape, Backspace, Delete,
  Up, Down, Left, Right,
  Tab, BackTab, PageUp, PageDown, Home, End
};

enum KeyModifiers : std::uint8_t {
  MOD_NONE = 0,
  MOD_SHIFT = 1 << 0,
  MOD_CONTROL = 1 << 1,
  MOD_ALT = 1 << 2,
};

struct Key {
  KeyCode code = KeyCode::Char;
  char32_t ch = 0;            // valid when code == KeyCode::Char
  std::uint8_t mods = MOD_NONE;

  static Key character(char32_t c, std::uint8_t m = MOD_NONE) { return Key{KeyCode::Char, c, m}; }
  static Key of(KeyCode k, std::uint8_t m = MOD_NONE) { return Key{k, 0, m}; }
  bool is(KeyCode k, std::uint8_t m = MOD_NONE) const { return code == k && mods == m; }
  bool is_char(char32_t c, std::uint8_t m = MOD_NONE) const { return code == KeyCode::Char && ch == c && mods == m; }
  bool operator==(const Key& o) const { return code == o.code && ch == o.ch && mods == o.mods; }
};

enum class Color {
  Reset,
  Black, DarkRed, DarkGreen, DarkYellow, DarkBlue, DarkMagenta, DarkCyan, Grey,
  DarkGrey, Red, Green, Yellow, Blue, Magenta, Cyan, White
};

enum class Attr { Bold, Italic, Underline, Reverse };
